#include "py_decl.hpp"
#include <cancor_core/loss/cross_covariance.hpp>

namespace cc = cancor_core;

template <class T>
void cross_covariance_loss(py::module_& m, const char* name)
{
    using loss_t = cc::loss::CrossCovarianceLoss<T>;
    py::class_<loss_t>(m, name)
        .def_readonly("objective", &loss_t::objective)
        .def_readonly("invariance", &loss_t::invariance)
        .def_readonly("covariance", &loss_t::covariance)
        ;
}

void register_loss(py::module_& m)
{
    cross_covariance_loss<double>(m, "CrossCovarianceLoss64");
    cross_covariance_loss<float>(m, "CrossCovarianceLoss32");

    m.def("cross_covariance_loss", &cc::loss::cross_covariance_loss<double>,
        py::arg("z1"), py::arg("z2"), R"delimiter(
    Redundancy-reduction loss between two embeddings.

    Both embeddings are batch-normalized column by column and
    :math:`C = z_1^\top z_2 / n`.
    The invariance term is :math:`\sum_k (1 - C_{kk})^2`
    and the covariance term is :math:`\sum_{k \neq l} C_{kl}^2`.

    Parameters
    ----------
    z1 : (n, d) ndarray
        Embeddings of the first view.
    z2 : (n, d) ndarray
        Embeddings of the second view.
    )delimiter");
}
