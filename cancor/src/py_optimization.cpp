#include "py_decl.hpp"
#include <cancor_core/optimization/bisect.hpp>
#include <cancor_core/optimization/delta_search.hpp>
#include <cancor_core/optimization/elnet_full.hpp>
#include <cancor_core/optimization/proximal.hpp>

namespace cc = cancor_core;
using namespace pybind11::literals; // to bring in the `_a` literal

using vec_t = cc::util::rowvec_type<double>;

vec_t soft_threshold(
    const Eigen::Ref<const vec_t>& x,
    double threshold,
    bool positive
)
{
    vec_t out(x.size());
    cc::optimization::soft_threshold(x, threshold, positive, out);
    return out;
}

vec_t prox_mu_f(
    const Eigen::Ref<const vec_t>& x,
    double mu,
    const Eigen::Ref<const vec_t>& g,
    double tau
)
{
    vec_t out(x.size());
    cc::optimization::prox_mu_f(x, mu, g, tau, out);
    return out;
}

vec_t prox_lam_g(
    const Eigen::Ref<const vec_t>& x
)
{
    vec_t out(x.size());
    cc::optimization::prox_lam_g(x, out);
    return out;
}

py::tuple delta_search(
    const Eigen::Ref<const vec_t>& w,
    double c,
    bool positive,
    double init
)
{
    vec_t out(w.size());
    const auto iters = cc::optimization::delta_search(w, c, positive, out, init);
    return py::make_tuple(out, iters);
}

py::tuple bin_search(
    double current,
    double previous,
    double current_val,
    double previous_val,
    double lower,
    double upper
)
{
    const auto next = cc::optimization::bin_search(
        current, previous, current_val, previous_val, lower, upper
    );
    return py::make_tuple(next, lower, upper);
}

template <class MatrixType>
void elnet_full(py::module_& m, const char* name)
{
    using state_t = cc::optimization::StateElnetFull<MatrixType>;
    using matrix_t = typename state_t::matrix_t;
    using value_t = typename state_t::value_t;
    using vec_value_t = typename state_t::vec_value_t;
    py::class_<state_t>(m, name, R"delimiter(
    Solves the elastic net problem in covariance form.

    The problem is given by

    .. math::
        \begin{align*}
            \mathrm{minimize}_{x} 
            \frac{1}{2} x^\top Q x - v^\top x + \sum\limits_i \omega_i |x_i|
        \end{align*}

    where :math:`Q` is a dense positive semi-definite matrix
    that already includes the ridge term on its diagonal.

    Parameters
    ----------
    quad : (n, n) ndarray
        Full positive semi-definite dense matrix :math:`Q`.
    penalty : (n,) ndarray
        L1 penalty factors :math:`\omega`.
    positive : bool
        If ``True``, the solution is constrained to be non-negative.
    max_iters : int
        Maximum number of coordinate descent sweeps.
    tol : float
        Convergence tolerance.
    x : (n,) ndarray
        Solution vector.
    grad : (n,) ndarray
        Gradient vector :math:`v - Q x`.
    )delimiter")
        .def(py::init<
            const Eigen::Ref<const matrix_t>&,
            const Eigen::Ref<const vec_value_t>&,
            bool,
            size_t,
            value_t,
            Eigen::Ref<vec_value_t>,
            Eigen::Ref<vec_value_t> 
        >(),
            py::arg("quad").noconvert(),
            py::arg("penalty").noconvert(),
            py::arg("positive"),
            py::arg("max_iters"),
            py::arg("tol"),
            py::arg("x"),
            py::arg("grad")
        )
        .def_readonly("quad", &state_t::quad)
        .def_readonly("penalty", &state_t::penalty)
        .def_readonly("positive", &state_t::positive)
        .def_readonly("max_iters", &state_t::max_iters)
        .def_readonly("tol", &state_t::tol)
        .def_readonly("iters", &state_t::iters)
        .def_readonly("x", &state_t::x)
        .def_readonly("grad", &state_t::grad)
        .def("solve", &state_t::solve)
        ;
}

void register_optimization(py::module_& m)
{
    m.def("soft_threshold", &soft_threshold, 
        "x"_a, "threshold"_a, "positive"_a=false, R"delimiter(
    Elementwise soft-thresholding :math:`\mathrm{sign}(x) (|x| - t)_+`.

    Parameters
    ----------
    x : (p,) ndarray
        Input vector.
    threshold : float
        Non-negative threshold :math:`t`.
    positive : bool, optional
        If ``True``, negative outputs are set to zero.
        Default is ``False``.
    )delimiter");

    m.def("prox_mu_f", &prox_mu_f, "x"_a, "mu"_a, "g"_a, "tau"_a, R"delimiter(
    Proximal map of the L1 term used by the linearized ADMM update.
    )delimiter");

    m.def("prox_lam_g", &prox_lam_g, "x"_a, R"delimiter(
    Projection onto the unit L2 ball.
    )delimiter");

    m.def("delta_search", &delta_search, 
        "w"_a, "c"_a, "positive"_a=false, "init"_a=0.0, R"delimiter(
    Finds the soft-threshold level such that the thresholded and normalized 
    weights have L1 norm ``c``.

    Returns
    -------
    (out, iters) : tuple
        ``out`` is the calibrated unit-norm vector and 
        ``iters`` the number of bisection steps taken.
    )delimiter");

    m.def("bin_search", &bin_search, 
        "current"_a, "previous"_a, "current_val"_a, "previous_val"_a, "lower"_a, "upper"_a, R"delimiter(
    One bracketing bisection step.

    Returns
    -------
    (next, lower, upper) : tuple
        Next candidate and the updated bracket.
    )delimiter");

    elnet_full<cc::util::colmat_type<double>>(m, "StateElnetFull64");
    elnet_full<cc::util::colmat_type<float>>(m, "StateElnetFull32");
}
