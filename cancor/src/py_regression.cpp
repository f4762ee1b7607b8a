#include "py_decl.hpp"
#include <regression/regression.hpp>

namespace cc = cancor_core;

template <class T>
void regression_base(py::module_& m, const char* name)
{
    using internal_t = cc::regression::RegressionBase<T>;
    py::class_<internal_t>(m, name, R"delimiter(
    Base class of the linear regression solvers used by the elastic inner loop.
    No intercept is fitted.
    )delimiter")
        .def_readonly("name", &internal_t::name)
        .def("fit", &internal_t::fit, py::arg("X").noconvert(), py::arg("y"), R"delimiter(
        Fits the regression of ``y`` on ``X``.

        Parameters
        ----------
        X : (n, p) ndarray
            Feature matrix in column-major order.
        y : (n,) ndarray
            Response vector.
        )delimiter")
        .def_property_readonly("coef", &internal_t::coef, py::return_value_policy::copy)
        ;
}

template <class T>
void regression_least_squares(py::module_& m, const char* name)
{
    using internal_t = cc::regression::RegressionLeastSquares<T>;
    using base_t = typename internal_t::base_t;
    py::class_<internal_t, base_t>(m, name, 
        "Ordinary (or non-negative) least squares."
        )
        .def(py::init<bool>(), py::arg("positive")=false)
        ;
}

template <class T>
void regression_ridge(py::module_& m, const char* name)
{
    using internal_t = cc::regression::RegressionRidge<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    py::class_<internal_t, base_t>(m, name, 
        "Ridge regression solved in closed form."
        )
        .def(py::init<value_t>(), py::arg("alpha"))
        ;
}

template <class T>
void regression_elastic_net(py::module_& m, const char* name)
{
    using internal_t = cc::regression::RegressionElasticNet<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    py::class_<internal_t, base_t>(m, name, 
        "Elastic net regression solved by warm-started coordinate descent."
        )
        .def(py::init<value_t, value_t, bool, bool, const string_t&>(), 
            py::arg("alpha"),
            py::arg("l1_ratio"),
            py::arg("positive")=false,
            py::arg("warm_start")=true,
            py::arg("name")="elastic_net"
        )
        ;
}

template <class T>
void regression_sgd(py::module_& m, const char* name)
{
    using internal_t = cc::regression::RegressionSGD<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    py::class_<internal_t, base_t>(m, name, 
        "Linear regression by stochastic gradient descent."
        )
        .def(py::init<const std::string&, value_t, value_t, value_t, size_t>(), 
            py::arg("penalty"),
            py::arg("alpha"),
            py::arg("l1_ratio"),
            py::arg("tol"),
            py::arg("seed")
        )
        .def_property_readonly("epochs", &internal_t::epochs)
        ;
}

void register_regression(py::module_& m)
{
    m.def("select_regression", [](double alpha, double l1_ratio, bool positive, bool stochastic) {
        return cc::util::to_string(
            cc::regression::select_regression<double>(alpha, l1_ratio, positive, stochastic)
        );
    }, py::arg("alpha"), py::arg("l1_ratio"), py::arg("positive")=false, py::arg("stochastic")=false,
    "Name of the regression solver used for a penalty configuration.");

    regression_base<double>(m, "RegressionBase64");
    regression_base<float>(m, "RegressionBase32");
    regression_least_squares<double>(m, "RegressionLeastSquares64");
    regression_least_squares<float>(m, "RegressionLeastSquares32");
    regression_ridge<double>(m, "RegressionRidge64");
    regression_ridge<float>(m, "RegressionRidge32");
    regression_elastic_net<double>(m, "RegressionElasticNet64");
    regression_elastic_net<float>(m, "RegressionElasticNet32");
    regression_sgd<double>(m, "RegressionSGD64");
    regression_sgd<float>(m, "RegressionSGD32");
}
