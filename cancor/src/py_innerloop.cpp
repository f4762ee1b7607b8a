#include "py_decl.hpp"
#include <innerloop/innerloop.hpp>

namespace cc = cancor_core;

template <class T>
void state_innerloop(py::module_& m, const char* name)
{
    using state_t = cc::innerloop::StateInnerLoop<T>;
    py::class_<state_t>(m, name, R"delimiter(
    State of a fitted inner loop.
    )delimiter")
        .def_readonly("views", &state_t::views, R"delimiter(
        Copies of the views the inner loop was fitted on.
        )delimiter")
        .def_readonly("generalized", &state_t::generalized, R"delimiter(
        ``True`` if the targets were computed in generalized mode.
        )delimiter")
        .def_readonly("generalized_forced", &state_t::generalized_forced, R"delimiter(
        ``True`` if generalized mode was forced because more than two views were given.
        )delimiter")
        .def_readonly("weights", &state_t::weights, R"delimiter(
        List of weight vectors, one per view.
        )delimiter")
        .def_readonly("scores", &state_t::scores, R"delimiter(
        ``(K, n)`` matrix of scores where ``K`` is the number of views.
        )delimiter")
        .def_readonly("objective", &state_t::objective, R"delimiter(
        Objective value after each outer iteration.
        )delimiter")
        .def_readonly("iters", &state_t::iters)
        .def_readonly("converged", &state_t::converged)
        .def_readonly("time_elapsed", &state_t::time_elapsed)
        .def_property_readonly("n_views", &state_t::n_views)
        .def_property_readonly("n_samples", &state_t::n_samples)
        ;
}

template <class T>
void innerloop_base(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopBase<T>;
    py::class_<internal_t>(m, name, R"delimiter(
    Base class of the alternating inner loops.
    )delimiter")
        .def_readonly("name", &internal_t::name)
        .def_readonly("max_iter", &internal_t::max_iter)
        .def_readonly("tol", &internal_t::tol)
        .def_readonly("generalized", &internal_t::generalized)
        .def_readonly("seed", &internal_t::seed)
        .def("fit", &internal_t::fit, py::arg("views"), 
            py::return_value_policy::reference_internal, R"delimiter(
        Fits the inner loop.

        Parameters
        ----------
        views : list of ndarray
            List of at least two ``(n, p_i)`` matrices with the same number of rows.

        Returns
        -------
        state
            Fitted state. It is valid until the next call to ``fit()``.
        )delimiter")
        .def("objective", &internal_t::objective, py::arg("state"))
        .def("early_stop", &internal_t::early_stop, py::arg("state"))
        .def_property_readonly("is_fitted", &internal_t::is_fitted)
        .def_property_readonly("state", &internal_t::state, 
            py::return_value_policy::reference_internal)
        ;
}

template <class T>
void innerloop_pls(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopPLS<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    py::class_<internal_t, base_t>(m, name, 
        "Unregularized alternating power iteration."
        )
        .def(py::init<size_t, value_t, bool, const string_t&, size_t>(),
            py::arg("max_iter")=100,
            py::arg("tol")=1e-5,
            py::arg("generalized")=false,
            py::arg("initialization")="unregularized",
            py::arg("seed")=0
        )
        ;
}

template <class T>
void innerloop_pmd(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopPMD<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    using dyn_vec_value_t = typename internal_t::dyn_vec_value_t;
    using dyn_vec_bool_t = typename internal_t::dyn_vec_bool_t;
    py::class_<internal_t, base_t>(m, name, 
        "Penalized matrix decomposition with L1 bound ``c`` per view."
        )
        .def(py::init<
            size_t, value_t, bool, const string_t&, 
            const dyn_vec_value_t&, const dyn_vec_bool_t&, size_t
        >(),
            py::arg("max_iter")=100,
            py::arg("tol")=1e-5,
            py::arg("generalized")=false,
            py::arg("initialization")="unregularized",
            py::arg("c")=dyn_vec_value_t(),
            py::arg("positive")=dyn_vec_bool_t(),
            py::arg("seed")=0
        )
        .def_property_readonly("c", &internal_t::c)
        .def_property_readonly("positive", &internal_t::positive)
        ;
}

template <class T>
void innerloop_parkhomenko(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopParkhomenko<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    using dyn_vec_value_t = typename internal_t::dyn_vec_value_t;
    py::class_<internal_t, base_t>(m, name, 
        "Sparse CCA by soft-thresholded power iteration."
        )
        .def(py::init<size_t, value_t, bool, const string_t&, const dyn_vec_value_t&, size_t>(),
            py::arg("max_iter")=100,
            py::arg("tol")=1e-5,
            py::arg("generalized")=false,
            py::arg("initialization")="unregularized",
            py::arg("c")=dyn_vec_value_t(),
            py::arg("seed")=0
        )
        .def_property_readonly("c", &internal_t::c)
        ;
}

template <class T>
void innerloop_elastic(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopElastic<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    using dyn_vec_value_t = typename internal_t::dyn_vec_value_t;
    using dyn_vec_bool_t = typename internal_t::dyn_vec_bool_t;
    py::class_<internal_t, base_t>(m, name, 
        "Elastic net regularized CCA by alternating regressions."
        )
        .def(py::init<
            size_t, value_t, bool, const string_t&,
            const dyn_vec_value_t&, const dyn_vec_value_t&,
            bool, bool, const dyn_vec_bool_t&, size_t
        >(),
            py::arg("max_iter")=100,
            py::arg("tol")=1e-5,
            py::arg("generalized")=false,
            py::arg("initialization")="unregularized",
            py::arg("c")=dyn_vec_value_t(),
            py::arg("l1_ratio")=dyn_vec_value_t(),
            py::arg("constrained")=false,
            py::arg("stochastic")=false,
            py::arg("positive")=dyn_vec_bool_t(),
            py::arg("seed")=0
        )
        .def_readonly("constrained", &internal_t::constrained)
        .def_readonly("stochastic", &internal_t::stochastic)
        .def_property_readonly("c", &internal_t::c)
        .def_property_readonly("l1_ratio", &internal_t::l1_ratio)
        .def_property_readonly("gamma", &internal_t::gamma)
        .def_property_readonly("regressions", [](const internal_t& self) {
            py::list out;
            for (const auto& r : self.regressions()) out.append(r->name);
            return out;
        }, "Names of the regression solvers chosen for each view.")
        ;
}

template <class T>
void innerloop_admm(py::module_& m, const char* name)
{
    using internal_t = cc::innerloop::InnerLoopADMM<T>;
    using base_t = typename internal_t::base_t;
    using value_t = typename internal_t::value_t;
    using string_t = typename internal_t::string_t;
    using dyn_vec_value_t = typename internal_t::dyn_vec_value_t;
    py::class_<internal_t, base_t>(m, name, 
        "Sparse CCA by linearized ADMM."
        )
        .def(py::init<
            size_t, value_t, bool, const string_t&,
            const dyn_vec_value_t&, const dyn_vec_value_t&,
            const dyn_vec_value_t&, const dyn_vec_value_t&, size_t
        >(),
            py::arg("max_iter")=100,
            py::arg("tol")=1e-5,
            py::arg("generalized")=false,
            py::arg("initialization")="unregularized",
            py::arg("mu")=dyn_vec_value_t(),
            py::arg("lam")=dyn_vec_value_t(),
            py::arg("c")=dyn_vec_value_t(),
            py::arg("eta")=dyn_vec_value_t(),
            py::arg("seed")=0
        )
        .def_property_readonly("mu", &internal_t::mu)
        .def_property_readonly("lam", &internal_t::lam)
        .def_property_readonly("c", &internal_t::c)
        .def_property_readonly("eta", &internal_t::eta)
        .def_property_readonly("z", &internal_t::z)
        ;
}

void register_innerloop(py::module_& m)
{
    state_innerloop<double>(m, "StateInnerLoop64");
    state_innerloop<float>(m, "StateInnerLoop32");

    innerloop_base<double>(m, "InnerLoopBase64");
    innerloop_base<float>(m, "InnerLoopBase32");
    innerloop_pls<double>(m, "InnerLoopPLS64");
    innerloop_pls<float>(m, "InnerLoopPLS32");
    innerloop_pmd<double>(m, "InnerLoopPMD64");
    innerloop_pmd<float>(m, "InnerLoopPMD32");
    innerloop_parkhomenko<double>(m, "InnerLoopParkhomenko64");
    innerloop_parkhomenko<float>(m, "InnerLoopParkhomenko32");
    innerloop_elastic<double>(m, "InnerLoopElastic64");
    innerloop_elastic<float>(m, "InnerLoopElastic32");
    innerloop_admm<double>(m, "InnerLoopADMM64");
    innerloop_admm<float>(m, "InnerLoopADMM32");
}
