#include "py_decl.hpp"
#include <cancor_core/util/exceptions.hpp>

namespace cc = cancor_core;

PYBIND11_MODULE(cancor_core, m) {

    // translators registered later are tried first
    auto& base_error = py::register_exception<cc::util::cancor_core_error>(m, "CancorCoreError");
    py::register_exception<cc::util::cancor_core_config_error>(m, "ConfigError", base_error);
    py::register_exception<cc::util::cancor_core_degenerate_error>(m, "DegenerateError", base_error);

    auto m_configs = m.def_submodule("configs", "Configurations submodule.");
    register_configs(m_configs);

    auto m_innerloop = m.def_submodule("innerloop", "Inner loop submodule.");
    register_innerloop(m_innerloop);

    auto m_loss = m.def_submodule("loss", "Loss submodule.");
    register_loss(m_loss);

    auto m_optimization = m.def_submodule("optimization", "Optimization submodule.");
    register_optimization(m_optimization);

    auto m_regression = m.def_submodule("regression", "Regression submodule.");
    register_regression(m_regression);
}
