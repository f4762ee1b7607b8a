#pragma once
#if defined(_MSC_VER) && !defined(__clang__) && !defined(__INTEL_COMPILER)
#pragma warning( push, 1 )
#endif
#include <pybind11/pybind11.h>
// Ignore all warnings for Eigen on GCC and Clang
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall" 
#pragma GCC diagnostic ignored "-Wextra" 
#include <pybind11/eigen.h>
#pragma GCC diagnostic pop
#include <pybind11/stl.h>
#if defined(_MSC_VER) && !defined(__clang__) && !defined(__INTEL_COMPILER)
#pragma warning( pop )
#endif
#include <cancor_core/util/types.hpp>

namespace py = pybind11;

void register_configs(py::module_&);
void register_innerloop(py::module_&);
void register_loss(py::module_&);
void register_optimization(py::module_&);
void register_regression(py::module_&);
