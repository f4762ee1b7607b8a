#pragma once
// Eigen modules used by the solvers, included with all warnings disabled.
#if defined(_MSC_VER)
#pragma warning( push, 0 )
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#pragma GCC diagnostic ignored "-Wextra"
#endif
#include <Eigen/Core>
#include <Eigen/Cholesky>
#include <Eigen/QR>
#if defined(_MSC_VER)
#pragma warning( pop )
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
