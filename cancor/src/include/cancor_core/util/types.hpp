#pragma once
#include <Eigen/Core>
#include <string>
#include <vector>
#include <cancor_core/util/exceptions.hpp>

namespace cancor_core {
namespace util {
    
template <class Scalar_, int Rows_=Eigen::Dynamic, int Cols_=Eigen::Dynamic>
using colmat_type = Eigen::Matrix<Scalar_, Rows_, Cols_, Eigen::ColMajor>;

template <class Scalar_, int Rows_=Eigen::Dynamic, int Cols_=Eigen::Dynamic>
using rowmat_type = Eigen::Matrix<Scalar_, Rows_, Cols_, Eigen::RowMajor>;

template <class Scalar_, int Rows_=Eigen::Dynamic, int Cols_=Eigen::Dynamic>
using colarr_type = Eigen::Array<Scalar_, Rows_, Cols_, Eigen::ColMajor>;

template <class Scalar_, int Rows_=Eigen::Dynamic, int Cols_=Eigen::Dynamic>
using rowarr_type = Eigen::Array<Scalar_, Rows_, Cols_, Eigen::RowMajor>;

template <class Scalar_, int Rows_=Eigen::Dynamic>
using colvec_type = colarr_type<Scalar_, Rows_, 1>;

template <class Scalar_, int Cols_=Eigen::Dynamic>
using rowvec_type = rowarr_type<Scalar_, 1, Cols_>;

enum class initialization_type
{
    _random,
    _uniform,
    _unregularized
};

enum class regression_type
{
    _least_squares,
    _ridge,
    _lasso,
    _elastic_net,
    _sgd
};

enum class sgd_penalty_type
{
    _l2,
    _l1,
    _elastic_net
};

inline initialization_type convert_initialization(
    const std::string& initialization
)
{
    if (initialization == "random") return initialization_type::_random;
    if (initialization == "uniform") return initialization_type::_uniform;
    if (initialization == "unregularized") return initialization_type::_unregularized;
    throw util::cancor_core_config_error("Invalid initialization type: " + initialization);
}

inline sgd_penalty_type convert_sgd_penalty(
    const std::string& penalty
)
{
    if (penalty == "l2") return sgd_penalty_type::_l2;
    if (penalty == "l1") return sgd_penalty_type::_l1;
    if (penalty == "elasticnet") return sgd_penalty_type::_elastic_net;
    throw util::cancor_core_config_error("Invalid SGD penalty type: " + penalty);
}

inline std::string to_string(regression_type type)
{
    switch (type) {
        case regression_type::_least_squares: return "least_squares";
        case regression_type::_ridge: return "ridge";
        case regression_type::_lasso: return "lasso";
        case regression_type::_elastic_net: return "elastic_net";
        case regression_type::_sgd: return "sgd";
    }
    return "unknown";
}

} // namespace util
} // namespace cancor_core
