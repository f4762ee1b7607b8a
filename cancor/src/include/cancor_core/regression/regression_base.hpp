#pragma once
#include <string>
#include <cancor_core/util/exceptions.hpp>
#include <cancor_core/util/format.hpp>
#include <cancor_core/util/types.hpp>

#ifndef CANCOR_CORE_REGRESSION_BASE_TP
#define CANCOR_CORE_REGRESSION_BASE_TP \
    template <class ValueType>
#endif
#ifndef CANCOR_CORE_REGRESSION_BASE
#define CANCOR_CORE_REGRESSION_BASE \
    RegressionBase<ValueType>
#endif

namespace cancor_core {
namespace regression {

/**
 * Base class of the linear regression solvers used by the elastic inner loop.
 * A solver is stateful: the last coefficients are kept and may serve as
 * a warm start for the next call to fit().
 * No intercept is fitted.
 */
template <class ValueType>
class RegressionBase
{
public:
    using value_t = ValueType;
    using string_t = std::string;
    using vec_value_t = util::rowvec_type<value_t>;
    using colmat_value_t = util::colmat_type<value_t>;

    const string_t name;

protected:
    vec_value_t _coef;

    inline void check_fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) const;

    /*
     * Resets the coefficients to zero unless they already match the number of features.
     */
    inline void prepare_coef(int p);

public:
    explicit RegressionBase(
        const string_t& name
    );

    virtual ~RegressionBase() {}

    virtual void fit(
        const Eigen::Ref<const colmat_value_t>& X,
        const Eigen::Ref<const vec_value_t>& y
    ) =0;

    const vec_value_t& coef() const { return _coef; }
};

CANCOR_CORE_REGRESSION_BASE_TP
CANCOR_CORE_REGRESSION_BASE::RegressionBase(
    const string_t& name
):
    name(name),
    _coef()
{}

CANCOR_CORE_REGRESSION_BASE_TP
void
CANCOR_CORE_REGRESSION_BASE::check_fit(
    const Eigen::Ref<const colmat_value_t>& X,
    const Eigen::Ref<const vec_value_t>& y
) const
{
    if (X.rows() != y.size()) {
        throw util::cancor_core_error(
            util::format(
                "%s: fit() is given inconsistent inputs! "
                "(X=(%d, %d), y=%d)",
                name.c_str(), static_cast<int>(X.rows()), static_cast<int>(X.cols()), static_cast<int>(y.size())
            )
        );
    }
}

CANCOR_CORE_REGRESSION_BASE_TP
void
CANCOR_CORE_REGRESSION_BASE::prepare_coef(int p)
{
    if (_coef.size() != p) {
        _coef.setZero(p);
    }
}

} // namespace regression
} // namespace cancor_core
