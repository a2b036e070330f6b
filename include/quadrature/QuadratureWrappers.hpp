/**
 * @file QuadratureWrappers.hpp
 * @brief Exposes the Boost and GSL adaptive rules through the IQuadratureRule interface.
 *
 * Dependencies:
 * - QuadratureRule.hpp: Concrete rules.
 * - QuadratureRuleAbstract.hpp: Abstract interface.
 *
 */
#ifndef QUADRATURE_WRAPPERS_HPP
#define QUADRATURE_WRAPPERS_HPP

#include <memory>
#include <utility>
#include "QuadratureRule.hpp"
#include "QuadratureRuleAbstract.hpp"

namespace quadrature {

/**
 * @class QuadratureRuleAdapter
 * @tparam Rule Concrete rule providing integrate(integrand, lower, upper) const.
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Owns a rule by value; rules only hold settings, so clones are cheap.
 */
template<typename Rule, typename R>
class QuadratureRuleAdapter final : public IQuadratureRule<R> {
    Rule rule_;
public:
    template<typename... Args>
    explicit QuadratureRuleAdapter(Args&&... args)
        : rule_(std::forward<Args>(args)...) {}

    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<QuadratureRuleAdapter>(rule_);
    }
};

template<typename R = traits::DataType::DensityField>
using BoostQuadratureWrapper = QuadratureRuleAdapter<BoostTanhSinhQuadrature<R>, R>;

template<typename R = traits::DataType::DensityField>
using GSLQuadratureWrapper = QuadratureRuleAdapter<GSLQuadrature<R>, R>;

} // namespace quadrature
#endif // QUADRATURE_WRAPPERS_HPP
