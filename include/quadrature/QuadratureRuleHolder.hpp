/**
 * @file QuadratureRuleHolder.hpp
 * @brief Value-semantic owner of one adaptive 1-D quadrature rule.
 *
 * The rule is chosen at runtime from traits::QuadratureMethod and configured with a single
 * relative tolerance. Copies clone the rule; moves transfer it.
 *
 * Usage Example:
 * @code
 * quadrature::QuadratureRuleHolder<double> rule(traits::QuadratureMethod::QAGS, 1e-10);
 * double mass = rule.integrate(density, 0.0, 1.0);
 * @endcode
 */
#ifndef QUADRATURE_RULE_HOLDER_HPP
#define QUADRATURE_RULE_HOLDER_HPP

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include "QuadratureWrappers.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace quadrature {
using QuadratureType = traits::QuadratureMethod;

template<typename R>
class QuadratureRuleHolder {
public:
    /**
     * @param type Integration technique.
     * @param relative_error Target relative error of the integral.
     * @throws std::invalid_argument for an unsupported type or a non-positive tolerance.
     */
    explicit QuadratureRuleHolder(QuadratureType type = QuadratureType::TanhSinh,
                                  R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()))
    {
        if (!(relative_error > R(0))) {
            throw std::invalid_argument("Quadrature tolerance must be positive.");
        }
        switch (type) {
            case QuadratureType::TanhSinh:
                rule_ = std::make_unique<BoostQuadratureWrapper<R>>(relative_error);
                break;
            case QuadratureType::QAGS:
                rule_ = std::make_unique<GSLQuadratureWrapper<R>>(R(1e-12), relative_error);
                break;
            default:
                throw std::invalid_argument("Unsupported QuadratureType specified.");
        }
    }

    QuadratureRuleHolder(const QuadratureRuleHolder& other)
        : rule_(other.rule_ ? other.rule_->clone() : nullptr) {}

    QuadratureRuleHolder& operator=(const QuadratureRuleHolder& other) {
        if (this != &other) rule_ = other.rule_ ? other.rule_->clone() : nullptr;
        return *this;
    }

    QuadratureRuleHolder(QuadratureRuleHolder&&) noexcept = default;
    QuadratureRuleHolder& operator=(QuadratureRuleHolder&&) noexcept = default;

    /**
     * @throws std::runtime_error if the holder was moved from, or if the rule fails.
     */
    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const {
        if (!rule_) {
            throw std::runtime_error("QuadratureRuleHolder holds no rule.");
        }
        return rule_->integrate(integrand, lower_bound, upper_bound);
    }

private:
    std::unique_ptr<IQuadratureRule<R>> rule_;
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HOLDER_HPP
