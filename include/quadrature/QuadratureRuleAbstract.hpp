/**
 * @file QuadratureRuleAbstract.hpp
 * @brief Defines the abstract interface for adaptive 1-D quadrature rules.
 *
 * IQuadratureRule is implemented by the Boost tanh-sinh and GSL QAGS adapters and is used to
 * normalize interpolated densities over a finite interval. Rules are copied polymorphically
 * through clone().
 *
 */
#ifndef I_QUADRATURE_RULE_HPP
#define I_QUADRATURE_RULE_HPP

#include <functional>
#include <memory>

namespace quadrature {
template<typename NumericType>
class IQuadratureRule {
public:
    virtual ~IQuadratureRule() = default;

    /**
     * @brief Integrates the given function over the finite interval [lower_bound, upper_bound].
     * @param integrand A callable function object taking NumericType, returning NumericType.
     * @param lower_bound The lower integration limit.
     * @param upper_bound The upper integration limit.
     * @return The approximate value of the definite integral, 0 for an empty interval.
     */
    virtual NumericType integrate(
        const std::function<NumericType(NumericType)>& integrand,
        NumericType lower_bound,
        NumericType upper_bound) const = 0;

    virtual std::unique_ptr<IQuadratureRule<NumericType>> clone() const = 0;
};
} // namespace quadrature
#endif // I_QUADRATURE_RULE_HPP
