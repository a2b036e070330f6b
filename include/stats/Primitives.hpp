/**
 * @file Primitives.hpp
 * @brief Vectorized primitive densities evaluated on the active array backend.
 *
 * Each function takes a sample array and scalar shape parameters and returns the density at
 * every sample, 0 outside the support. Parameter validation is left to Boost.Math, whose
 * std::domain_error propagates unchanged to the caller.
 *
 * - beta_dist:      Beta(alpha, beta) rescaled to [0, scale].
 * - truncnorm:      Normal(mu, sigma) truncated to [low, high].
 * - truncskewnorm:  SkewNormal(mu, sigma, alpha) truncated to [low, high].
 *
 * Argument order follows the conventional population-inference signatures (high before low).
 */

#ifndef PRIMITIVES_HPP
#define PRIMITIVES_HPP

#include "DensityBase.hpp"
#include "../backend/ArrayBackendHolder.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace stats {

template<typename R = traits::DataType::DensityField>
traits::Array<R> beta_dist(const traits::Array<R>& x, R alpha, R beta, R scale = R(1)) {
    const auto density = make_scaled_beta_density<R>(alpha, beta, scale);
    return backend::active_backend<R>().map(x, [&density](R v) { return density.pdf(v); });
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> truncnorm(const traits::Array<R>& x, R mu, R sigma, R high, R low) {
    const auto density = make_truncated_normal_density<R>(mu, sigma, low, high);
    return backend::active_backend<R>().map(x, [&density](R v) { return density.pdf(v); });
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> truncskewnorm(const traits::Array<R>& x, R mu, R sigma, R alpha, R high, R low) {
    const auto density = make_truncated_skew_normal_density<R>(mu, sigma, alpha, low, high);
    return backend::active_backend<R>().map(x, [&density](R v) { return density.pdf(v); });
}

} // namespace stats

#endif // PRIMITIVES_HPP
