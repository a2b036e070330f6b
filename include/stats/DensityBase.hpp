/**
 * @file DensityBase.hpp
 * @brief Provides a generic truncated, rescaled density built on Boost.Math distributions.
 *
 * This header defines a template class `BoostTruncatedDensity` that wraps a Boost.Math
 * distribution, restricts it to an interval and rescales its argument, providing a unified
 * interface for the scalar PDF, the truncated probability mass and domain checks.
 *
 * Dependencies:
 * - Boost.Math for distribution implementations (normal, skew normal, beta).
 * - traits/SPINPOP_traits.hpp for type definitions.
 *
 * Main Components:
 * - DensityPolicy: Boost policy under which overflow yields +inf instead of throwing. Domain
 *   errors (non-positive scale or shape parameters) still throw std::domain_error.
 * - DensityInterval: Represents the support of a truncated density, with bounds checking.
 * - BoostTruncatedDensity: pdf(x) = pdf_boost(x / scale) / (scale * mass) on the interval, 0 elsewhere.
 * - Factory functions: truncated normal, truncated skew normal and scaled beta densities.
 *
 * Usage Example:
 * @code
 * auto tilt = stats::make_truncated_normal_density(1.0, 0.5, -1.0, 1.0);
 * double p = tilt.pdf(0.3);
 * @endcode
 */

#ifndef DENSITY_BASE_HPP
#define DENSITY_BASE_HPP
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/skew_normal.hpp>
#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/complement.hpp>
#include <boost/math/policies/policy.hpp>
#include "Dataset.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace stats {

using DensityPolicy = boost::math::policies::policy<
    boost::math::policies::overflow_error<boost::math::policies::ignore_error>>;

/**
 * @brief Represents a valid interval over which a density is defined.
 *
 * @tparam R Numeric type (e.g., float or double).
 */
template<typename R>
struct DensityInterval {
    R lower = -std::numeric_limits<R>::infinity();
    R upper = std::numeric_limits<R>::infinity();

    /**
     * @brief Constructs a DensityInterval with explicit bounds.
     * @param l Lower bound
     * @param u Upper bound
     * @throws std::invalid_argument unless l < u.
     */
    DensityInterval(R l, R u) : lower(l), upper(u) {
        if (!(l < u)) {
            std::ostringstream msg;
            msg << "Lower bound " << l << " must be smaller than upper bound " << u << " in DensityInterval.";
            throw std::invalid_argument(msg.str());
        }
    }

    DensityInterval() = default;

    bool contains(R x) const noexcept {
        return x >= lower && x <= upper;
    }
};

/**
 * @brief Boost distribution restricted to an interval, with a rescaled argument.
 *
 * The interval is expressed in the units of x; the Boost distribution is evaluated at x / scale.
 * The truncated mass is computed once at construction.
 *
 * @tparam BoostDist The specific Boost distribution type (e.g., boost::math::normal_distribution).
 * @tparam R Numeric type (defaults to double).
 */
template<typename BoostDist, typename R = traits::DataType::DensityField>
class BoostTruncatedDensity {
protected:
    BoostDist dist_;
    DensityInterval<R> domain_;
    R scale_;
    R mass_;

public:
    /**
     * @param dist The underlying distribution.
     * @param domain Support of the truncated density, in units of x.
     * @param scale Positive rescaling of the argument.
     * @throws std::domain_error if scale is not positive.
     * @throws NormalizationError if the distribution carries no mass on the domain.
     */
    BoostTruncatedDensity(BoostDist dist, DensityInterval<R> domain, R scale = R(1))
        : dist_(std::move(dist)), domain_(domain), scale_(scale), mass_(R(1))
    {
        if (!(scale_ > R(0))) {
            throw std::domain_error("Density scale must be positive.");
        }
        mass_ = truncated_mass();
        if (!(mass_ > R(0)) || !std::isfinite(mass_)) {
            std::ostringstream msg;
            msg << "Truncated density has mass " << mass_ << " on [" << domain_.lower << ", "
                << domain_.upper << "].";
            throw NormalizationError(msg.str());
        }
    }

    BoostTruncatedDensity(const BoostTruncatedDensity& other) = default;
    BoostTruncatedDensity& operator=(const BoostTruncatedDensity& other) = default;
    BoostTruncatedDensity(BoostTruncatedDensity&& other) noexcept = default;
    BoostTruncatedDensity& operator=(BoostTruncatedDensity&& other) noexcept = default;
    ~BoostTruncatedDensity() = default;

    /**
     * @brief Probability density function.
     * @param x Point at which to evaluate the PDF.
     * @return Value of the PDF, 0 if x is outside the domain or NaN.
     */
    R pdf(R x) const {
        if (!isInDomain(x)) {
            return R(0.0);
        }
        return boost::math::pdf(dist_, x / scale_) / (scale_ * mass_);
    }

    bool isInDomain(R x) const noexcept {
        if (std::isnan(x)) return false;
        return domain_.contains(x);
    }

    /// Probability of the untruncated distribution on the domain.
    R getMass() const noexcept { return mass_; }

private:
    /**
     * @brief Probability of the untruncated distribution on the domain.
     *
     * Uses the upper-tail complement when the domain lies above the median, where
     * cdf(upper) - cdf(lower) would cancel to zero.
     */
    R truncated_mass() const {
        const R lo = domain_.lower / scale_;
        const R hi = domain_.upper / scale_;
        const auto support = boost::math::support(dist_);
        const R lo_c = std::max(lo, static_cast<R>(support.first));
        const R hi_c = std::min(hi, static_cast<R>(support.second));
        if (!(lo_c < hi_c)) return R(0);

        const R cdf_lo = boost::math::cdf(dist_, lo_c);
        if (cdf_lo > R(0.5)) {
            return boost::math::cdf(boost::math::complement(dist_, lo_c))
                 - boost::math::cdf(boost::math::complement(dist_, hi_c));
        }
        return boost::math::cdf(dist_, hi_c) - cdf_lo;
    }
};

template<typename R = traits::DataType::DensityField>
using TruncatedNormalDensity = BoostTruncatedDensity<boost::math::normal_distribution<R, DensityPolicy>, R>;

template<typename R = traits::DataType::DensityField>
using TruncatedSkewNormalDensity = BoostTruncatedDensity<boost::math::skew_normal_distribution<R, DensityPolicy>, R>;

template<typename R = traits::DataType::DensityField>
using ScaledBetaDensity = BoostTruncatedDensity<boost::math::beta_distribution<R, DensityPolicy>, R>;

/**
 * @brief Normal(mu, sigma) truncated to [low, high].
 * @throws std::domain_error if sigma <= 0 (raised by Boost).
 * @throws std::invalid_argument unless low < high.
 */
template<typename R = traits::DataType::DensityField>
TruncatedNormalDensity<R> make_truncated_normal_density(R mu, R sigma, R low, R high) {
    using Dist = boost::math::normal_distribution<R, DensityPolicy>;
    return TruncatedNormalDensity<R>(Dist(mu, sigma), DensityInterval<R>(low, high));
}

/**
 * @brief SkewNormal(location mu, scale sigma, shape alpha) truncated to [low, high].
 */
template<typename R = traits::DataType::DensityField>
TruncatedSkewNormalDensity<R> make_truncated_skew_normal_density(R mu, R sigma, R alpha, R low, R high) {
    using Dist = boost::math::skew_normal_distribution<R, DensityPolicy>;
    return TruncatedSkewNormalDensity<R>(Dist(mu, sigma, alpha), DensityInterval<R>(low, high));
}

/**
 * @brief Beta(alpha, beta) rescaled to [0, scale].
 * @throws std::domain_error if alpha, beta (raised by Boost) or scale are not positive.
 */
template<typename R = traits::DataType::DensityField>
ScaledBetaDensity<R> make_scaled_beta_density(R alpha, R beta, R scale) {
    using Dist = boost::math::beta_distribution<R, DensityPolicy>;
    if (!(scale > R(0))) {
        throw std::domain_error("Beta distribution scale must be positive.");
    }
    return ScaledBetaDensity<R>(Dist(alpha, beta), DensityInterval<R>(R(0), scale), scale);
}

} // namespace stats


#endif // DENSITY_BASE_HPP
