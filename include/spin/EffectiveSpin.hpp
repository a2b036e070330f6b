/**
 * @file EffectiveSpin.hpp
 * @brief Effective aligned (chi_eff) and precessing (chi_p) spin models, including the
 *        correlated bivariate (skew-)Gaussian with numerical normalization.
 *
 * Marginals are truncated (skew-)normals on chi_eff in [-1, 1] and chi_p in [0, 1].
 *
 * The joint models take a correlation rho between the two parameters, with covariance
 *
 *     Sigma = [[sigma_eff^2,                rho sigma_eff sigma_p],
 *              [rho sigma_eff sigma_p,      sigma_p^2            ]]
 *
 * For rho == 0 the joint density is the product of the marginals. Otherwise the truncated
 * bivariate kernel has no closed-form normalization: it is integrated on the fixed
 * 500 x 250 chi_eff x chi_p grid (quadrature::make_effective_spin_grid) on every call, and samples
 * outside the support are zeroed. See https://arxiv.org/abs/2001.06051 and
 * https://arxiv.org/abs/2010.14533.
 *
 * @section effective_spin_errors Errors
 * - stats::MissingParameterError if "chi_eff" or "chi_p" is absent.
 * - std::domain_error for non-positive widths or |rho| >= 1.
 * - stats::NormalizationError if the grid carries (numerically) no probability mass.
 */
#ifndef EFFECTIVE_SPIN_HPP
#define EFFECTIVE_SPIN_HPP

#include <cmath>
#include <limits>
#include <sstream>
#include "../backend/ArrayBackendHolder.hpp"
#include "../quadrature/GridQuadrature.hpp"
#include "../stats/BivariateKernels.hpp"
#include "../stats/Dataset.hpp"
#include "../stats/Primitives.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace spin {

template<typename R = traits::DataType::DensityField>
traits::Array<R> gaussian_chi_eff(const stats::Dataset<R>& dataset, R mu_chi_eff, R sigma_chi_eff)
{
    return stats::truncnorm<R>(dataset.at("chi_eff"), mu_chi_eff, sigma_chi_eff, R(1), R(-1));
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> gaussian_chi_p(const stats::Dataset<R>& dataset, R mu_chi_p, R sigma_chi_p)
{
    return stats::truncnorm<R>(dataset.at("chi_p"), mu_chi_p, sigma_chi_p, R(1), R(0));
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> skew_gaussian_chi_eff(const stats::Dataset<R>& dataset,
                                       R mu_chi_eff, R sigma_chi_eff, R skew_chi_eff)
{
    return stats::truncskewnorm<R>(dataset.at("chi_eff"), mu_chi_eff, sigma_chi_eff, skew_chi_eff, R(1), R(-1));
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> skew_gaussian_chi_p(const stats::Dataset<R>& dataset,
                                     R mu_chi_p, R sigma_chi_p, R skew_chi_p)
{
    return stats::truncskewnorm<R>(dataset.at("chi_p"), mu_chi_p, sigma_chi_p, skew_chi_p, R(1), R(0));
}

namespace detail {

/**
 * @brief Rejects normalizing constants that cannot be divided by.
 * @throws stats::NormalizationError
 */
template<typename R>
R checked_normalization(R normalization, const char* model) {
    if (!std::isfinite(normalization) || !(normalization >= std::numeric_limits<R>::min())) {
        std::ostringstream msg;
        msg << model << ": degenerate normalization " << normalization
            << " on the chi_eff x chi_p grid.";
        throw stats::NormalizationError(msg.str());
    }
    return normalization;
}

/**
 * @brief Zeroes every sample outside chi_eff in [-1, 1], chi_p in [0, 1], including NaN samples.
 */
template<typename R>
void zero_outside_support(traits::Array<R>& prob, const traits::Array<R>& chi_eff, const traits::Array<R>& chi_p)
{
    prob = ((chi_eff.abs() <= R(1)) && (chi_p >= R(0)) && (chi_p <= R(1))).select(prob, R(0));
}

/**
 * @brief Integral of the bivariate Gaussian kernel over chi_eff in [-1, 1], chi_p in [0, 1].
 */
template<typename R = traits::DataType::DensityField>
R gaussian_normalization(R mu_chi_eff, R sigma_chi_eff, R mu_chi_p, R sigma_chi_p, R rho)
{
    const auto grid = quadrature::make_effective_spin_grid<R>(backend::active_backend<R>());
    const traits::Grid<R> prob_grid = stats::unnormalized_2d_gaussian(
        grid.x_mesh(), grid.y_mesh(), mu_chi_eff, mu_chi_p, sigma_chi_eff, sigma_chi_p, rho);
    return grid.integrate(prob_grid);
}

/**
 * @brief Integral of the bivariate skew-Gaussian kernel over chi_eff in [-1, 1], chi_p in [0, 1].
 */
template<typename R = traits::DataType::DensityField>
R skew_gaussian_normalization(R mu_chi_eff, R sigma_chi_eff, R mu_chi_p, R sigma_chi_p,
                              R skew_chi_eff, R skew_chi_p, R rho)
{
    const auto grid = quadrature::make_effective_spin_grid<R>(backend::active_backend<R>());
    const traits::Grid<R> prob_grid = stats::unnormalized_2d_skew_gaussian(
        grid.x_mesh(), grid.y_mesh(), mu_chi_eff, mu_chi_p, sigma_chi_eff, sigma_chi_p,
        skew_chi_eff, skew_chi_p, rho);
    return grid.integrate(prob_grid);
}

/**
 * @brief Grid-normalized, truncated bivariate Gaussian. Valid for every rho in (-1, 1).
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> normalized_bivariate_gaussian(const stats::Dataset<R>& dataset,
                                               R mu_chi_eff, R sigma_chi_eff,
                                               R mu_chi_p, R sigma_chi_p, R rho)
{
    const auto& chi_eff = dataset.at("chi_eff");
    const auto& chi_p = dataset.at("chi_p");

    traits::Array<R> prob = stats::unnormalized_2d_gaussian(
        chi_eff, chi_p, mu_chi_eff, mu_chi_p, sigma_chi_eff, sigma_chi_p, rho);
    const R normalization = checked_normalization(
        gaussian_normalization<R>(mu_chi_eff, sigma_chi_eff, mu_chi_p, sigma_chi_p, rho),
        "gaussian_chi_p_chi_eff");

    prob /= normalization;
    zero_outside_support<R>(prob, chi_eff, chi_p);
    return prob;
}

/**
 * @brief Grid-normalized, truncated bivariate skew-Gaussian. Valid for every rho in (-1, 1).
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> normalized_bivariate_skew_gaussian(const stats::Dataset<R>& dataset,
                                                    R mu_chi_eff, R sigma_chi_eff,
                                                    R mu_chi_p, R sigma_chi_p,
                                                    R skew_chi_eff, R skew_chi_p, R rho)
{
    const auto& chi_eff = dataset.at("chi_eff");
    const auto& chi_p = dataset.at("chi_p");

    traits::Array<R> prob = stats::unnormalized_2d_skew_gaussian(
        chi_eff, chi_p, mu_chi_eff, mu_chi_p, sigma_chi_eff, sigma_chi_p, skew_chi_eff, skew_chi_p, rho);
    const R normalization = checked_normalization(
        skew_gaussian_normalization<R>(mu_chi_eff, sigma_chi_eff, mu_chi_p, sigma_chi_p,
                                       skew_chi_eff, skew_chi_p, rho),
        "gaussian_chi_p_chi_eff_skew");

    prob /= normalization;
    zero_outside_support<R>(prob, chi_eff, chi_p);
    return prob;
}

} // namespace detail

/**
 * @brief Covariant Gaussian in effective aligned and precessing spins.
 *
 * @param dataset Must contain "chi_eff" and "chi_p".
 * @param mu_chi_eff, sigma_chi_eff Location and width in chi_eff.
 * @param mu_chi_p, sigma_chi_p Location and width in chi_p.
 * @param rho Correlation between the two parameters.
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> gaussian_chi_p_chi_eff(const stats::Dataset<R>& dataset,
                                        R mu_chi_eff, R sigma_chi_eff,
                                        R mu_chi_p, R sigma_chi_p, R rho)
{
    if (rho == R(0)) {
        traits::Array<R> prob = gaussian_chi_eff<R>(dataset, mu_chi_eff, sigma_chi_eff);
        prob *= gaussian_chi_p<R>(dataset, mu_chi_p, sigma_chi_p);
        return prob;
    }
    return detail::normalized_bivariate_gaussian<R>(dataset, mu_chi_eff, sigma_chi_eff,
                                                    mu_chi_p, sigma_chi_p, rho);
}

/**
 * @brief Covariant Gaussian in effective aligned and precessing spins, including skew.
 *
 * @param skew_chi_eff Skewness of the chi_eff distribution.
 * @param skew_chi_p Skewness of the chi_p distribution.
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> gaussian_chi_p_chi_eff_skew(const stats::Dataset<R>& dataset,
                                             R mu_chi_eff, R sigma_chi_eff,
                                             R mu_chi_p, R sigma_chi_p,
                                             R skew_chi_eff, R skew_chi_p, R rho)
{
    if (rho == R(0)) {
        traits::Array<R> prob = skew_gaussian_chi_eff<R>(dataset, mu_chi_eff, sigma_chi_eff, skew_chi_eff);
        prob *= skew_gaussian_chi_p<R>(dataset, mu_chi_p, sigma_chi_p, skew_chi_p);
        return prob;
    }
    return detail::normalized_bivariate_skew_gaussian<R>(dataset, mu_chi_eff, sigma_chi_eff,
                                                         mu_chi_p, sigma_chi_p,
                                                         skew_chi_eff, skew_chi_p, rho);
}

} // namespace spin

#endif // EFFECTIVE_SPIN_HPP
