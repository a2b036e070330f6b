/**
 * @file SpinMagnitude.hpp
 * @brief Beta-distributed spin magnitude models for the two black holes.
 *
 * p(a_1, a_2) = Beta(a_1; alpha_1, beta_1, [0, amax_1]) * Beta(a_2; alpha_2, beta_2, [0, amax_2])
 *
 * Each rescaled beta density integrates to 1 on its own interval, so the product needs no further
 * normalization. See https://arxiv.org/abs/1805.06442 Eq. (10).
 */
#ifndef SPIN_MAGNITUDE_HPP
#define SPIN_MAGNITUDE_HPP

#include "../stats/Dataset.hpp"
#include "../stats/Primitives.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace spin {

/**
 * @brief Independent beta distributions for both spin magnitudes.
 *
 * @param dataset Must contain "a_1" and "a_2".
 * @param alpha_chi_1, beta_chi_1 Beta shape parameters of the more massive black hole.
 * @param alpha_chi_2, beta_chi_2 Beta shape parameters of the less massive black hole.
 * @param amax_1, amax_2 Maximum spin of each black hole.
 * @throws stats::MissingParameterError if a column is absent.
 * @throws std::domain_error for non-positive shape parameters or maxima.
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> independent_spin_magnitude_beta(const stats::Dataset<R>& dataset,
                                                 R alpha_chi_1, R alpha_chi_2,
                                                 R beta_chi_1, R beta_chi_2,
                                                 R amax_1, R amax_2)
{
    return stats::beta_dist<R>(dataset.at("a_1"), alpha_chi_1, beta_chi_1, amax_1)
         * stats::beta_dist<R>(dataset.at("a_2"), alpha_chi_2, beta_chi_2, amax_2);
}

/**
 * @brief Independent and identically distributed beta distributions for both spin magnitudes.
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> iid_spin_magnitude_beta(const stats::Dataset<R>& dataset,
                                         R amax = R(1), R alpha_chi = R(1), R beta_chi = R(1))
{
    return independent_spin_magnitude_beta<R>(dataset, alpha_chi, alpha_chi, beta_chi, beta_chi, amax, amax);
}

} // namespace spin

#endif // SPIN_MAGNITUDE_HPP
