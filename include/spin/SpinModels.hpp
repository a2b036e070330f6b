/**
 * @file SpinModels.hpp
 * @brief Joint spin models: magnitude density times orientation density.
 *
 * Spin magnitudes and orientations are assumed independent, so the joint density is the
 * elementwise product of SpinMagnitude.hpp and SpinOrientation.hpp models.
 */
#ifndef SPIN_MODELS_HPP
#define SPIN_MODELS_HPP

#include "SpinMagnitude.hpp"
#include "SpinOrientation.hpp"

namespace spin {

/**
 * @brief Independently and identically distributed spins: beta magnitudes and the
 *        isotropic + truncated-Gaussian tilt mixture, shared by both black holes.
 *
 * @param dataset Must contain "a_1", "a_2", "cos_tilt_1" and "cos_tilt_2".
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> iid_spin(const stats::Dataset<R>& dataset,
                          R xi_spin, R sigma_spin, R amax, R alpha_chi, R beta_chi)
{
    return iid_spin_orientation_gaussian_isotropic<R>(dataset, xi_spin, sigma_spin)
         * iid_spin_magnitude_beta<R>(dataset, amax, alpha_chi, beta_chi);
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> independent_spin(const stats::Dataset<R>& dataset,
                                  R xi_spin, R sigma_1, R sigma_2,
                                  R alpha_chi_1, R alpha_chi_2,
                                  R beta_chi_1, R beta_chi_2,
                                  R amax_1, R amax_2)
{
    return independent_spin_orientation_gaussian_isotropic<R>(dataset, xi_spin, sigma_1, sigma_2)
         * independent_spin_magnitude_beta<R>(dataset, alpha_chi_1, alpha_chi_2,
                                              beta_chi_1, beta_chi_2, amax_1, amax_2);
}

} // namespace spin

#endif // SPIN_MODELS_HPP
