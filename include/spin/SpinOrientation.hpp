/**
 * @file SpinOrientation.hpp
 * @brief Isotropic + preferentially aligned mixture for the spin tilts.
 *
 * p(z_1, z_2 | xi, sigma_1, sigma_2) = (1 - xi) / 4 + xi * N(z_1; 1, sigma_1, [-1, 1]) * N(z_2; 1, sigma_2, [-1, 1])
 *
 * where z_i = cos(tilt_i) and N is a truncated normal. The isotropic component is the uniform
 * density 1/4 on [-1, 1]^2. The aligned component draws both tilts in the same mixture draw, so
 * it is weighted by xi, not xi^2. See https://arxiv.org/abs/1704.08370 Eq. (4).
 */
#ifndef SPIN_ORIENTATION_HPP
#define SPIN_ORIENTATION_HPP

#include "../stats/Dataset.hpp"
#include "../stats/Primitives.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace spin {

/**
 * @param dataset Must contain "cos_tilt_1" and "cos_tilt_2".
 * @param xi_spin Fraction of binaries in the preferentially aligned component.
 * @param sigma_1 Width of the aligned component for the more massive black hole.
 * @param sigma_2 Width of the aligned component for the less massive black hole.
 */
template<typename R = traits::DataType::DensityField>
traits::Array<R> independent_spin_orientation_gaussian_isotropic(const stats::Dataset<R>& dataset,
                                                                 R xi_spin, R sigma_1, R sigma_2)
{
    const traits::Array<R> aligned = stats::truncnorm<R>(dataset.at("cos_tilt_1"), R(1), sigma_1, R(1), R(-1))
                                   * stats::truncnorm<R>(dataset.at("cos_tilt_2"), R(1), sigma_2, R(1), R(-1));
    return (R(1) - xi_spin) / R(4) + xi_spin * aligned;
}

template<typename R = traits::DataType::DensityField>
traits::Array<R> iid_spin_orientation_gaussian_isotropic(const stats::Dataset<R>& dataset,
                                                         R xi_spin, R sigma_spin)
{
    return independent_spin_orientation_gaussian_isotropic<R>(dataset, xi_spin, sigma_spin, sigma_spin);
}

} // namespace spin

#endif // SPIN_ORIENTATION_HPP
