/**
 * @file ModelRegistry.hpp
 * @brief String-named access to every spin density model.
 *
 * Each registered model is a DensityModel: a callable mapping a dataset and a hyperparameter set
 * to the density at every sample. Hyperparameters are looked up by their conventional names
 * (e.g. "xi_spin", "sigma_chi_eff", "rho") and are required unless stated otherwise.
 *
 * Registered names:
 * - iid_spin, independent_spin
 * - iid_spin_magnitude_beta (amax, alpha_chi, beta_chi default to 1), independent_spin_magnitude_beta
 * - iid_spin_orientation_gaussian_isotropic, independent_spin_orientation_gaussian_isotropic
 * - gaussian_chi_eff, gaussian_chi_p, gaussian_chi_p_chi_eff
 * - skew_gaussian_chi_eff, skew_gaussian_chi_p, gaussian_chi_p_chi_eff_skew
 *
 * Usage Example:
 * @code
 * auto model = spin::make_density_model("gaussian_chi_p_chi_eff");
 * auto prob = model(dataset, {{"mu_chi_eff", 0.0}, {"sigma_chi_eff", 0.1},
 *                             {"mu_chi_p", 0.2}, {"sigma_chi_p", 0.1}, {"rho", 0.5}});
 * @endcode
 */
#ifndef MODEL_REGISTRY_HPP
#define MODEL_REGISTRY_HPP

#include <functional>
#include <string>
#include <vector>
#include "../stats/Dataset.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace spin {

using Field = traits::DataType::DensityField;

template<typename R = Field>
using DensityModel = std::function<traits::Array<R>(const stats::Dataset<R>&, const stats::Hyperparameters<R>&)>;

/**
 * @brief Returns the model registered under @p name.
 * @throws std::invalid_argument for unknown names.
 */
DensityModel<Field> make_density_model(const std::string& name);

/// Registered model names, sorted.
std::vector<std::string> model_names();

} // namespace spin

#endif // MODEL_REGISTRY_HPP
