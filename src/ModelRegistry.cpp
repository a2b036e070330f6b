#include "../include/spin/ModelRegistry.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include "../include/spin/EffectiveSpin.hpp"
#include "../include/spin/SpinModels.hpp"

namespace spin {

namespace {

using stats::require;
using stats::value_or;
using Dataset = stats::Dataset<Field>;
using Hyperparameters = stats::Hyperparameters<Field>;

const std::map<std::string, DensityModel<Field>>& registry() {
    static const std::map<std::string, DensityModel<Field>> models = {
        {"iid_spin", [](const Dataset& data, const Hyperparameters& p) {
            return iid_spin<Field>(data, require(p, "xi_spin"), require(p, "sigma_spin"),
                                   require(p, "amax"), require(p, "alpha_chi"), require(p, "beta_chi"));
        }},
        {"independent_spin", [](const Dataset& data, const Hyperparameters& p) {
            return independent_spin<Field>(data, require(p, "xi_spin"), require(p, "sigma_1"), require(p, "sigma_2"),
                                           require(p, "alpha_chi_1"), require(p, "alpha_chi_2"),
                                           require(p, "beta_chi_1"), require(p, "beta_chi_2"),
                                           require(p, "amax_1"), require(p, "amax_2"));
        }},
        {"iid_spin_magnitude_beta", [](const Dataset& data, const Hyperparameters& p) {
            return iid_spin_magnitude_beta<Field>(data, value_or(p, "amax", 1.0),
                                                  value_or(p, "alpha_chi", 1.0), value_or(p, "beta_chi", 1.0));
        }},
        {"independent_spin_magnitude_beta", [](const Dataset& data, const Hyperparameters& p) {
            return independent_spin_magnitude_beta<Field>(data, require(p, "alpha_chi_1"), require(p, "alpha_chi_2"),
                                                          require(p, "beta_chi_1"), require(p, "beta_chi_2"),
                                                          require(p, "amax_1"), require(p, "amax_2"));
        }},
        {"iid_spin_orientation_gaussian_isotropic", [](const Dataset& data, const Hyperparameters& p) {
            return iid_spin_orientation_gaussian_isotropic<Field>(data, require(p, "xi_spin"), require(p, "sigma_spin"));
        }},
        {"independent_spin_orientation_gaussian_isotropic", [](const Dataset& data, const Hyperparameters& p) {
            return independent_spin_orientation_gaussian_isotropic<Field>(data, require(p, "xi_spin"),
                                                                          require(p, "sigma_1"), require(p, "sigma_2"));
        }},
        {"gaussian_chi_eff", [](const Dataset& data, const Hyperparameters& p) {
            return gaussian_chi_eff<Field>(data, require(p, "mu_chi_eff"), require(p, "sigma_chi_eff"));
        }},
        {"gaussian_chi_p", [](const Dataset& data, const Hyperparameters& p) {
            return gaussian_chi_p<Field>(data, require(p, "mu_chi_p"), require(p, "sigma_chi_p"));
        }},
        {"gaussian_chi_p_chi_eff", [](const Dataset& data, const Hyperparameters& p) {
            return gaussian_chi_p_chi_eff<Field>(data, require(p, "mu_chi_eff"), require(p, "sigma_chi_eff"),
                                                 require(p, "mu_chi_p"), require(p, "sigma_chi_p"), require(p, "rho"));
        }},
        {"skew_gaussian_chi_eff", [](const Dataset& data, const Hyperparameters& p) {
            return skew_gaussian_chi_eff<Field>(data, require(p, "mu_chi_eff"), require(p, "sigma_chi_eff"),
                                                require(p, "skew_chi_eff"));
        }},
        {"skew_gaussian_chi_p", [](const Dataset& data, const Hyperparameters& p) {
            return skew_gaussian_chi_p<Field>(data, require(p, "mu_chi_p"), require(p, "sigma_chi_p"),
                                              require(p, "skew_chi_p"));
        }},
        {"gaussian_chi_p_chi_eff_skew", [](const Dataset& data, const Hyperparameters& p) {
            return gaussian_chi_p_chi_eff_skew<Field>(data, require(p, "mu_chi_eff"), require(p, "sigma_chi_eff"),
                                                      require(p, "mu_chi_p"), require(p, "sigma_chi_p"),
                                                      require(p, "skew_chi_eff"), require(p, "skew_chi_p"),
                                                      require(p, "rho"));
        }},
    };
    return models;
}

} // namespace

DensityModel<Field> make_density_model(const std::string& name) {
    const auto& models = registry();
    auto it = models.find(name);
    if (it == models.end()) {
        throw std::invalid_argument("Unknown spin density model: " + name);
    }
    return it->second;
}

std::vector<std::string> model_names() {
    std::vector<std::string> names;
    for (const auto& entry : registry()) names.push_back(entry.first);
    return names;
}

} // namespace spin
