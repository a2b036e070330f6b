#include <Eigen/Dense>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/backend/ArrayBackendHolder.hpp"
#include "../include/spin/InterpolatedDensity.hpp"
#include "../include/spin/ModelRegistry.hpp"
#include "../include/stats/Dataset.hpp"

using R = traits::DataType::DensityField;
using Array = traits::DataType::StoringArray;

int main(int argc, char* argv[]) {
    if (argc > 1 && std::string(argv[1]) == "--openmp") {
        backend::set_active_backend<R>(traits::BackendType::OpenMP);
    }
    std::cout << "Backend: " << traits::to_string(backend::active_backend<R>().type()) << std::endl;

    Array a_1(4), a_2(4), cos_tilt_1(4), cos_tilt_2(4), chi_eff(4), chi_p(4);
    a_1 << 0.5, 0.1, 0.8, 0.3;
    a_2 << 0.3, 0.6, 0.2, 0.9;
    cos_tilt_1 << 1.0, 0.2, -0.5, 0.9;
    cos_tilt_2 << 1.0, -0.8, 0.4, 0.7;
    chi_eff << 0.0, 0.1, -0.2, 1.2;
    chi_p << 0.2, 0.4, 0.1, 0.5;

    const stats::Dataset<R> dataset{{"a_1", a_1}, {"a_2", a_2},
                                    {"cos_tilt_1", cos_tilt_1}, {"cos_tilt_2", cos_tilt_2},
                                    {"chi_eff", chi_eff}, {"chi_p", chi_p}};

    const stats::Hyperparameters<R> hyperparameters{
        {"xi_spin", 0.5}, {"sigma_spin", 0.5}, {"amax", 1.0}, {"alpha_chi", 2.0}, {"beta_chi", 2.0},
        {"sigma_1", 0.5}, {"sigma_2", 0.8},
        {"alpha_chi_1", 2.0}, {"alpha_chi_2", 3.0}, {"beta_chi_1", 2.0}, {"beta_chi_2", 4.0},
        {"amax_1", 1.0}, {"amax_2", 1.0},
        {"mu_chi_eff", 0.0}, {"sigma_chi_eff", 0.2}, {"mu_chi_p", 0.2}, {"sigma_chi_p", 0.2},
        {"skew_chi_eff", 2.0}, {"skew_chi_p", -1.0}, {"rho", 0.5}};

    std::cout << std::setprecision(6);
    for (const auto& name : spin::model_names()) {
        try {
            const Array prob = spin::make_density_model(name)(dataset, hyperparameters);
            std::cout << std::setw(48) << std::left << name << prob.transpose() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << name << " failed: " << e.what() << std::endl;
            return 1;
        }
    }

    stats::Hyperparameters<R> nodes{
        {"a_10", 0.0}, {"a_11", 0.25}, {"a_12", 0.5}, {"a_13", 0.75}, {"a_14", 1.0},
        {"fa_10", 0.0}, {"fa_11", 0.5}, {"fa_12", 0.8}, {"fa_13", 0.3}, {"fa_14", -0.5}};
    spin::InterpolatedDensity<R> spline(spin::spline_spin_magnitude_identical<R>());
    std::cout << std::setw(48) << std::left << "spline_spin_magnitude_identical"
              << spline(dataset, nodes).transpose() << std::endl;
    return 0;
}
