#include <catch2/catch.hpp>

#include "../include/spin/EffectiveSpin.hpp"
#include "../include/spin/ModelRegistry.hpp"
#include "../include/spin/SpinModels.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <stdexcept>
#include <string>

using Array = traits::DataType::StoringArray;

namespace {
stats::Dataset<double> all_parameters()
{
   Array a_1(3), a_2(3), cos_tilt_1(3), cos_tilt_2(3), chi_eff(3), chi_p(3);
   a_1 << 0.5, 0.1, 0.9;
   a_2 << 0.3, 0.6, 0.2;
   cos_tilt_1 << 1., -0.2, 0.6;
   cos_tilt_2 << 1., 0.4, -0.9;
   chi_eff << 0., 0.3, -0.5;
   chi_p << 0.2, 0.7, 0.05;
   return {{"a_1", a_1}, {"a_2", a_2}, {"cos_tilt_1", cos_tilt_1}, {"cos_tilt_2", cos_tilt_2},
           {"chi_eff", chi_eff}, {"chi_p", chi_p}};
}

stats::Hyperparameters<double> all_hyperparameters()
{
   return {{"xi_spin", 0.5}, {"sigma_spin", 0.5}, {"amax", 1.}, {"alpha_chi", 2.}, {"beta_chi", 2.},
           {"sigma_1", 0.4}, {"sigma_2", 0.7}, {"alpha_chi_1", 2.}, {"alpha_chi_2", 3.},
           {"beta_chi_1", 1.5}, {"beta_chi_2", 4.}, {"amax_1", 1.}, {"amax_2", 0.95},
           {"mu_chi_eff", 0.}, {"sigma_chi_eff", 0.2}, {"mu_chi_p", 0.2}, {"sigma_chi_p", 0.2},
           {"skew_chi_eff", 1.5}, {"skew_chi_p", -0.5}, {"rho", 0.5}};
}
} // namespace

TEST_CASE("Test density model registry", "[registry]")
{
   const auto data = all_parameters();
   const auto params = all_hyperparameters();

   SECTION("Every registered model evaluates to a non-negative density per sample")
   {
      const auto names = spin::model_names();

      CHECK(names.size() == 12);
      CHECK(std::is_sorted(names.begin(), names.end()));
      for (const auto& name : names) {
         INFO(name);
         const Array prob = spin::make_density_model(name)(data, params);
         CHECK(prob.size() == data.size());
         CHECK((prob >= 0.).all());
         CHECK(prob.allFinite());
      }
   }

   SECTION("Registered models forward their hyperparameters by name")
   {
      CHECK((spin::make_density_model("iid_spin")(data, params)
             == spin::iid_spin<double>(data, 0.5, 0.5, 1., 2., 2.)).all());
      CHECK((spin::make_density_model("independent_spin_magnitude_beta")(data, params)
             == spin::independent_spin_magnitude_beta<double>(data, 2., 3., 1.5, 4., 1., 0.95)).all());
      CHECK((spin::make_density_model("independent_spin_orientation_gaussian_isotropic")(data, params)
             == spin::independent_spin_orientation_gaussian_isotropic<double>(data, 0.5, 0.4, 0.7)).all());
      CHECK((spin::make_density_model("gaussian_chi_p_chi_eff_skew")(data, params)
             == spin::gaussian_chi_p_chi_eff_skew<double>(data, 0., 0.2, 0.2, 0.2, 1.5, -0.5, 0.5)).all());
   }

   SECTION("Spin magnitude defaults to the uniform density")
   {
      const Array prob = spin::make_density_model("iid_spin_magnitude_beta")(data, {});

      CHECK(((prob - 1.).abs() < 1.0e-12).all());
   }

   SECTION("Unknown models and missing hyperparameters are rejected")
   {
      REQUIRE_THROWS_AS(spin::make_density_model("power_law_spin"), std::invalid_argument);

      auto partial = params;
      partial.erase("rho");
      REQUIRE_THROWS_AS(spin::make_density_model("gaussian_chi_p_chi_eff")(data, partial),
                        stats::MissingParameterError);
      REQUIRE_THROWS_WITH(spin::make_density_model("gaussian_chi_p_chi_eff")(data, partial),
                          Catch::Contains("rho"));
   }
}
