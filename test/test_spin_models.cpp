#include <catch2/catch.hpp>

#include "../include/spin/SpinModels.hpp"

#include <Eigen/Core>

#include <boost/math/distributions/normal.hpp>

#include <cmath>
#include <stdexcept>

using Array = traits::DataType::StoringArray;

namespace {
Array values(std::initializer_list<double> list)
{
   Array result(static_cast<Eigen::Index>(list.size()));
   Eigen::Index i = 0;
   for (const double v : list) result(i++) = v;
   return result;
}

double aligned_peak(double sigma)
{
   const boost::math::normal_distribution<double> normal(1., sigma);
   return boost::math::pdf(normal, 1.) / (boost::math::cdf(normal, 1.) - boost::math::cdf(normal, -1.));
}
} // namespace

TEST_CASE("Test spin magnitude models", "[spin_magnitude]")
{
   SECTION("Product of two Beta(2, 2) densities")
   {
      const double tolerance = 1.0e-12;
      const stats::Dataset<double> data{{"a_1", values({0.5})}, {"a_2", values({0.3})}};

      const Array prob = spin::iid_spin_magnitude_beta<double>(data, 1., 2., 2.);

      REQUIRE(prob.size() == 1);
      CHECK(std::abs(prob(0) - 1.5 * 1.26) < tolerance);
   }

   SECTION("Identical components equal the independent model with equal arguments")
   {
      const stats::Dataset<double> data{{"a_1", values({0.05, 0.4, 0.77, 0.95})},
                                        {"a_2", values({0.6, 0.12, 0.33, 0.01})}};

      const Array iid = spin::iid_spin_magnitude_beta<double>(data, 0.9, 1.7, 3.2);
      const Array independent = spin::independent_spin_magnitude_beta<double>(data, 1.7, 1.7, 3.2, 3.2, 0.9, 0.9);

      CHECK((iid == independent).all());
   }

   SECTION("Defaults give the uniform density")
   {
      const stats::Dataset<double> data{{"a_1", values({0.2, 0.9})}, {"a_2", values({0.5, 0.1})}};

      const Array prob = spin::iid_spin_magnitude_beta<double>(data);

      CHECK(prob(0) == Approx(1.));
      CHECK(prob(1) == Approx(1.));
   }

   SECTION("Magnitudes above the maximum have zero density")
   {
      const stats::Dataset<double> data{{"a_1", values({0.7, 0.2})}, {"a_2", values({0.1, 0.2})}};

      const Array prob = spin::independent_spin_magnitude_beta<double>(data, 2., 2., 2., 2., 0.5, 1.);

      CHECK(prob(0) == 0.);
      CHECK(prob(1) > 0.);
   }

   SECTION("Shape errors propagate unchanged")
   {
      const stats::Dataset<double> data{{"a_1", values({0.5})}, {"a_2", values({0.3})}};

      REQUIRE_THROWS_AS(spin::iid_spin_magnitude_beta<double>(data, 1., -1., 2.), std::domain_error);
   }

   SECTION("Missing magnitudes are reported")
   {
      const stats::Dataset<double> data{{"a_1", values({0.5})}};

      REQUIRE_THROWS_AS(spin::iid_spin_magnitude_beta<double>(data, 1., 2., 2.), stats::MissingParameterError);
   }
}

TEST_CASE("Test spin orientation mixture", "[spin_orientation]")
{
   const stats::Dataset<double> data{{"cos_tilt_1", values({1., -0.4, 0.3, -1.})},
                                     {"cos_tilt_2", values({1., 0.8, -0.9, 0.2})}};

   SECTION("Isotropic limit is uniform on the square")
   {
      const double tolerance = 1.0e-15;

      const Array prob = spin::iid_spin_orientation_gaussian_isotropic<double>(data, 0., 0.5);

      CHECK(((prob - 0.25).abs() < tolerance).all());
   }

   SECTION("Aligned limit is the product of truncated normals")
   {
      const double tolerance = 1.0e-14;

      const Array prob = spin::independent_spin_orientation_gaussian_isotropic<double>(data, 1., 0.5, 0.9);
      const Array expected = stats::truncnorm<double>(data.at("cos_tilt_1"), 1., 0.5, 1., -1.)
                           * stats::truncnorm<double>(data.at("cos_tilt_2"), 1., 0.9, 1., -1.);

      CHECK(((prob - expected).abs() < tolerance).all());
   }

   SECTION("Even mixture at perfect alignment")
   {
      const double tolerance = 1.0e-12;
      const stats::Dataset<double> aligned{{"cos_tilt_1", values({1.})}, {"cos_tilt_2", values({1.})}};

      const Array prob = spin::iid_spin_orientation_gaussian_isotropic<double>(aligned, 0.5, 0.5);
      const double peak = aligned_peak(0.5);

      CHECK(std::abs(prob(0) - (0.5 * 0.25 + 0.5 * peak * peak)) < tolerance);
   }

   SECTION("Mixture integrates to one over the square")
   {
      const double tolerance = 1.0e-4;
      const auto& backend = backend::active_backend<double>();
      const Array z = backend.linspace(-1., 1., 801);
      const auto [z_1, z_2] = backend.meshgrid(z, z);
      const stats::Dataset<double> grid{
         {"cos_tilt_1", Eigen::Map<const Array>(z_1.data(), z_1.size())},
         {"cos_tilt_2", Eigen::Map<const Array>(z_2.data(), z_2.size())}};

      const Array prob = spin::iid_spin_orientation_gaussian_isotropic<double>(grid, 0.3, 0.4);
      const traits::DataType::StoringGrid prob_grid =
         Eigen::Map<const traits::DataType::StoringGrid>(prob.data(), z.size(), z.size());

      const Array inner = backend.trapz(prob_grid, z, traits::Axis::Columns);
      CHECK(std::abs(backend.trapz(inner, z) - 1.) < tolerance);
   }
}

TEST_CASE("Test joint spin models", "[spin]")
{
   const stats::Dataset<double> data{{"a_1", values({0.5, 0.2})}, {"a_2", values({0.3, 0.8})},
                                     {"cos_tilt_1", values({1., -0.3})}, {"cos_tilt_2", values({0.7, 0.1})}};

   SECTION("iid spin is magnitude times orientation")
   {
      const double tolerance = 1.0e-14;

      const Array prob = spin::iid_spin<double>(data, 0.4, 0.6, 1., 2., 3.);
      const Array expected = spin::iid_spin_magnitude_beta<double>(data, 1., 2., 3.)
                           * spin::iid_spin_orientation_gaussian_isotropic<double>(data, 0.4, 0.6);

      CHECK(((prob - expected).abs() < tolerance).all());
   }

   SECTION("Independent spin reduces to iid spin with equal arguments")
   {
      const double tolerance = 1.0e-14;

      const Array iid = spin::iid_spin<double>(data, 0.4, 0.6, 1., 2., 3.);
      const Array independent = spin::independent_spin<double>(data, 0.4, 0.6, 0.6, 2., 2., 3., 3., 1., 1.);

      CHECK(((iid - independent).abs() < tolerance).all());
   }
}
