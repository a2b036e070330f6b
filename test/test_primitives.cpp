#include <catch2/catch.hpp>

#include "../include/backend/ArrayBackendHolder.hpp"
#include "../include/stats/BivariateKernels.hpp"
#include "../include/stats/Dataset.hpp"
#include "../include/stats/Primitives.hpp"

#include <Eigen/Core>

#include <boost/math/distributions/normal.hpp>

#include <cmath>
#include <limits>
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

double trapz(const Array& y, const Array& x)
{
   return backend::active_backend<double>().trapz(y, x);
}
} // namespace

TEST_CASE("Test truncated normal density", "[primitives]")
{
   SECTION("Integrates to one over its support")
   {
      const double tolerance = 1.0e-5;
      const Array x = Array::LinSpaced(20001, -1., 1.);

      const Array prob = stats::truncnorm<double>(x, 0.3, 0.4, 1., -1.);

      CHECK(std::abs(trapz(prob, x) - 1.) < tolerance);
   }

   SECTION("Matches the normal density divided by the truncated mass")
   {
      const double tolerance = 1.0e-12;
      const boost::math::normal_distribution<double> normal(1., 0.5);
      const double mass = boost::math::cdf(normal, 1.) - boost::math::cdf(normal, -1.);

      const Array prob = stats::truncnorm<double>(values({1., 0.}), 1., 0.5, 1., -1.);

      CHECK(std::abs(prob(0) - boost::math::pdf(normal, 1.) / mass) < tolerance);
      CHECK(std::abs(prob(1) - boost::math::pdf(normal, 0.) / mass) < tolerance);
   }

   SECTION("Upper-tail masses keep their precision")
   {
      const auto tail = stats::make_truncated_normal_density<double>(0., 0.1, 0.9, 1.);
      const boost::math::normal_distribution<double> normal(0., 0.1);
      const double expected = boost::math::cdf(boost::math::complement(normal, 0.9))
                            - boost::math::cdf(boost::math::complement(normal, 1.));

      CHECK(tail.getMass() > 0.);
      CHECK(tail.getMass() == Approx(expected).epsilon(1.0e-12));
   }

   SECTION("Returns zero outside of the support")
   {
      const Array x = values({-1.5, 1.0000001, std::numeric_limits<double>::quiet_NaN()});

      const Array prob = stats::truncnorm<double>(x, 0., 1., 1., -1.);

      CHECK(prob(0) == 0.);
      CHECK(prob(1) == 0.);
      CHECK(prob(2) == 0.);
   }

   SECTION("Rejects invalid parameters")
   {
      const Array x = values({0.});

      REQUIRE_THROWS_AS(stats::truncnorm<double>(x, 0., 0., 1., -1.), std::domain_error);
      REQUIRE_THROWS_AS(stats::truncnorm<double>(x, 0., -1., 1., -1.), std::domain_error);
      REQUIRE_THROWS_AS(stats::truncnorm<double>(x, 0., 1., -1., 1.), std::invalid_argument);
      REQUIRE_THROWS_AS(stats::truncnorm<double>(x, 50., 0.01, 1., -1.), stats::NormalizationError);
   }
}

TEST_CASE("Test truncated skew normal density", "[primitives]")
{
   SECTION("Reduces to the truncated normal without skew")
   {
      const double tolerance = 1.0e-12;
      const Array x = Array::LinSpaced(11, 0., 1.);

      const Array skewed = stats::truncskewnorm<double>(x, 0.2, 0.3, 0., 1., 0.);
      const Array plain = stats::truncnorm<double>(x, 0.2, 0.3, 1., 0.);

      CHECK(((skewed - plain).abs() < tolerance).all());
   }

   SECTION("Integrates to one over its support")
   {
      const double tolerance = 1.0e-5;
      const Array x = Array::LinSpaced(20001, -1., 1.);

      const Array prob = stats::truncskewnorm<double>(x, 0.1, 0.3, 3., 1., -1.);

      CHECK(std::abs(trapz(prob, x) - 1.) < tolerance);
   }

   SECTION("Positive skew moves mass above the location")
   {
      const Array x = values({-0.2, 0.2});

      const Array prob = stats::truncskewnorm<double>(x, 0., 0.3, 4., 1., -1.);

      CHECK(prob(1) > prob(0));
   }
}

TEST_CASE("Test scaled beta density", "[primitives]")
{
   SECTION("Beta(2, 2) on the unit interval")
   {
      const double tolerance = 1.0e-12;

      const Array prob = stats::beta_dist<double>(values({0.5, 0.3}), 2., 2., 1.);

      CHECK(std::abs(prob(0) - 1.5) < tolerance);
      CHECK(std::abs(prob(1) - 1.26) < tolerance);
   }

   SECTION("Rescaling to [0, scale] keeps unit mass")
   {
      const double tolerance = 1.0e-12;

      const Array prob = stats::beta_dist<double>(values({0.1, 0.4, 0.6}), 1., 1., 0.5);

      CHECK(std::abs(prob(0) - 2.) < tolerance);
      CHECK(std::abs(prob(1) - 2.) < tolerance);
      CHECK(prob(2) == 0.);
   }

   SECTION("Rejects non-positive shapes and scales")
   {
      const Array x = values({0.5});

      REQUIRE_THROWS_AS(stats::beta_dist<double>(x, 0., 2., 1.), std::domain_error);
      REQUIRE_THROWS_AS(stats::beta_dist<double>(x, 2., -1., 1.), std::domain_error);
      REQUIRE_THROWS_AS(stats::beta_dist<double>(x, 2., 2., 0.), std::domain_error);
   }
}

TEST_CASE("Test unnormalized bivariate kernels", "[primitives]")
{
   SECTION("Gaussian kernel peaks at one on the mean")
   {
      const Array x = values({0.1});
      const Array y = values({0.3});

      const Array kernel = stats::unnormalized_2d_gaussian(x, y, 0.1, 0.3, 0.2, 0.4, 0.7);

      CHECK(kernel(0) == Approx(1.));
   }

   SECTION("Gaussian kernel separates without correlation")
   {
      const double tolerance = 1.0e-14;
      const Array x = values({-0.3, 0.5, 0.9});
      const Array y = values({0.1, 0.7, 0.2});

      const Array kernel = stats::unnormalized_2d_gaussian(x, y, 0., 0.2, 0.3, 0.1, 0.);
      const Array expected = (-0.5 * ((x / 0.3).square() + ((y - 0.2) / 0.1).square())).exp();

      CHECK(((kernel - expected).abs() < tolerance).all());
   }

   SECTION("Correlation favours samples along the diagonal")
   {
      const Array x = values({0.2, 0.2});
      const Array y = values({0.2, -0.2});

      const Array kernel = stats::unnormalized_2d_gaussian(x, y, 0., 0., 0.2, 0.2, 0.6);

      CHECK(kernel(0) > kernel(1));
   }

   SECTION("Skew kernel reduces to the Gaussian kernel without skew")
   {
      const double tolerance = 1.0e-14;
      const Array x = values({-0.3, 0.5});
      const Array y = values({0.1, 0.7});

      const Array skew = stats::unnormalized_2d_skew_gaussian(x, y, 0., 0.2, 0.3, 0.1, 0., 0., 0.4);
      const Array plain = stats::unnormalized_2d_gaussian(x, y, 0., 0.2, 0.3, 0.1, 0.4);

      CHECK(((skew - plain).abs() < tolerance).all());
   }

   SECTION("Rejects invalid widths and correlations")
   {
      const Array x = values({0.});

      REQUIRE_THROWS_AS(stats::unnormalized_2d_gaussian(x, x, 0., 0., 0., 1., 0.), std::domain_error);
      REQUIRE_THROWS_AS(stats::unnormalized_2d_gaussian(x, x, 0., 0., 1., 1., 1.), std::domain_error);
      REQUIRE_THROWS_AS(stats::unnormalized_2d_skew_gaussian(x, x, 0., 0., 1., 1., 1., 1., -1.2), std::domain_error);
   }
}

TEST_CASE("Test dataset and hyperparameter access", "[dataset]")
{
   SECTION("Missing columns and hyperparameters are reported by name")
   {
      const stats::Dataset<double> data{{"a_1", values({0.1, 0.2})}};
      const stats::Hyperparameters<double> params{{"amax", 1.}};

      CHECK(data.size() == 2);
      CHECK(data.contains("a_1"));
      REQUIRE_THROWS_AS(data.at("a_2"), stats::MissingParameterError);
      REQUIRE_THROWS_AS(data.at("a_2"), std::out_of_range);
      REQUIRE_THROWS_WITH(stats::require(params, "alpha_chi"), Catch::Contains("alpha_chi"));
      CHECK(stats::value_or(params, "alpha_chi", 2.) == 2.);
      CHECK(stats::require(params, "amax") == 1.);
   }

   SECTION("Columns must share one length")
   {
      stats::Dataset<double> data{{"a_1", values({0.1, 0.2})}};

      REQUIRE_THROWS_AS(data.insert("a_2", values({0.1})), std::invalid_argument);
      data.insert("a_1", values({0.4, 0.5}));
      CHECK(data.at("a_1")(1) == 0.5);
   }
}
