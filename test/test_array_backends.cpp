#include <catch2/catch.hpp>

#include "../include/backend/ArrayBackendHolder.hpp"
#include "../include/quadrature/GridQuadrature.hpp"

#include <Eigen/Core>

#include <cmath>
#include <stdexcept>

using Array = traits::DataType::StoringArray;
using Grid = traits::DataType::StoringGrid;

TEST_CASE("Test array backends", "[backend]")
{
   for (const auto type : {traits::BackendType::Eigen, traits::BackendType::OpenMP}) {
      const backend::ArrayBackendHolder<double> holder(type);

      SECTION("linspace includes both end points for " + traits::to_string(type))
      {
         const Array x = holder.linspace(0., 1., 5);

         REQUIRE(x.size() == 5);
         CHECK(x(0) == 0.);
         CHECK(x(2) == Approx(0.5));
         CHECK(x(4) == 1.);
      }

      SECTION("meshgrid uses xy indexing for " + traits::to_string(type))
      {
         const Array x = holder.linspace(-1., 1., 4);
         const Array y = holder.linspace(0., 1., 3);
         const auto [X, Y] = holder.meshgrid(x, y);

         REQUIRE(X.rows() == 3);
         REQUIRE(X.cols() == 4);
         REQUIRE(Y.rows() == 3);
         REQUIRE(Y.cols() == 4);
         for (Eigen::Index i = 0; i < 3; ++i) {
            for (Eigen::Index j = 0; j < 4; ++j) {
               CHECK(X(i, j) == x(j));
               CHECK(Y(i, j) == y(i));
            }
         }
      }

      SECTION("trapz is exact for linear integrands for " + traits::to_string(type))
      {
         const double tolerance = 1.0e-12;
         const Array x = holder.linspace(0., 2., 11);
         const Array y = 3. * x + 1.;

         CHECK(std::abs(holder.trapz(y, x) - 8.) < tolerance);
      }

      SECTION("trapz integrates grids along either axis for " + traits::to_string(type))
      {
         const double tolerance = 1.0e-12;
         const Array x = holder.linspace(0., 1., 6);
         const Array y = holder.linspace(0., 2., 5);
         const auto [X, Y] = holder.meshgrid(x, y);
         const Grid values = X + Y;

         const Array over_x = holder.trapz(values, x, traits::Axis::Columns);
         REQUIRE(over_x.size() == y.size());
         for (Eigen::Index i = 0; i < y.size(); ++i) {
            CHECK(std::abs(over_x(i) - (0.5 + y(i))) < tolerance);
         }

         const Array over_y = holder.trapz(values, y, traits::Axis::Rows);
         REQUIRE(over_y.size() == x.size());
         for (Eigen::Index j = 0; j < x.size(); ++j) {
            CHECK(std::abs(over_y(j) - (2. * x(j) + 2.)) < tolerance);
         }
      }

      SECTION("trapz rejects mismatched sizes for " + traits::to_string(type))
      {
         const Array x = holder.linspace(0., 1., 4);
         const Array y = Array::Ones(5);

         REQUIRE_THROWS_AS(holder.trapz(y, x), std::invalid_argument);
         REQUIRE_THROWS_AS(holder.trapz(Grid::Ones(2, 5), x, traits::Axis::Columns), std::invalid_argument);
      }

      SECTION("map applies the function and propagates its exceptions for " + traits::to_string(type))
      {
         const Array x = holder.linspace(0., 1., 101);
         const Array squared = holder.map(x, [](double v) { return v * v; });

         CHECK(squared.isApprox(x.square()));
         REQUIRE_THROWS_AS(holder.map(x, [](double v) -> double {
            if (v > 0.5) throw std::domain_error("out of range");
            return v;
         }), std::domain_error);
      }
   }
}

TEST_CASE("Test array backend holder semantics", "[backend]")
{
   SECTION("Copies keep the backend type")
   {
      const backend::ArrayBackendHolder<double> original(traits::BackendType::OpenMP);
      const backend::ArrayBackendHolder<double> copy(original);

      CHECK(copy.is_initialized());
      CHECK(copy.type() == traits::BackendType::OpenMP);
   }

   SECTION("Default active backend is Eigen")
   {
      CHECK(backend::active_backend<double>().type() == traits::BackendType::Eigen);
   }
}

TEST_CASE("Test two-dimensional grid quadrature", "[quadrature]")
{
   SECTION("Effective spin grid has the fixed resolution")
   {
      const auto grid = quadrature::make_effective_spin_grid<double>();

      CHECK(grid.x().size() == 500);
      CHECK(grid.y().size() == 250);
      CHECK(grid.x_mesh().rows() == 250);
      CHECK(grid.x_mesh().cols() == 500);
      CHECK(grid.x()(0) == -1.);
      CHECK(grid.x()(499) == 1.);
      CHECK(grid.y()(0) == 0.);
      CHECK(grid.y()(249) == 1.);
   }

   SECTION("Bilinear integrands are integrated exactly")
   {
      const double tolerance = 1.0e-10;
      const auto grid = quadrature::make_effective_spin_grid<double>();

      CHECK(std::abs(grid.integrate(Grid::Ones(250, 500)) - 2.) < tolerance);

      const Grid values = (grid.x_mesh() + 1.) * grid.y_mesh();
      CHECK(std::abs(grid.integrate(values) - 1.) < tolerance);
   }

   SECTION("Rejects malformed grids and values")
   {
      REQUIRE_THROWS_AS(quadrature::GridQuadrature2D<double>(0., 1., 1, 0., 1., 10), std::invalid_argument);
      REQUIRE_THROWS_AS(quadrature::GridQuadrature2D<double>(1., 1., 10, 0., 1., 10), std::invalid_argument);

      const quadrature::GridQuadrature2D<double> grid(0., 1., 10, 0., 1., 20);
      REQUIRE_THROWS_AS(grid.integrate(Grid::Ones(10, 20)), std::invalid_argument);
   }
}
