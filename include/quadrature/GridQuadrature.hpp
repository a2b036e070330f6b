/**
 * @file GridQuadrature.hpp
 * @brief Two-dimensional trapezoidal quadrature on a fixed rectangular grid.
 *
 * GridQuadrature2D builds evenly spaced coordinates along x (first coordinate, mesh columns)
 * and y (second coordinate, mesh rows) and their mesh. integrate() applies nested 1-D
 * trapezoidal rules: first along x for every row, then along y.
 *
 * The default instance used by the effective-spin models spans chi_eff in [-1, 1] with 500
 * points and chi_p in [0, 1] with 250 points. Grids are cheap to rebuild and are created per
 * evaluation; they hold coordinates only, never integrand values.
 *
 * Usage Example:
 * @code
 * quadrature::GridQuadrature2D<double> grid(-1.0, 1.0, 500, 0.0, 1.0, 250);
 * auto values = kernel(grid.x_mesh(), grid.y_mesh());
 * double integral = grid.integrate(values);
 * @endcode
 */
#ifndef GRID_QUADRATURE_HPP
#define GRID_QUADRATURE_HPP

#include <stdexcept>
#include <string>
#include "../backend/ArrayBackendHolder.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace quadrature {

template<typename R = traits::DataType::DensityField>
class GridQuadrature2D {
public:
    using Array = traits::Array<R>;
    using Grid = traits::Grid<R>;

    /**
     * @param x_min, x_max Range of the first coordinate.
     * @param nx Number of points along the first coordinate (at least 2).
     * @param y_min, y_max Range of the second coordinate.
     * @param ny Number of points along the second coordinate (at least 2).
     * @param backend Backend building the grid and evaluating the reductions.
     * @throws std::invalid_argument for empty ranges or fewer than two points.
     */
    GridQuadrature2D(R x_min, R x_max, Eigen::Index nx,
                     R y_min, R y_max, Eigen::Index ny,
                     const backend::ArrayBackendHolder<R>& backend = backend::active_backend<R>())
        : backend_(backend)
    {
        if (nx < 2 || ny < 2) {
            throw std::invalid_argument("GridQuadrature2D needs at least two points per axis, got "
                                        + std::to_string(nx) + "x" + std::to_string(ny) + ".");
        }
        if (!(x_min < x_max) || !(y_min < y_max)) {
            throw std::invalid_argument("GridQuadrature2D needs non-empty coordinate ranges.");
        }
        x_ = backend_.linspace(x_min, x_max, nx);
        y_ = backend_.linspace(y_min, y_max, ny);
        auto [x_mesh, y_mesh] = backend_.meshgrid(x_, y_);
        x_mesh_ = std::move(x_mesh);
        y_mesh_ = std::move(y_mesh);
    }

    /**
     * @brief Nested trapezoidal integral of values sampled on the mesh.
     * @throws std::invalid_argument if the shape of @p values does not match the mesh.
     */
    R integrate(const Grid& values) const {
        if (values.rows() != y_.size() || values.cols() != x_.size()) {
            throw std::invalid_argument("GridQuadrature2D::integrate: values do not match the mesh shape.");
        }
        const Array inner = backend_.trapz(values, x_, traits::Axis::Columns);
        return backend_.trapz(inner, y_);
    }

    const Array& x() const noexcept { return x_; }
    const Array& y() const noexcept { return y_; }
    const Grid& x_mesh() const noexcept { return x_mesh_; }
    const Grid& y_mesh() const noexcept { return y_mesh_; }

private:
    backend::ArrayBackendHolder<R> backend_;
    Array x_;
    Array y_;
    Grid x_mesh_;
    Grid y_mesh_;
};

/**
 * @brief The fixed chi_eff x chi_p grid: 500 points on [-1, 1] by 250 points on [0, 1].
 */
template<typename R = traits::DataType::DensityField>
GridQuadrature2D<R> make_effective_spin_grid(const backend::ArrayBackendHolder<R>& backend = backend::active_backend<R>()) {
    return GridQuadrature2D<R>(R(-1), R(1), traits::GridConstants::chi_eff_points,
                               R(0), R(1), traits::GridConstants::chi_p_points,
                               backend);
}

} // namespace quadrature
#endif // GRID_QUADRATURE_HPP
