/*!
 * @file SPINPOP_traits.hpp
 * @brief Defines core type traits, enumerations, and constants for the SPINPOP library.
 *
 * This header provides essential type definitions and enumerations used throughout the SPINPOP library,
 * including Eigen-based array and grid types, backend and quadrature selectors, spline kinds,
 * and the fixed resolutions of the normalization grids.
 */

#ifndef SPINPOP_TRAITS_HPP
#define SPINPOP_TRAITS_HPP

#include <Eigen/Dense>
#include <string>
#include <string_view>
#include <stdexcept>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type traits, type aliases, and enumerations used across the SPINPOP library.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for commonly used array structures in SPINPOP.
 *
 * Per-sample data (dataset columns and density results) are column arrays; quadrature meshes are
 * row-major 2-D arrays whose rows follow the second coordinate and columns the first one.
 */
struct DataType
{
public:
    using DensityField = double;  ///< Scalar field used for all density evaluations (default: double).

    using StoringArray = Eigen::Array<DensityField, Eigen::Dynamic, 1>; ///< Dynamic-size array for element-wise operations.

    using StoringGrid = Eigen::Array<DensityField, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>; ///< Dynamic-size 2-D array (mesh).

};

/*!
 * @brief Templated counterparts of DataType for a generic floating point type.
 */
template <typename R>
using Array = Eigen::Array<R, Eigen::Dynamic, 1>;

template <typename R>
using Grid = Eigen::Array<R, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/*!
 * @struct GridConstants
 * @brief Fixed quadrature resolutions.
 */
struct GridConstants
{
    static constexpr Eigen::Index chi_eff_points = 500;     ///< Points on chi_eff in [-1, 1].
    static constexpr Eigen::Index chi_p_points = 250;       ///< Points on chi_p in [0, 1].
    static constexpr Eigen::Index spline_norm_points = 1000; ///< Points used to normalize interpolated densities.
};

/*!
 * @enum BackendType
 * @brief Array backends able to execute the density kernels.
 */
enum class BackendType
{
    Eigen,  ///< Serial, vectorized Eigen execution.
    OpenMP  ///< Multi-threaded execution of maps and reductions.
};

/*!
 * @enum QuadratureMethod
 * @brief Adaptive 1-D integration techniques.
 */
enum class QuadratureMethod
{
    TanhSinh, ///< Tanh-Sinh quadrature (Boost.Math).
    QAGS      ///< Adaptive Gauss-Kronrod with extrapolation (GSL).
};

/*!
 * @enum NormalizationMethod
 * @brief Strategies for normalizing interpolated densities.
 */
enum class NormalizationMethod
{
    Trapezoid, ///< Trapezoidal rule on a fixed grid of GridConstants::spline_norm_points.
    TanhSinh,  ///< Adaptive tanh-sinh over the node range.
    QAGS       ///< Adaptive GSL QAGS over the node range.
};

/*!
 * @enum InterpolationKind
 * @brief Degree of the B-spline interpolating the node values.
 */
enum class InterpolationKind
{
    Linear = 1,
    Quadratic = 2,
    Cubic = 3
};

/*!
 * @enum Axis
 * @brief Axis of a StoringGrid. Columns follows the first mesh coordinate, Rows the second.
 */
enum class Axis
{
    Rows,
    Columns
};

/*!
 * @brief Parses an interpolation kind from its conventional name ("linear", "quadratic", "cubic").
 * @throws std::invalid_argument for unknown names.
 */
inline InterpolationKind interpolation_kind_from_string(std::string_view name)
{
    if (name == "linear") return InterpolationKind::Linear;
    if (name == "quadratic") return InterpolationKind::Quadratic;
    if (name == "cubic") return InterpolationKind::Cubic;
    throw std::invalid_argument("Unknown interpolation kind: " + std::string(name));
}

inline std::string to_string(BackendType type)
{
    switch (type) {
        case BackendType::Eigen: return "Eigen";
        case BackendType::OpenMP: return "OpenMP";
    }
    return "Unknown";
}

} // namespace traits

#endif // SPINPOP_TRAITS_HPP
