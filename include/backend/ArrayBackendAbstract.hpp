/**
 * @file ArrayBackendAbstract.hpp
 * @brief Defines the abstract interface for array backends.
 *
 * This file declares the IArrayBackend interface, the capability set every density model is
 * written against: grid construction (linspace, meshgrid), trapezoidal integration and
 * element-wise application of scalar functions. Element-wise arithmetic and boolean masks are
 * plain Eigen array expressions and behave identically for every backend.
 * The interface enables polymorphic copying of backend objects.
 *
 */
#ifndef I_ARRAY_BACKEND_HPP
#define I_ARRAY_BACKEND_HPP

#include <functional>
#include <memory>
#include <utility>
#include "../traits/SPINPOP_traits.hpp"

namespace backend {
template<typename R>
class IArrayBackend {
public:
    using Array = traits::Array<R>;
    using Grid = traits::Grid<R>;

    virtual ~IArrayBackend() = default;

    /**
     * @brief Evenly spaced samples over [start, stop], both end points included.
     * @param count Number of samples. Must be non-negative.
     */
    virtual Array linspace(R start, R stop, Eigen::Index count) const = 0;

    /**
     * @brief Coordinate matrices from two coordinate vectors ("xy" indexing).
     * @return Pair (X, Y) of grids with y.size() rows and x.size() columns.
     */
    virtual std::pair<Grid, Grid> meshgrid(const Array& x, const Array& y) const = 0;

    /**
     * @brief Trapezoidal integral of samples y taken at coordinates x.
     * @throws std::invalid_argument if the sizes differ.
     */
    virtual R trapz(const Array& y, const Array& x) const = 0;

    /**
     * @brief Trapezoidal integral of a grid along one axis.
     * @param y Samples on the grid.
     * @param x Coordinates along the integrated axis.
     * @param axis Axis::Columns integrates each row over its columns, Axis::Rows each column over its rows.
     * @return One integral per remaining row (Columns) or column (Rows).
     */
    virtual Array trapz(const Grid& y, const Array& x, traits::Axis axis) const = 0;

    /**
     * @brief Applies a scalar function to every element of x.
     */
    virtual Array map(const Array& x, const std::function<R(R)>& f) const = 0;

    virtual traits::BackendType type() const noexcept = 0;

    /**
     * @brief Creates a copy of the underlying backend object.
     * Needed for value semantics of the ArrayBackendHolder.
     * @return A std::unique_ptr to the new IArrayBackend object.
     */
    virtual std::unique_ptr<IArrayBackend<R>> clone() const = 0;
};
} // namespace backend
#endif // I_ARRAY_BACKEND_HPP
