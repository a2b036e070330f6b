/**
 * @file ArrayBackends.hpp
 * @brief Provides the concrete array backends behind the IArrayBackend interface.
 *
 * This header defines two backends:
 * - backend::EigenArrayBackend: serial execution relying on Eigen's vectorized expressions.
 * - backend::OpenMPArrayBackend: multi-threaded execution of element-wise maps and of the
 *   per-row/per-column reductions of grid integrals.
 *
 * Both operate on host-resident Eigen arrays and produce identical results up to the
 * summation order of the reductions.
 *
 * Dependencies:
 * - Eigen for array storage and expressions.
 * - OpenMP for the parallel backend.
 */
#ifndef ARRAY_BACKENDS_HPP
#define ARRAY_BACKENDS_HPP

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include "ArrayBackendAbstract.hpp"

namespace backend {

namespace detail {

template<typename R>
void check_trapz_sizes(Eigen::Index n_values, Eigen::Index n_coordinates) {
    if (n_values != n_coordinates) {
        throw std::invalid_argument("trapz: " + std::to_string(n_values) + " samples for "
                                    + std::to_string(n_coordinates) + " coordinates.");
    }
}

template<typename R>
traits::Array<R> linspace(R start, R stop, Eigen::Index count) {
    if (count < 0) {
        throw std::invalid_argument("linspace: negative number of samples.");
    }
    return traits::Array<R>::LinSpaced(count, start, stop);
}

template<typename R>
std::pair<traits::Grid<R>, traits::Grid<R>> meshgrid(const traits::Array<R>& x, const traits::Array<R>& y) {
    traits::Grid<R> X = x.transpose().replicate(y.size(), 1);
    traits::Grid<R> Y = y.replicate(1, x.size());
    return {std::move(X), std::move(Y)};
}

template<typename R>
R trapz(const traits::Array<R>& y, const traits::Array<R>& x) {
    check_trapz_sizes<R>(y.size(), x.size());
    const Eigen::Index n = y.size();
    if (n < 2) return R(0);
    return (R(0.5) * (y.head(n - 1) + y.tail(n - 1)) * (x.tail(n - 1) - x.head(n - 1))).sum();
}

} // namespace detail

/**
 * @class EigenArrayBackend
 * @tparam R The floating-point type (e.g., double).
 * @brief Serial backend. Grid integrals are evaluated as matrix-vector products.
 */
template<typename R = traits::DataType::DensityField>
class EigenArrayBackend final : public IArrayBackend<R> {
public:
    using typename IArrayBackend<R>::Array;
    using typename IArrayBackend<R>::Grid;

    Array linspace(R start, R stop, Eigen::Index count) const override {
        return detail::linspace<R>(start, stop, count);
    }

    std::pair<Grid, Grid> meshgrid(const Array& x, const Array& y) const override {
        return detail::meshgrid<R>(x, y);
    }

    R trapz(const Array& y, const Array& x) const override {
        return detail::trapz<R>(y, x);
    }

    Array trapz(const Grid& y, const Array& x, traits::Axis axis) const override {
        const Eigen::Index n = x.size();
        if (axis == traits::Axis::Columns) {
            detail::check_trapz_sizes<R>(y.cols(), n);
            if (n < 2) return Array::Zero(y.rows());
            const Eigen::Matrix<R, Eigen::Dynamic, 1> dx = (x.tail(n - 1) - x.head(n - 1)).matrix();
            Grid mid = R(0.5) * (y.leftCols(n - 1) + y.rightCols(n - 1));
            return (mid.matrix() * dx).array();
        }
        detail::check_trapz_sizes<R>(y.rows(), n);
        if (n < 2) return Array::Zero(y.cols());
        const Eigen::Matrix<R, 1, Eigen::Dynamic> dx = (x.tail(n - 1) - x.head(n - 1)).matrix().transpose();
        Grid mid = R(0.5) * (y.topRows(n - 1) + y.bottomRows(n - 1));
        return (dx * mid.matrix()).transpose().array();
    }

    Array map(const Array& x, const std::function<R(R)>& f) const override {
        return x.unaryExpr(f);
    }

    traits::BackendType type() const noexcept override { return traits::BackendType::Eigen; }

    std::unique_ptr<IArrayBackend<R>> clone() const override {
        return std::make_unique<EigenArrayBackend<R>>(*this);
    }
};

/**
 * @class OpenMPArrayBackend
 * @tparam R The floating-point type (e.g., double).
 * @brief Multi-threaded backend. Each thread owns a disjoint slice of the output, so no
 *        synchronization is needed beyond the implicit barrier of the parallel loop.
 *
 * Exceptions thrown by a mapped function are captured inside the parallel region and
 * rethrown on the calling thread once the loop completes.
 */
template<typename R = traits::DataType::DensityField>
class OpenMPArrayBackend final : public IArrayBackend<R> {
public:
    using typename IArrayBackend<R>::Array;
    using typename IArrayBackend<R>::Grid;

    Array linspace(R start, R stop, Eigen::Index count) const override {
        return detail::linspace<R>(start, stop, count);
    }

    std::pair<Grid, Grid> meshgrid(const Array& x, const Array& y) const override {
        return detail::meshgrid<R>(x, y);
    }

    R trapz(const Array& y, const Array& x) const override {
        return detail::trapz<R>(y, x);
    }

    Array trapz(const Grid& y, const Array& x, traits::Axis axis) const override {
        const Eigen::Index n = x.size();
        const bool along_columns = (axis == traits::Axis::Columns);
        detail::check_trapz_sizes<R>(along_columns ? y.cols() : y.rows(), n);

        const Eigen::Index n_out = along_columns ? y.rows() : y.cols();
        Array result = Array::Zero(n_out);
        if (n < 2) return result;

        #pragma omp parallel for schedule(static)
        for (Eigen::Index k = 0; k < n_out; ++k) {
            R sum = R(0);
            for (Eigen::Index i = 0; i + 1 < n; ++i) {
                const R lo = along_columns ? y(k, i) : y(i, k);
                const R hi = along_columns ? y(k, i + 1) : y(i + 1, k);
                sum += R(0.5) * (lo + hi) * (x(i + 1) - x(i));
            }
            result(k) = sum;
        }
        return result;
    }

    Array map(const Array& x, const std::function<R(R)>& f) const override {
        Array result(x.size());
        std::exception_ptr error = nullptr;

        #pragma omp parallel for schedule(static)
        for (Eigen::Index i = 0; i < x.size(); ++i) {
            try {
                result(i) = f(x(i));
            } catch (...) {
                #pragma omp critical(spinpop_backend_error)
                {
                    if (!error) error = std::current_exception();
                }
            }
        }
        if (error) {
            std::rethrow_exception(error);
        }
        return result;
    }

    traits::BackendType type() const noexcept override { return traits::BackendType::OpenMP; }

    std::unique_ptr<IArrayBackend<R>> clone() const override {
        return std::make_unique<OpenMPArrayBackend<R>>(*this);
    }
};

} // namespace backend
#endif // ARRAY_BACKENDS_HPP
