/**
 * @file ArrayBackendHolder.hpp
 * @brief Defines the ArrayBackendHolder class, a type-erased holder for the array backends,
 *        and the process-wide active backend used by every density model.
 *
 * The holder acts as a runtime-polymorphic wrapper around the IArrayBackend implementations,
 * selected via traits::BackendType. Deep copy and move semantics are implemented, and every
 * capability of the interface is forwarded.
 *
 * The active backend is resolved once at startup through set_active_backend(); the density
 * models only read it. Calling set_active_backend() while other threads evaluate densities is
 * not supported.
 *
 */
#ifndef ARRAY_BACKEND_HOLDER_HPP
#define ARRAY_BACKEND_HOLDER_HPP

#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include "ArrayBackends.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace backend {

/**
 * @brief A holder class for the different array backends.
 *
 * @tparam R The floating-point type used by the backend (e.g., double).
 */
template<typename R>
class ArrayBackendHolder {
private:
    std::unique_ptr<IArrayBackend<R>> p_backend_;

public:
    using Array = typename IArrayBackend<R>::Array;
    using Grid = typename IArrayBackend<R>::Grid;

    /**
     * @brief Constructor selecting the backend based on enum.
     *
     * @param type The enum value specifying which backend to use.
     * @throws std::invalid_argument If an unsupported backend type is specified.
     */
    explicit ArrayBackendHolder(traits::BackendType type = traits::BackendType::Eigen) {
        switch (type) {
            case traits::BackendType::Eigen:
                p_backend_ = std::make_unique<EigenArrayBackend<R>>();
                break;
            case traits::BackendType::OpenMP:
                p_backend_ = std::make_unique<OpenMPArrayBackend<R>>();
                break;
            default:
                throw std::invalid_argument("Unsupported BackendType specified.");
        }
    }

    ArrayBackendHolder(const ArrayBackendHolder& other)
        : p_backend_(other.p_backend_ ? other.p_backend_->clone() : nullptr) {}

    ArrayBackendHolder& operator=(const ArrayBackendHolder& other) {
        if (this != &other) {
            p_backend_ = other.p_backend_ ? other.p_backend_->clone() : nullptr;
        }
        return *this;
    }

    ArrayBackendHolder(ArrayBackendHolder&& other) noexcept = default;
    ArrayBackendHolder& operator=(ArrayBackendHolder&& other) noexcept = default;

    Array linspace(R start, R stop, Eigen::Index count) const {
        return get().linspace(start, stop, count);
    }

    std::pair<Grid, Grid> meshgrid(const Array& x, const Array& y) const {
        return get().meshgrid(x, y);
    }

    R trapz(const Array& y, const Array& x) const {
        return get().trapz(y, x);
    }

    Array trapz(const Grid& y, const Array& x, traits::Axis axis) const {
        return get().trapz(y, x, axis);
    }

    Array map(const Array& x, const std::function<R(R)>& f) const {
        return get().map(x, f);
    }

    traits::BackendType type() const {
        return get().type();
    }

    bool is_initialized() const {
        return p_backend_ != nullptr;
    }

private:
    const IArrayBackend<R>& get() const {
        if (!p_backend_) {
            throw std::runtime_error("ArrayBackendHolder is not initialized with a backend.");
        }
        return *p_backend_;
    }
};

namespace detail {
template<typename R>
ArrayBackendHolder<R>& active_backend_storage() {
    static ArrayBackendHolder<R> holder(traits::BackendType::Eigen);
    return holder;
}
} // namespace detail

/**
 * @brief The backend every density model evaluates with. Defaults to the Eigen backend.
 */
template<typename R = traits::DataType::DensityField>
const ArrayBackendHolder<R>& active_backend() {
    return detail::active_backend_storage<R>();
}

/**
 * @brief Selects the process-wide backend. Intended to be called once at startup.
 *
 * Requesting the OpenMP backend from a build without OpenMP support activates the Eigen
 * backend instead and prints a warning.
 */
template<typename R = traits::DataType::DensityField>
void set_active_backend(traits::BackendType type) {
#ifndef _OPENMP
    if (type == traits::BackendType::OpenMP) {
        std::cerr << "Warning: OpenMP backend requested but SPINPOP was built without OpenMP. "
                  << "Using the Eigen backend." << std::endl;
        type = traits::BackendType::Eigen;
    }
#endif
    detail::active_backend_storage<R>() = ArrayBackendHolder<R>(type);
}

} // namespace backend
#endif // ARRAY_BACKEND_HOLDER_HPP
