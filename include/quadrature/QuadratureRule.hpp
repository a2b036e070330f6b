/**
 * @file QuadratureRule.hpp
 * @brief Adaptive quadrature adapters for Boost.Math and GSL over finite intervals.
 *
 * - quadrature::BoostTanhSinhQuadrature: Boost.Math tanh_sinh, robust to end-point kinks such as
 *   the edges of a spline's node range.
 * - quadrature::GSLQuadrature: GSL QAGS (Gauss-Kronrod 21 with epsilon extrapolation) with a
 *   workspace allocated per call. GSL failures are reported through status codes: the first
 *   GSLQuadrature constructed switches the process-wide GSL error handler off, once, and it is
 *   never restored.
 *
 * Both reject infinite bounds: every density handled by SPINPOP lives on a bounded interval.
 *
 * Usage Example:
 * @code
 * quadrature::GSLQuadrature<double> qags;
 * double mass = qags.integrate([](double x) { return std::exp(-x * x); }, 0.0, 1.0);
 * @endcode
 *
 */
#ifndef QUADRATURE_RULE_HPP
#define QUADRATURE_RULE_HPP

#include <cmath>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>
#include "../traits/SPINPOP_traits.hpp"

namespace quadrature {

namespace detail {
template<typename R>
void check_finite_bounds(R lower_bound, R upper_bound) {
    if (!std::isfinite(lower_bound) || !std::isfinite(upper_bound)) {
        throw std::invalid_argument("Adaptive quadrature requires finite integration bounds.");
    }
}

// The default GSL handler aborts the process.
inline void disable_gsl_error_handler() {
    static std::once_flag flag;
    std::call_once(flag, [] { gsl_set_error_handler_off(); });
}
} // namespace detail

template<typename R = traits::DataType::DensityField>
class BoostTanhSinhQuadrature {
    R target_relative_error_;
    std::size_t max_refinements_;

public:
    explicit BoostTanhSinhQuadrature(R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()),
                                     std::size_t max_refinements = 15)
        : target_relative_error_(relative_error), max_refinements_(max_refinements) {}

    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const
    {
        detail::check_finite_bounds(lower_bound, upper_bound);
        if (lower_bound >= upper_bound) {
            return static_cast<R>(0.0);
        }

        boost::math::quadrature::tanh_sinh<R> integrator(max_refinements_);
        R error_estimate = 0;
        R L1_norm = 0;
        try {
            return integrator.integrate(integrand, lower_bound, upper_bound, target_relative_error_,
                                        &error_estimate, &L1_norm);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("Boost quadrature failed: ") + e.what());
        }
    }
};


// --- C-style adapter for GSL ---
template<typename R = traits::DataType::DensityField>
struct GSLIntegrationWrapper {
    static double gsl_func_adapter(double x, void* params) {
        auto* call = static_cast<GSLIntegrationWrapper*>(params);
        if (call->error) {
            return 0.0;
        }
        try {
            return static_cast<double>((*call->integrand)(static_cast<R>(x)));
        } catch (...) {
            // C++ exceptions must not cross the GSL C frames; rethrown after the call returns.
            call->error = std::current_exception();
            return 0.0;
        }
    }

    const std::function<R(R)>* integrand = nullptr;
    std::exception_ptr error = nullptr;
};


template<typename R = traits::DataType::DensityField>
class GSLQuadrature {
private:
    std::size_t workspace_size_;
    R target_absolute_error_;
    R target_relative_error_;

    using GSLWorkspacePtr = std::unique_ptr<gsl_integration_workspace, decltype(&gsl_integration_workspace_free)>;

    GSLWorkspacePtr create_workspace() const {
        gsl_integration_workspace* ws = gsl_integration_workspace_alloc(workspace_size_);
        if (!ws) {
            throw std::runtime_error("Failed to allocate GSL workspace");
        }
        return GSLWorkspacePtr(ws, gsl_integration_workspace_free);
    }

public:
    explicit GSLQuadrature(R absolute_error = 1e-10,
                           R relative_error = 1e-8,
                           std::size_t workspace_limit = 1000)
        : workspace_size_(workspace_limit),
          target_absolute_error_(absolute_error),
          target_relative_error_(relative_error)
    {
        detail::disable_gsl_error_handler();
    }

    R integrate(const std::function<R(R)>& integrand, R lower_bound, R upper_bound) const
    {
        detail::check_finite_bounds(lower_bound, upper_bound);
        if (lower_bound >= upper_bound) return static_cast<R>(0.0);

        GSLIntegrationWrapper<R> call;
        call.integrand = &integrand;

        gsl_function F;
        F.function = &GSLIntegrationWrapper<R>::gsl_func_adapter;
        F.params = &call;

        double result = 0.0;
        double error_estimate = 0.0;
        GSLWorkspacePtr workspace = create_workspace();

        const int status = gsl_integration_qags(&F,
                                                static_cast<double>(lower_bound),
                                                static_cast<double>(upper_bound),
                                                static_cast<double>(target_absolute_error_),
                                                static_cast<double>(target_relative_error_),
                                                workspace_size_,
                                                workspace.get(),
                                                &result, &error_estimate);

        if (call.error) {
            std::rethrow_exception(call.error);
        }
        if (status != GSL_SUCCESS) {
            throw std::runtime_error(std::string("GSL integration failed: ") + gsl_strerror(status));
        }
        return static_cast<R>(result);
    }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HPP
