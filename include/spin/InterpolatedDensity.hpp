/**
 * @file InterpolatedDensity.hpp
 * @brief Spline-interpolated densities for one or more spin parameters.
 *
 * For every parameter x the log-density is an Eigen B-spline through user supplied nodes
 * (x_i, f_i), read from the hyperparameters as "<key><i>" and "f<key><i>":
 *
 *     p(x) = exp(s(x)) / Z     on the node range intersected with [minimum, maximum], 0 elsewhere.
 *
 * The joint density is the product over parameters. With identical = true all parameters share
 * the nodes of the first one, e.g. a_10 .. a_14 and fa_10 .. fa_14 for ("a_1", "a_2").
 *
 * Z is computed per call, either with the trapezoidal rule on traits::GridConstants::spline_norm_points
 * evenly spaced points spanning [minimum, maximum] or with an adaptive quadrature rule
 * (QuadratureRuleHolder) over the clipped node range.
 *
 * Usage Example:
 * @code
 * spin::InterpolatedDensity<double> model(spin::spline_spin_magnitude_identical<double>());
 * auto prob = model(dataset, hyperparameters);
 * @endcode
 *
 * Dependencies:
 * - Eigen unsupported Splines module for the interpolation.
 * - quadrature::QuadratureRuleHolder for adaptive normalization.
 */
#ifndef INTERPOLATED_DENSITY_HPP
#define INTERPOLATED_DENSITY_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unsupported/Eigen/Splines>
#include "../backend/ArrayBackendHolder.hpp"
#include "../quadrature/QuadratureRuleHolder.hpp"
#include "../stats/Dataset.hpp"
#include "../traits/SPINPOP_traits.hpp"

namespace spin {

/**
 * @brief Construction parameters of an InterpolatedDensity.
 */
template<typename R = traits::DataType::DensityField>
struct InterpolationConfig {
    std::vector<std::string> parameters;  ///< Dataset columns modelled by the spline.
    R minimum = R(0);                     ///< Lower edge of the normalization range.
    R maximum = R(1);                     ///< Upper edge of the normalization range.
    std::size_t nodes = 5;                ///< Number of spline nodes per parameter.
    traits::InterpolationKind kind = traits::InterpolationKind::Cubic;
    bool identical = true;                ///< Share the first parameter's nodes across all parameters.
    traits::NormalizationMethod normalization = traits::NormalizationMethod::Trapezoid;
    R quadrature_tolerance = R(1e-8);     ///< Relative tolerance of the adaptive normalizations.
};

template<typename R = traits::DataType::DensityField>
class InterpolatedDensity {
public:
    using Array = traits::Array<R>;
    using SplineType = Eigen::Spline<R, 1>;

    /**
     * @throws std::invalid_argument for an empty parameter list, minimum >= maximum or too few
     *         nodes for the spline degree.
     */
    explicit InterpolatedDensity(InterpolationConfig<R> config)
        : config_(std::move(config))
    {
        if (config_.parameters.empty()) {
            throw std::invalid_argument("InterpolatedDensity needs at least one parameter.");
        }
        if (!(config_.minimum < config_.maximum)) {
            std::ostringstream msg;
            msg << "InterpolatedDensity: minimum " << config_.minimum
                << " must be smaller than maximum " << config_.maximum << ".";
            throw std::invalid_argument(msg.str());
        }
        if (config_.nodes <= static_cast<std::size_t>(degree())) {
            throw std::invalid_argument("InterpolatedDensity: " + std::to_string(config_.nodes)
                                        + " nodes are too few for a spline of degree "
                                        + std::to_string(degree()) + ".");
        }
    }

    /**
     * @brief Product over parameters of the normalized spline densities.
     * @throws stats::MissingParameterError if a column or node hyperparameter is absent.
     * @throws std::invalid_argument if node locations are not strictly increasing.
     * @throws stats::NormalizationError if a spline carries no mass on its range.
     */
    Array operator()(const stats::Dataset<R>& dataset, const stats::Hyperparameters<R>& hyperparameters) const {
        const auto& backend = backend::active_backend<R>();
        Array prob = Array::Ones(dataset.size());

        if (config_.identical) {
            const Profile profile = build_profile(config_.parameters.front(), hyperparameters);
            for (const auto& parameter : config_.parameters) {
                prob *= backend.map(dataset.at(parameter), [&profile](R x) { return profile.density(x); });
            }
        } else {
            for (const auto& parameter : config_.parameters) {
                const Profile profile = build_profile(parameter, hyperparameters);
                prob *= backend.map(dataset.at(parameter), [&profile](R x) { return profile.density(x); });
            }
        }
        return prob;
    }

    /**
     * @brief Names of the hyperparameters read by operator(): node locations then log-densities.
     */
    std::vector<std::string> hyperparameter_keys() const {
        std::vector<std::string> keys;
        const std::size_t n_bases = config_.identical ? 1 : config_.parameters.size();
        for (std::size_t b = 0; b < n_bases; ++b) {
            const auto& base = config_.parameters[b];
            for (std::size_t i = 0; i < config_.nodes; ++i) keys.push_back(node_key(base, i));
            for (std::size_t i = 0; i < config_.nodes; ++i) keys.push_back(value_key(base, i));
        }
        return keys;
    }

    const InterpolationConfig<R>& config() const noexcept { return config_; }

    int degree() const noexcept { return static_cast<int>(config_.kind); }

private:
    // Log-density spline of one parameter, with its support and normalizing constant.
    struct Profile {
        SplineType spline;
        R x_first;
        R x_span;
        R lower;
        R upper;
        R normalization = R(1);

        R unnormalized(R x) const {
            if (!(x >= lower && x <= upper)) return R(0);
            const R u = std::clamp((x - x_first) / x_span, R(0), R(1));
            return std::exp(spline(u)(0));
        }

        R density(R x) const { return unnormalized(x) / normalization; }
    };

    static std::string node_key(const std::string& base, std::size_t i) {
        return base + std::to_string(i);
    }

    static std::string value_key(const std::string& base, std::size_t i) {
        return "f" + base + std::to_string(i);
    }

    Profile build_profile(const std::string& base, const stats::Hyperparameters<R>& hyperparameters) const {
        const auto n = static_cast<Eigen::Index>(config_.nodes);
        Eigen::Array<R, 1, Eigen::Dynamic> x_nodes(n);
        Eigen::Matrix<R, 1, Eigen::Dynamic> f_nodes(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            x_nodes(i) = stats::require(hyperparameters, node_key(base, static_cast<std::size_t>(i)));
            f_nodes(i) = stats::require(hyperparameters, value_key(base, static_cast<std::size_t>(i)));
        }
        for (Eigen::Index i = 1; i < n; ++i) {
            if (!(x_nodes(i) > x_nodes(i - 1))) {
                std::ostringstream msg;
                msg << "InterpolatedDensity: nodes of '" << base << "' must be strictly increasing, got "
                    << x_nodes(i - 1) << " followed by " << x_nodes(i) << ".";
                throw std::invalid_argument(msg.str());
            }
        }

        Profile profile;
        profile.x_first = x_nodes(0);
        profile.x_span = x_nodes(n - 1) - x_nodes(0);
        profile.lower = std::max(config_.minimum, x_nodes(0));
        profile.upper = std::min(config_.maximum, x_nodes(n - 1));

        const typename SplineType::KnotVectorType knot_parameters = (x_nodes - profile.x_first) / profile.x_span;
        profile.spline = Eigen::SplineFitting<SplineType>::Interpolate(f_nodes, degree(), knot_parameters);
        profile.normalization = normalize(profile, base);
        return profile;
    }

    R normalize(const Profile& profile, const std::string& base) const {
        R normalization = R(0);
        if (profile.lower < profile.upper) {
            const auto integrand = [&profile](R x) { return profile.unnormalized(x); };
            switch (config_.normalization) {
                case traits::NormalizationMethod::Trapezoid: {
                    const auto& backend = backend::active_backend<R>();
                    const Array grid = backend.linspace(config_.minimum, config_.maximum,
                                                        traits::GridConstants::spline_norm_points);
                    normalization = backend.trapz(backend.map(grid, integrand), grid);
                    break;
                }
                case traits::NormalizationMethod::TanhSinh:
                    normalization = quadrature::QuadratureRuleHolder<R>(quadrature::QuadratureType::TanhSinh,
                                                                        config_.quadrature_tolerance)
                                        .integrate(integrand, profile.lower, profile.upper);
                    break;
                case traits::NormalizationMethod::QAGS:
                    normalization = quadrature::QuadratureRuleHolder<R>(quadrature::QuadratureType::QAGS,
                                                                        config_.quadrature_tolerance)
                                        .integrate(integrand, profile.lower, profile.upper);
                    break;
            }
        }
        if (!std::isfinite(normalization) || !(normalization >= std::numeric_limits<R>::min())) {
            std::ostringstream msg;
            msg << "InterpolatedDensity: degenerate normalization " << normalization
                << " for '" << base << "' on [" << config_.minimum << ", " << config_.maximum << "].";
            throw stats::NormalizationError(msg.str());
        }
        return normalization;
    }

    InterpolationConfig<R> config_;
};

/**
 * @brief Cubic spline in both spin magnitudes, sharing one set of nodes.
 */
template<typename R = traits::DataType::DensityField>
InterpolationConfig<R> spline_spin_magnitude_identical(R minimum = R(0), R maximum = R(1), std::size_t nodes = 5,
                                                       traits::InterpolationKind kind = traits::InterpolationKind::Cubic)
{
    InterpolationConfig<R> config;
    config.parameters = {"a_1", "a_2"};
    config.minimum = minimum;
    config.maximum = maximum;
    config.nodes = nodes;
    config.kind = kind;
    return config;
}

template<typename R = traits::DataType::DensityField>
InterpolationConfig<R> spline_spin_magnitude(R minimum = R(0), R maximum = R(1), std::size_t nodes = 5,
                                             traits::InterpolationKind kind = traits::InterpolationKind::Cubic)
{
    auto config = spline_spin_magnitude_identical<R>(minimum, maximum, nodes, kind);
    config.identical = false;
    return config;
}

/**
 * @brief Cubic spline in both cosine tilts, sharing one set of nodes.
 */
template<typename R = traits::DataType::DensityField>
InterpolationConfig<R> spline_spin_tilt_identical(R minimum = R(-1), R maximum = R(1), std::size_t nodes = 5,
                                                  traits::InterpolationKind kind = traits::InterpolationKind::Cubic)
{
    InterpolationConfig<R> config;
    config.parameters = {"cos_tilt_1", "cos_tilt_2"};
    config.minimum = minimum;
    config.maximum = maximum;
    config.nodes = nodes;
    config.kind = kind;
    return config;
}

template<typename R = traits::DataType::DensityField>
InterpolationConfig<R> spline_spin_tilt(R minimum = R(-1), R maximum = R(1), std::size_t nodes = 5,
                                        traits::InterpolationKind kind = traits::InterpolationKind::Cubic)
{
    auto config = spline_spin_tilt_identical<R>(minimum, maximum, nodes, kind);
    config.identical = false;
    return config;
}

} // namespace spin

#endif // INTERPOLATED_DENSITY_HPP
