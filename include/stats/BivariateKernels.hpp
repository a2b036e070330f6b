/**
 * @file BivariateKernels.hpp
 * @brief Unnormalized bivariate Gaussian and skew-Gaussian kernels.
 *
 * With standardized residuals z_x = (x - mu_x) / sigma_x and z_y = (y - mu_y) / sigma_y:
 *
 *   gaussian(x, y)      = exp(-(z_x^2 - 2 rho z_x z_y + z_y^2) / (2 (1 - rho^2)))
 *   skew_gaussian(x, y) = gaussian(x, y) * (1 + erf(alpha_x z_x / sqrt(2))) * (1 + erf(alpha_y z_y / sqrt(2)))
 *
 * The kernels are defined on the whole plane and carry no normalization. At rho = 0 both factor
 * into one-dimensional (skew-)normal shapes.
 *
 * The functions accept any Eigen array expression, so the same code evaluates per-sample
 * columns and full quadrature meshes.
 *
 * Dependencies:
 * - Eigen, including the unsupported SpecialFunctions module for the array erf.
 */

#ifndef BIVARIATE_KERNELS_HPP
#define BIVARIATE_KERNELS_HPP

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <Eigen/Dense>
#include <unsupported/Eigen/SpecialFunctions>

namespace stats {

namespace detail {
template<typename R>
void check_bivariate_parameters(R sigma_x, R sigma_y, R rho) {
    if (!(sigma_x > R(0)) || !(sigma_y > R(0))) {
        std::ostringstream msg;
        msg << "Bivariate kernel widths must be positive, got " << sigma_x << " and " << sigma_y << ".";
        throw std::domain_error(msg.str());
    }
    if (!(std::abs(rho) < R(1))) {
        std::ostringstream msg;
        msg << "Bivariate kernel correlation must lie in (-1, 1), got " << rho << ".";
        throw std::domain_error(msg.str());
    }
}
} // namespace detail

template<typename DerivedX, typename DerivedY, typename R>
typename DerivedX::PlainObject unnormalized_2d_gaussian(const Eigen::ArrayBase<DerivedX>& x,
                                                        const Eigen::ArrayBase<DerivedY>& y,
                                                        R mu_x, R mu_y, R sigma_x, R sigma_y, R rho)
{
    detail::check_bivariate_parameters(sigma_x, sigma_y, rho);
    using Plain = typename DerivedX::PlainObject;
    const Plain z_x = (x.derived() - mu_x) / sigma_x;
    const Plain z_y = (y.derived() - mu_y) / sigma_y;
    const R scale = R(-0.5) / (R(1) - rho * rho);
    return (scale * (z_x.square() - R(2) * rho * z_x * z_y + z_y.square())).exp();
}

template<typename DerivedX, typename DerivedY, typename R>
typename DerivedX::PlainObject unnormalized_2d_skew_gaussian(const Eigen::ArrayBase<DerivedX>& x,
                                                             const Eigen::ArrayBase<DerivedY>& y,
                                                             R mu_x, R mu_y, R sigma_x, R sigma_y,
                                                             R alpha_x, R alpha_y, R rho)
{
    using Plain = typename DerivedX::PlainObject;
    const Plain gaussian = unnormalized_2d_gaussian(x, y, mu_x, mu_y, sigma_x, sigma_y, rho);
    const R inv_sqrt2 = R(1) / std::sqrt(R(2));
    const Plain skew_x = R(1) + (alpha_x * inv_sqrt2 * (x.derived() - mu_x) / sigma_x).erf();
    const Plain skew_y = R(1) + (alpha_y * inv_sqrt2 * (y.derived() - mu_y) / sigma_y).erf();
    return gaussian * skew_x * skew_y;
}

} // namespace stats

#endif // BIVARIATE_KERNELS_HPP
