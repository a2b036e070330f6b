/*
    bindings.cpp - Pybind11 bindings for the spin population density models.

    This module exposes the SPINPOP density models to a Python population-inference layer. Every
    model evaluates a dataset (dict of equal-length numpy arrays) at a set of scalar
    hyperparameters and returns the density at every sample.

    Main Features:
    --------------
    - Parametric models:
        * density(name, dataset, hyperparameters) evaluates a model from the registry.
        * model_names() lists the registered models.

    - Interpolated models:
        * InterpolatedDensity with the spline_spin_magnitude / spline_spin_tilt presets.

    - Backend selection:
        * set_backend(BackendType.OpenMP) switches every later evaluation to the multi-threaded backend.

    - Errors:
        * MissingParameterError (KeyError) for absent dataset columns or hyperparameters.
        * NormalizationError (RuntimeError) for degenerate normalizing constants.
        * C++ std::domain_error and std::invalid_argument surface as ValueError.

    Usage:
    ------
        import numpy as np
        import spinpop
        data = {"chi_eff": np.array([0.0, 0.1]), "chi_p": np.array([0.2, 0.3])}
        prob = spinpop.density("gaussian_chi_p_chi_eff", data,
                               {"mu_chi_eff": 0.0, "sigma_chi_eff": 0.1,
                                "mu_chi_p": 0.2, "sigma_chi_p": 0.1, "rho": 0.5})
*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "../include/backend/ArrayBackendHolder.hpp"
#include "../include/spin/InterpolatedDensity.hpp"
#include "../include/spin/ModelRegistry.hpp"
#include "../include/stats/Dataset.hpp"
#include "../include/traits/SPINPOP_traits.hpp"

namespace py = pybind11;

// Short-hands
using Real    = traits::DataType::DensityField;
using Array   = traits::DataType::StoringArray;
using Columns = std::map<std::string, Array>;

/**
 * @brief Copies a Python dict of arrays into a Dataset, checking column lengths.
 */
stats::Dataset<Real> to_dataset(const Columns& columns) {
    stats::Dataset<Real> dataset;
    for (const auto& [key, values] : columns) {
        dataset.insert(key, values);
    }
    return dataset;
}

PYBIND11_MODULE(spinpop, m) {
    m.doc() = "Spin population density models with grid-normalized correlated effective spins (pybind11)";

    py::register_exception<stats::MissingParameterError>(m, "MissingParameterError", PyExc_KeyError);
    py::register_exception<stats::NormalizationError>(m, "NormalizationError", PyExc_RuntimeError);

    // ----- Enums -----
    /**
     * @brief Array backends executing the density kernels.
     *
     * ### Values
     * - `BackendType.Eigen` : serial, vectorized Eigen evaluation (default).
     * - `BackendType.OpenMP` : multi-threaded maps and grid reductions.
     */
    py::enum_<traits::BackendType>(m, "BackendType")
    .value("Eigen", traits::BackendType::Eigen)
    .value("OpenMP", traits::BackendType::OpenMP)
    .export_values();

    py::enum_<traits::InterpolationKind>(m, "InterpolationKind")
    .value("Linear", traits::InterpolationKind::Linear)
    .value("Quadratic", traits::InterpolationKind::Quadratic)
    .value("Cubic", traits::InterpolationKind::Cubic)
    .export_values();

    /**
     * @brief Normalization strategies for interpolated densities.
     *
     * ### Values
     * - `NormalizationMethod.Trapezoid` : trapezoidal rule on 1000 points over [minimum, maximum].
     * - `NormalizationMethod.TanhSinh` : Boost tanh-sinh over the clipped node range.
     * - `NormalizationMethod.QAGS` : GSL QAGS over the clipped node range.
     */
    py::enum_<traits::NormalizationMethod>(m, "NormalizationMethod")
    .value("Trapezoid", traits::NormalizationMethod::Trapezoid)
    .value("TanhSinh", traits::NormalizationMethod::TanhSinh)
    .value("QAGS", traits::NormalizationMethod::QAGS)
    .export_values();

    //----- Backend -----

    m.def("set_backend", &backend::set_active_backend<Real>, py::arg("backend"),
          "Selects the array backend used by every later density evaluation.");
    m.def("get_backend", []() { return backend::active_backend<Real>().type(); });

    //----- Parametric models -----

    m.def("model_names", &spin::model_names, "Names accepted by density().");
    m.def("density",
          [](const std::string& name, const Columns& dataset, const stats::Hyperparameters<Real>& hyperparameters) -> Array {
              const auto model = spin::make_density_model(name);
              return model(to_dataset(dataset), hyperparameters);
          },
          py::arg("name"), py::arg("dataset"), py::arg("hyperparameters"),
          "Evaluates the named model at every sample of the dataset.");

    //----- Interpolated models -----

    py::class_<spin::InterpolationConfig<Real>>(m, "InterpolationConfig")
        .def(py::init<>())
        .def_readwrite("parameters", &spin::InterpolationConfig<Real>::parameters)
        .def_readwrite("minimum", &spin::InterpolationConfig<Real>::minimum)
        .def_readwrite("maximum", &spin::InterpolationConfig<Real>::maximum)
        .def_readwrite("nodes", &spin::InterpolationConfig<Real>::nodes)
        .def_readwrite("kind", &spin::InterpolationConfig<Real>::kind)
        .def_readwrite("identical", &spin::InterpolationConfig<Real>::identical)
        .def_readwrite("normalization", &spin::InterpolationConfig<Real>::normalization)
        .def_readwrite("quadrature_tolerance", &spin::InterpolationConfig<Real>::quadrature_tolerance);

    py::class_<spin::InterpolatedDensity<Real>>(m, "InterpolatedDensity")
        .def(py::init<spin::InterpolationConfig<Real>>(), py::arg("config"))
        .def("__call__",
             [](const spin::InterpolatedDensity<Real>& self, const Columns& dataset,
                const stats::Hyperparameters<Real>& hyperparameters) -> Array {
                 return self(to_dataset(dataset), hyperparameters);
             },
             py::arg("dataset"), py::arg("hyperparameters"))
        .def("hyperparameter_keys", &spin::InterpolatedDensity<Real>::hyperparameter_keys)
        .def_property_readonly("config", &spin::InterpolatedDensity<Real>::config);

    // Presets take the interpolation kind by name ("linear", "quadratic", "cubic").
    m.def("spline_spin_magnitude_identical",
          [](Real minimum, Real maximum, std::size_t nodes, const std::string& kind) {
              return spin::spline_spin_magnitude_identical<Real>(minimum, maximum, nodes,
                                                                 traits::interpolation_kind_from_string(kind));
          },
          py::arg("minimum") = 0.0, py::arg("maximum") = 1.0, py::arg("nodes") = 5, py::arg("kind") = "cubic");
    m.def("spline_spin_magnitude",
          [](Real minimum, Real maximum, std::size_t nodes, const std::string& kind) {
              return spin::spline_spin_magnitude<Real>(minimum, maximum, nodes,
                                                       traits::interpolation_kind_from_string(kind));
          },
          py::arg("minimum") = 0.0, py::arg("maximum") = 1.0, py::arg("nodes") = 5, py::arg("kind") = "cubic");
    m.def("spline_spin_tilt_identical",
          [](Real minimum, Real maximum, std::size_t nodes, const std::string& kind) {
              return spin::spline_spin_tilt_identical<Real>(minimum, maximum, nodes,
                                                            traits::interpolation_kind_from_string(kind));
          },
          py::arg("minimum") = -1.0, py::arg("maximum") = 1.0, py::arg("nodes") = 5, py::arg("kind") = "cubic");
    m.def("spline_spin_tilt",
          [](Real minimum, Real maximum, std::size_t nodes, const std::string& kind) {
              return spin::spline_spin_tilt<Real>(minimum, maximum, nodes,
                                                  traits::interpolation_kind_from_string(kind));
          },
          py::arg("minimum") = -1.0, py::arg("maximum") = 1.0, py::arg("nodes") = 5, py::arg("kind") = "cubic");
}
