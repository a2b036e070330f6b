/**
 * @file Dataset.hpp
 * @brief Defines the inputs of every density model: the named-array dataset and the scalar
 *        hyperparameter set, together with the errors raised while reading them.
 *
 * A Dataset maps parameter names (e.g. "a_1", "cos_tilt_2", "chi_eff") to Eigen arrays that all
 * share the same length N. Models only ever read it; a missing key is a usage error and is
 * reported immediately instead of falling back to a default.
 *
 * Usage Example:
 * @code
 * stats::Dataset<double> data{{"a_1", a1}, {"a_2", a2}};
 * stats::Hyperparameters<double> params{{"amax", 1.0}, {"alpha_chi", 2.0}, {"beta_chi", 2.0}};
 * const auto& a1_ref = data.at("a_1");
 * double amax = stats::require(params, "amax");
 * @endcode
 */

#ifndef DATASET_HPP
#define DATASET_HPP

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../traits/SPINPOP_traits.hpp"

namespace stats {

/**
 * @brief Raised when a dataset column or a hyperparameter required by a model is absent.
 */
class MissingParameterError : public std::out_of_range {
public:
    explicit MissingParameterError(const std::string& what_arg)
        : std::out_of_range(what_arg) {}
};

/**
 * @brief Raised when a normalizing constant is zero, non-finite or too small to divide by.
 *
 * Callers typically treat the offending hyperparameter draw as having zero density.
 */
class NormalizationError : public std::runtime_error {
public:
    explicit NormalizationError(const std::string& what_arg)
        : std::runtime_error(what_arg) {}
};

/**
 * @brief Flat map of scalar hyperparameters.
 */
template<typename R = traits::DataType::DensityField>
using Hyperparameters = std::unordered_map<std::string, R>;

/**
 * @brief Looks up a hyperparameter.
 * @throws MissingParameterError if @p key is absent.
 */
template<typename R>
R require(const Hyperparameters<R>& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        throw MissingParameterError("Missing hyperparameter '" + key + "'.");
    }
    return it->second;
}

/**
 * @brief Looks up a hyperparameter, returning @p fallback when absent.
 */
template<typename R>
R value_or(const Hyperparameters<R>& params, const std::string& key, R fallback) {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

/**
 * @brief Named columns of equal length, one entry per sample or grid point.
 *
 * @tparam R Numeric type of the columns.
 */
template<typename R = traits::DataType::DensityField>
class Dataset {
public:
    using Array = traits::Array<R>;

    Dataset() = default;

    /**
     * @brief Builds a dataset from (name, column) pairs.
     * @throws std::invalid_argument if the columns differ in length.
     */
    Dataset(std::initializer_list<std::pair<const std::string, Array>> columns) {
        for (const auto& [key, values] : columns) {
            insert(key, values);
        }
    }

    /**
     * @brief Adds or replaces a column.
     * @throws std::invalid_argument if its length differs from the existing columns.
     */
    void insert(const std::string& key, Array values) {
        const bool replaces_only_column = columns_.size() == 1 && columns_.count(key) == 1;
        if (!columns_.empty() && !replaces_only_column && values.size() != size_) {
            throw std::invalid_argument("Column '" + key + "' has " + std::to_string(values.size())
                                        + " entries, dataset has " + std::to_string(size_) + ".");
        }
        size_ = values.size();
        columns_.insert_or_assign(key, std::move(values));
    }

    /**
     * @brief Read access to a column.
     * @throws MissingParameterError if @p key is absent.
     */
    const Array& at(const std::string& key) const {
        auto it = columns_.find(key);
        if (it == columns_.end()) {
            throw MissingParameterError("Dataset has no column '" + key + "'.");
        }
        return it->second;
    }

    bool contains(const std::string& key) const noexcept { return columns_.count(key) != 0; }

    /// Number of samples (rows). Zero for an empty dataset.
    Eigen::Index size() const noexcept { return size_; }

    std::vector<std::string> keys() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto& entry : columns_) names.push_back(entry.first);
        return names;
    }

private:
    std::unordered_map<std::string, Array> columns_;
    Eigen::Index size_ = 0;
};

} // namespace stats

#endif // DATASET_HPP
