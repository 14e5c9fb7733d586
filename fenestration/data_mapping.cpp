#include "data_mapping.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace envelopekit {

std::vector<double> normalize_data(const std::vector<double>& values) {
    if (values.empty()) {
        return {};
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double min_val = *min_it;
    double max_val = *max_it;

    if (max_val == min_val) {
        return std::vector<double>(values.size(), 0.5);
    }

    std::vector<double> normalized;
    normalized.reserve(values.size());
    double range = max_val - min_val;
    for (double val : values) {
        normalized.push_back((val - min_val) / range);
    }
    return normalized;
}

std::vector<int> bin_into_categories(const std::vector<double>& normalized_values, int num_categories) {
    if (num_categories < 1) {
        throw InputValidationError("Number of categories must be at least 1, got " +
                                   std::to_string(num_categories));
    }

    std::vector<int> categories;
    categories.reserve(normalized_values.size());
    for (double norm : normalized_values) {
        int category = static_cast<int>(std::floor(norm * num_categories));
        categories.push_back(std::min(category, num_categories - 1));
    }
    return categories;
}

double calculate_opening_scale(double normalized_value, double min_scale, double max_scale, bool invert) {
    if (invert) {
        return max_scale - normalized_value * (max_scale - min_scale);
    }
    return min_scale + normalized_value * (max_scale - min_scale);
}

}  // namespace envelopekit
