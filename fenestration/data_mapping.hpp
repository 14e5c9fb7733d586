#ifndef ENVELOPEKIT_FENESTRATION_DATA_MAPPING_HPP
#define ENVELOPEKIT_FENESTRATION_DATA_MAPPING_HPP

#include <vector>

namespace envelopekit {

// Default number of discrete categories for binning
constexpr int kDefaultCategoryCount = 11;

// Min-max normalization to [0, 1], index-aligned with the input.
// A zero-variance series maps to 0.5 everywhere.
std::vector<double> normalize_data(const std::vector<double>& values);

// category = min(floor(norm * num_categories), num_categories - 1),
// so a normalized 1.0 lands in the last bin.
// Throws InputValidationError when num_categories < 1.
std::vector<int> bin_into_categories(const std::vector<double>& normalized_values,
                                     int num_categories = kDefaultCategoryCount);

// Linear map from a normalized value to an opening scale. With `invert`,
// higher data gives a smaller opening.
double calculate_opening_scale(double normalized_value,
                               double min_scale = 0.0,
                               double max_scale = 0.5,
                               bool invert = true);

}  // namespace envelopekit

#endif // ENVELOPEKIT_FENESTRATION_DATA_MAPPING_HPP
