#ifndef ENVELOPEKIT_GEOMETRY_INTERVAL_HPP
#define ENVELOPEKIT_GEOMETRY_INTERVAL_HPP

#include <cstddef>
#include <vector>

namespace envelopekit {

// Closed parameter range [min, max]
struct Interval {
    double min = 0.0;
    double max = 1.0;

    double length() const { return max - min; }
    double mid() const { return 0.5 * (min + max); }

    // Linear interpolation: 0 -> min, 1 -> max
    double parameter_at(double normalized) const {
        return min + normalized * (max - min);
    }

    bool includes(double t, double tolerance = 0.0) const {
        return t >= min - tolerance && t <= max + tolerance;
    }

    // count + 1 evenly spaced values, both endpoints included exactly
    std::vector<double> divide(int count) const {
        std::vector<double> values;
        if (count <= 0) {
            return values;
        }
        values.reserve(static_cast<size_t>(count) + 1);
        for (int i = 0; i < count; ++i) {
            values.push_back(parameter_at(static_cast<double>(i) / count));
        }
        values.push_back(max);
        return values;
    }
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_INTERVAL_HPP
