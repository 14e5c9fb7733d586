#ifndef ENVELOPEKIT_FENESTRATION_FENESTRATION_HPP
#define ENVELOPEKIT_FENESTRATION_FENESTRATION_HPP

#include "data_mapping.hpp"
#include <geometry/geometry.hpp>
#include <string>
#include <vector>

namespace envelopekit {

// Unit-scale opening shape, centered on its reference plane
struct OpeningTemplate {
    Curve curve;
    Plane plane = Plane::world_xy();
};

enum class CutStrategy {
    ProjectAndSplit,    // project onto the panel, split, keep the largest face
    BooleanDifference   // extrude through the panel and subtract
};

struct CutOptions {
    CutStrategy strategy = CutStrategy::ProjectAndSplit;
    double tolerance = 0.01;     // projection / split tolerance (model units)
    double cutter_depth = 1.0;   // extrusion length, centered on the panel
};

struct FenestrationConfig {
    double min_opening = 0.0;
    double max_opening = 0.5;
    int num_categories = kDefaultCategoryCount;
    bool invert = true;          // higher data -> smaller opening
    CutOptions cut;
};

// Metrics for one panel
struct FenestrationRecord {
    std::string id;
    double scale_factor = 0.0;
    double opening_area = 0.0;
    double panel_area = 0.0;
    double opening_percent = 0.0;
    int category = 0;
    double data_value = 0.0;
    double normalized_value = 0.0;
};

struct FenestratedPanel {
    Geometry geometry;   // cut face (Brep) or the input panel when uncut
    FenestrationRecord record;
};

// All four sequences are index-aligned with the input panels
struct FenestrationResult {
    std::vector<Geometry> panels;
    std::vector<FenestrationRecord> records;
    std::vector<int> categories;
    std::vector<double> scale_factors;

    size_t size() const { return panels.size(); }
};

// Cuts one opening into a panel.
//
// A zero scale factor leaves the panel solid: the returned geometry holds
// the same SurfacePtr and the opening area and percent are zero.
// Otherwise the template is copied, scaled by (s, s, 1) about its plane,
// mapped onto the panel frame at the domain midpoint and cut with the
// configured strategy. When the cut does not succeed the panel comes back
// unmodified while the opening metrics still describe the scaled opening.
//
// Throws GeometryConstructionError naming `panel_id` when the panel frame
// is degenerate.
FenestratedPanel create_fenestrated_panel(const SurfacePtr& panel,
                                          const OpeningTemplate& opening,
                                          double scale_factor,
                                          const std::string& panel_id,
                                          const CutOptions& options = CutOptions{});

// Data-driven openings over a panel grid:
// normalize -> bin -> scale -> cut each panel in order.
//
// Throws InputValidationError before any geometry work when panels, ids and
// data_values differ in length, a panel is null, the template is not a closed
// curve, or num_categories < 1.
FenestrationResult adaptive_fenestration(const std::vector<SurfacePtr>& panels,
                                         const std::vector<std::string>& ids,
                                         const std::vector<double>& data_values,
                                         const OpeningTemplate& opening,
                                         const FenestrationConfig& config = FenestrationConfig{});

inline FenestrationResult synthesize_fenestration(const std::vector<SurfacePtr>& panels,
                                                  const std::vector<std::string>& ids,
                                                  const std::vector<double>& data_values,
                                                  const OpeningTemplate& opening,
                                                  const FenestrationConfig& config = FenestrationConfig{}) {
    return adaptive_fenestration(panels, ids, data_values, opening, config);
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_FENESTRATION_FENESTRATION_HPP
