#include "fenestration.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <optional>
#include <vector>

namespace envelopekit {

namespace {

// Projection + split: keep the largest face (first on ties)
std::optional<Brep> cut_by_projection(const SurfacePtr& panel, const Curve& opening,
                                      const Plane& frame, const CutOptions& options) {
    BrepFace panel_face = BrepFace::from_surface(panel);

    std::vector<TopoDS_Wire> projected =
        project_to_brep(opening, Brep(panel_face.shape()), frame.z_axis, options.tolerance);
    if (projected.empty()) {
        return std::nullopt;
    }

    std::vector<BrepFace> pieces = split_face(panel_face, {projected.front()}, options.tolerance).faces();
    if (pieces.size() <= 1) {
        return std::nullopt;
    }

    auto largest = std::max_element(pieces.begin(), pieces.end(),
        [](const BrepFace& a, const BrepFace& b) { return area(a) < area(b); });

    return Brep(largest->shape());
}

// Extrude through the panel along the frame normal and subtract
std::optional<Brep> cut_by_boolean(const SurfacePtr& panel, const Curve& opening,
                                   const Plane& frame, const CutOptions& options) {
    double depth = options.cutter_depth;
    Curve start = opening.transformed(Transform::translation(frame.z_axis * (-0.5 * depth)));
    std::optional<Brep> cutter = extrude(start, frame.z_axis * depth);
    if (!cutter) {
        return std::nullopt;
    }
    return boolean_difference(to_brep(panel), *cutter, options.tolerance);
}

bool is_valid_template(const OpeningTemplate& opening) {
    return opening.curve.is_closed() && opening.curve.point_count() >= 3;
}

}  // namespace

FenestratedPanel create_fenestrated_panel(const SurfacePtr& panel,
                                          const OpeningTemplate& opening,
                                          double scale_factor,
                                          const std::string& panel_id,
                                          const CutOptions& options) {
    auto log = envelopekit::logging::get_logger();

    if (!panel) {
        throw InputValidationError(fmt::format("Panel {} has no geometry.", panel_id));
    }

    FenestratedPanel result;
    result.record.id = panel_id;
    result.record.scale_factor = scale_factor;
    result.record.panel_area = area(*panel);

    if (scale_factor == 0.0) {
        // Solid panel
        result.geometry = panel;
        return result;
    }

    Interval du = panel->domain(0);
    Interval dv = panel->domain(1);
    std::optional<Plane> frame = panel->frame_at(du.mid(), dv.mid());
    if (!frame) {
        throw GeometryConstructionError(fmt::format("Failed to get frame for panel {}.", panel_id), panel_id);
    }

    // Scale about the template plane first, then reposition onto the panel
    Curve opening_curve = opening.curve
        .transformed(Transform::scale(opening.plane, scale_factor, scale_factor, 1.0))
        .transformed(Transform::plane_to_plane(opening.plane, *frame));

    std::optional<Brep> cut;
    switch (options.strategy) {
        case CutStrategy::ProjectAndSplit:
            cut = cut_by_projection(panel, opening_curve, *frame, options);
            break;
        case CutStrategy::BooleanDifference:
            cut = cut_by_boolean(panel, opening_curve, *frame, options);
            break;
    }

    if (cut) {
        result.geometry = std::move(*cut);
    } else {
        log->warn("Opening for panel {} (scale {:.3f}) could not be cut; keeping panel solid",
                  panel_id, scale_factor);
        result.geometry = panel;
    }

    result.record.opening_area = area(opening_curve);
    result.record.opening_percent = result.record.panel_area > 0.0
        ? result.record.opening_area / result.record.panel_area * 100.0
        : 0.0;

    return result;
}

FenestrationResult adaptive_fenestration(const std::vector<SurfacePtr>& panels,
                                         const std::vector<std::string>& ids,
                                         const std::vector<double>& data_values,
                                         const OpeningTemplate& opening,
                                         const FenestrationConfig& config) {
    auto log = envelopekit::logging::get_logger();

    if (panels.size() != data_values.size() || panels.size() != ids.size()) {
        throw InputValidationError(fmt::format(
            "Panels, IDs, and DataValues must have matching lengths (got {}, {}, {}).",
            panels.size(), ids.size(), data_values.size()));
    }
    for (size_t i = 0; i < panels.size(); ++i) {
        if (!panels[i]) {
            throw InputValidationError(fmt::format("Panel {} has no geometry.", ids[i]));
        }
    }
    if (!is_valid_template(opening)) {
        throw InputValidationError("Opening shape must be a closed curve with at least 3 points.");
    }

    std::vector<double> normalized = normalize_data(data_values);
    std::vector<int> categories = bin_into_categories(normalized, config.num_categories);

    std::vector<double> scale_factors;
    scale_factors.reserve(normalized.size());
    for (double norm : normalized) {
        scale_factors.push_back(calculate_opening_scale(norm, config.min_opening,
                                                        config.max_opening, config.invert));
    }

    log->debug("adaptive_fenestration: {} panels, {} categories, scale range [{}, {}]{}",
               panels.size(), config.num_categories, config.min_opening, config.max_opening,
               config.invert ? " (inverted)" : "");

    FenestrationResult result;
    result.panels.reserve(panels.size());
    result.records.reserve(panels.size());

    for (size_t i = 0; i < panels.size(); ++i) {
        FenestratedPanel fenestrated = create_fenestrated_panel(
            panels[i], opening, scale_factors[i], ids[i], config.cut);

        fenestrated.record.category = categories[i];
        fenestrated.record.data_value = data_values[i];
        fenestrated.record.normalized_value = normalized[i];

        result.panels.push_back(std::move(fenestrated.geometry));
        result.records.push_back(std::move(fenestrated.record));
    }

    result.categories = std::move(categories);
    result.scale_factors = std::move(scale_factors);

    log->debug("adaptive_fenestration: fenestrated {} panels", result.size());
    return result;
}

}  // namespace envelopekit
