#include "grid_panelizer.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>

namespace envelopekit {

namespace {

void validate_counts(int u_count, int v_count) {
    if (u_count <= 0 || v_count <= 0) {
        throw InputValidationError(fmt::format(
            "U and V counts must be greater than zero (got u_count={}, v_count={}).",
            u_count, v_count));
    }
}

std::string panel_id(const std::string& prefix, int u, int v) {
    return fmt::format("{}-{:02d}-{:02d}", prefix, u, v);
}

}  // namespace

std::vector<std::string> generate_panel_ids(int u_count, int v_count, const std::string& prefix) {
    validate_counts(u_count, v_count);

    std::vector<std::string> ids;
    ids.reserve(static_cast<size_t>(u_count) * static_cast<size_t>(v_count));

    for (int v = 1; v <= v_count; ++v) {
        for (int u = 1; u <= u_count; ++u) {
            ids.push_back(panel_id(prefix, u, v));
        }
    }
    return ids;
}

PanelGrid panelize_surface(const Geometry& surface_input, int u_count, int v_count,
                           const std::string& prefix) {
    auto log = envelopekit::logging::get_logger();

    validate_counts(u_count, v_count);
    SurfacePtr surface = coerce_surface(surface_input);

    std::vector<double> u_params = surface->domain(0).divide(u_count);
    std::vector<double> v_params = surface->domain(1).divide(v_count);

    log->debug("panelize_surface: {} surface into {}x{} panels",
               surface->type_name(), u_count, v_count);

    PanelGrid grid;
    grid.ids = generate_panel_ids(u_count, v_count, prefix);
    grid.panels.reserve(grid.ids.size());

    for (int j = 0; j < v_count; ++j) {
        double v0 = v_params[j];
        double v1 = v_params[j + 1];
        for (int i = 0; i < u_count; ++i) {
            double u0 = u_params[i];
            double u1 = u_params[i + 1];

            Vec3 a = surface->point_at(u0, v0);
            Vec3 b = surface->point_at(u1, v0);
            Vec3 c = surface->point_at(u1, v1);
            Vec3 d = surface->point_at(u0, v1);

            SurfacePtr panel = create_from_corner_points(a, b, c, d);
            if (!panel) {
                const std::string& id = grid.ids[grid.panels.size()];
                throw GeometryConstructionError(
                    fmt::format("Failed to create panel {} at cell ({}, {}).", id, i + 1, j + 1),
                    fmt::format("({}, {})", i + 1, j + 1));
            }
            grid.panels.push_back(std::move(panel));
        }
    }

    log->debug("panelize_surface: created {} panels", grid.panels.size());
    return grid;
}

}  // namespace envelopekit
