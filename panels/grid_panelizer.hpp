#ifndef ENVELOPEKIT_PANELS_GRID_PANELIZER_HPP
#define ENVELOPEKIT_PANELS_GRID_PANELIZER_HPP

#include <geometry/geometry.hpp>
#include <string>
#include <vector>

namespace envelopekit {

// Configuration for subdividing a surface into panels
struct PanelizeConfig {
    int u_count = 4;
    int v_count = 4;
    std::string prefix = "P";
};

// Panels and their ids, index-aligned
struct PanelGrid {
    std::vector<SurfacePtr> panels;
    std::vector<std::string> ids;

    size_t size() const { return panels.size(); }
};

// Row-major panel ids "{prefix}-{u:02d}-{v:02d}", U varying fastest.
//
//   generate_panel_ids(2, 3) ->
//     P-01-01, P-02-01,
//     P-01-02, P-02-02,
//     P-01-03, P-02-03
//
// Throws InputValidationError when either count is not positive.
std::vector<std::string> generate_panel_ids(int u_count, int v_count,
                                            const std::string& prefix = "P");

// Subdivides a surface-like input into u_count x v_count bilinear panels
// through evenly spaced parameter values, ordered like generate_panel_ids.
// The input surface is only evaluated, never modified.
PanelGrid panelize_surface(const Geometry& surface_input, int u_count, int v_count,
                           const std::string& prefix = "P");

inline PanelGrid panelize(const Geometry& surface, const PanelizeConfig& config) {
    return panelize_surface(surface, config.u_count, config.v_count, config.prefix);
}

inline PanelGrid panelize(const Geometry& surface, int u_count, int v_count,
                          const std::string& prefix = "P") {
    return panelize_surface(surface, u_count, v_count, prefix);
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_PANELS_GRID_PANELIZER_HPP
