#include "cli_common.hpp"
#include <panels/grid_panelizer.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>

namespace envelopekit::cli {

namespace {

void print_usage() {
    std::cerr << "Usage: envelopekit panelize -c <config.json> [--debug] [-v]\n";
    std::cerr << "Config:\n";
    std::cerr << "  surface      Surface, face or brep to subdivide\n";
    std::cerr << "  u_count      Panels along U (default: 4)\n";
    std::cerr << "  v_count      Panels along V (default: 4)\n";
    std::cerr << "  prefix       Panel id prefix (default: P)\n";
}

}  // namespace

int command_panelize(int argc, char** argv) {
    auto log = envelopekit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.help || ctx.config_path.empty()) {
            print_usage();
            return ctx.help ? 0 : 1;
        }
        logging::set_verbose(ctx.verbose);

        log->info("Panelizing from: {}", ctx.config_path);

        nlohmann::json input = json::read_config(ctx.config_path);
        Geometry surface = geometry_from_json(input.value("surface", nlohmann::json()));
        PanelizeConfig config = input.get<PanelizeConfig>();

        auto result = host::run([&] { return panelize(surface, config); }, ctx.debug);
        if (!result.ok()) {
            return report_failure(result.diagnostics);
        }
        const PanelGrid& grid = *result.value;

        nlohmann::json panels = nlohmann::json::array();
        for (size_t i = 0; i < grid.size(); ++i) {
            panels.push_back({
                {"id", grid.ids[i]},
                {"surface", surface_to_json(grid.panels[i])},
                {"area", area(*grid.panels[i])}
            });
        }

        json::SerializedData data;
        data.step = "panelize";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.config_path;
        data.config = config;
        data.stats = {
            {"panel_count", grid.size()},
            {"u_count", config.u_count},
            {"v_count", config.v_count}
        };
        data.data = {{"panels", panels}};

        json::write_report(std::cout, data);
        log->info("Generated {} panels", grid.size());
        return 0;

    } catch (const std::exception& e) {
        log->error("{}", host::summarize_error(e));
        return 1;
    }
}

}  // namespace envelopekit::cli
