#include "cli_common.hpp"
#include <tower/tower_twister.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>

namespace envelopekit::cli {

namespace {

void print_usage() {
    std::cerr << "Usage: envelopekit tower -c <config.json> [--debug] [-v]\n";
    std::cerr << "Config:\n";
    std::cerr << "  base_curve           Closed plan curve\n";
    std::cerr << "  floor_count          Number of floors (default: 10)\n";
    std::cerr << "  floor_height         Height between floors (default: 3.5)\n";
    std::cerr << "  rotation_per_floor   Degrees per floor (default: 5)\n";
    std::cerr << "  axis_point           Rotation axis point (default: plan center)\n";
}

}  // namespace

int command_tower(int argc, char** argv) {
    auto log = envelopekit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.help || ctx.config_path.empty()) {
            print_usage();
            return ctx.help ? 0 : 1;
        }
        logging::set_verbose(ctx.verbose);

        log->info("Building tower from: {}", ctx.config_path);

        nlohmann::json input = json::read_config(ctx.config_path);
        Curve base_curve;
        if (input.contains("base_curve") && !input["base_curve"].is_null()) {
            base_curve = curve_from_json(input["base_curve"]);
        }
        TowerConfig config = input.get<TowerConfig>();

        auto result = host::run([&] { return twist_tower(base_curve, config); }, ctx.debug);
        if (!result.ok()) {
            return report_failure(result.diagnostics);
        }
        const TowerResult& tower = *result.value;

        nlohmann::json surfaces = nlohmann::json::array();
        double facade_area = 0.0;
        for (const auto& surface : tower.surfaces) {
            facade_area += area(*surface);
            surfaces.push_back(surface_to_json(surface));
        }

        json::SerializedData data;
        data.step = "tower";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.config_path;
        data.config = config;
        data.stats = {
            {"floor_count", tower.floor_curves.size()},
            {"surface_count", tower.surfaces.size()},
            {"facade_area", facade_area},
            {"total_height", (config.floor_count - 1) * config.floor_height}
        };
        data.data = {
            {"floor_curves", tower.floor_curves},
            {"surfaces", surfaces}
        };

        json::write_report(std::cout, data);
        log->info("Generated {} floors, {} surfaces",
                  tower.floor_curves.size(), tower.surfaces.size());
        return 0;

    } catch (const std::exception& e) {
        log->error("{}", host::summarize_error(e));
        return 1;
    }
}

}  // namespace envelopekit::cli
