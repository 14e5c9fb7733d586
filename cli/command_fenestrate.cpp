#include "cli_common.hpp"
#include <panels/grid_panelizer.hpp>
#include <fenestration/fenestration.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>

namespace envelopekit::cli {

namespace {

void print_usage() {
    std::cerr << "Usage: envelopekit fenestrate -c <config.json> [--debug] [-v]\n";
    std::cerr << "Config:\n";
    std::cerr << "  surface, u_count, v_count, prefix   Panel grid (as for panelize)\n";
    std::cerr << "  data_values    One value per panel, in panel order\n";
    std::cerr << "  opening        Closed opening curve at unit scale\n";
    std::cerr << "  fenestration   min_opening, max_opening, num_categories, invert, cut\n";
}

struct FenestrateOutput {
    PanelGrid grid;
    FenestrationResult fenestration;
};

}  // namespace

int command_fenestrate(int argc, char** argv) {
    auto log = envelopekit::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.help || ctx.config_path.empty()) {
            print_usage();
            return ctx.help ? 0 : 1;
        }
        logging::set_verbose(ctx.verbose);

        log->info("Fenestrating from: {}", ctx.config_path);

        nlohmann::json input = json::read_config(ctx.config_path);
        Geometry surface = geometry_from_json(input.value("surface", nlohmann::json()));
        PanelizeConfig panel_config = input.get<PanelizeConfig>();
        auto data_values = input.value("data_values", std::vector<double>{});
        FenestrationConfig config = input.value("fenestration", FenestrationConfig{});

        OpeningTemplate opening;
        if (input.contains("opening")) {
            opening.curve = curve_from_json(input["opening"]);
            opening.plane = input["opening"].value("plane", Plane::world_xy());
        }

        auto result = host::run([&] {
            FenestrateOutput output;
            output.grid = panelize(surface, panel_config);
            output.fenestration = synthesize_fenestration(
                output.grid.panels, output.grid.ids, data_values, opening, config);
            return output;
        }, ctx.debug);
        if (!result.ok()) {
            return report_failure(result.diagnostics);
        }
        const FenestrationResult& fenestration = result.value->fenestration;

        nlohmann::json panels = nlohmann::json::array();
        size_t cut_count = 0;
        double total_opening = 0.0;
        double total_panel = 0.0;
        for (size_t i = 0; i < fenestration.size(); ++i) {
            const auto& record = fenestration.records[i];
            if (std::holds_alternative<Brep>(fenestration.panels[i])) {
                ++cut_count;
            }
            total_opening += record.opening_area;
            total_panel += record.panel_area;
            panels.push_back({
                {"record", record},
                {"geometry", geometry_to_json(fenestration.panels[i])}
            });
        }

        json::SerializedData data;
        data.step = "fenestrate";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.config_path;
        data.config = {
            {"panels", panel_config},
            {"fenestration", config},
            {"opening", opening.curve}
        };
        data.stats = {
            {"panel_count", fenestration.size()},
            {"cut_count", cut_count},
            {"total_opening_area", total_opening},
            {"total_panel_area", total_panel},
            {"opening_percent", total_panel > 0.0 ? total_opening / total_panel * 100.0 : 0.0}
        };
        data.data = {
            {"panels", panels},
            {"categories", fenestration.categories},
            {"scale_factors", fenestration.scale_factors}
        };

        json::write_report(std::cout, data);
        log->info("Fenestrated {} panels ({} cut)", fenestration.size(), cut_count);
        return 0;

    } catch (const std::exception& e) {
        log->error("{}", host::summarize_error(e));
        return 1;
    }
}

}  // namespace envelopekit::cli
