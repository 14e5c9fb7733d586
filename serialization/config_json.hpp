#ifndef ENVELOPEKIT_SERIALIZATION_CONFIG_JSON_HPP
#define ENVELOPEKIT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include "geometry_json.hpp"
#include <common/errors.hpp>
#include <panels/grid_panelizer.hpp>
#include <fenestration/fenestration.hpp>
#include <tower/tower_twister.hpp>
#include <string>

namespace envelopekit {

// PanelizeConfig serialization
inline void to_json(nlohmann::json& j, const PanelizeConfig& config) {
    j = {
        {"u_count", config.u_count},
        {"v_count", config.v_count},
        {"prefix", config.prefix}
    };
}

inline void from_json(const nlohmann::json& j, PanelizeConfig& config) {
    config.u_count = j.value("u_count", 4);
    config.v_count = j.value("v_count", 4);
    config.prefix = j.value("prefix", std::string("P"));
}

// CutStrategy serialization
inline const char* cut_strategy_name(CutStrategy strategy) {
    switch (strategy) {
        case CutStrategy::ProjectAndSplit: return "project_split";
        case CutStrategy::BooleanDifference: return "boolean_difference";
    }
    return "project_split";
}

inline CutStrategy parse_cut_strategy(const std::string& name) {
    if (name == "project_split") return CutStrategy::ProjectAndSplit;
    if (name == "boolean_difference") return CutStrategy::BooleanDifference;
    throw InputValidationError("Unknown cut strategy: '" + name + "'");
}

// CutOptions serialization
inline void to_json(nlohmann::json& j, const CutOptions& options) {
    j = {
        {"strategy", cut_strategy_name(options.strategy)},
        {"tolerance", options.tolerance},
        {"cutter_depth", options.cutter_depth}
    };
}

inline void from_json(const nlohmann::json& j, CutOptions& options) {
    options.strategy = parse_cut_strategy(j.value("strategy", std::string("project_split")));
    options.tolerance = j.value("tolerance", 0.01);
    options.cutter_depth = j.value("cutter_depth", 1.0);
}

// FenestrationConfig serialization
inline void to_json(nlohmann::json& j, const FenestrationConfig& config) {
    j = {
        {"min_opening", config.min_opening},
        {"max_opening", config.max_opening},
        {"num_categories", config.num_categories},
        {"invert", config.invert},
        {"cut", config.cut}
    };
}

inline void from_json(const nlohmann::json& j, FenestrationConfig& config) {
    config.min_opening = j.value("min_opening", 0.0);
    config.max_opening = j.value("max_opening", 0.5);
    config.num_categories = j.value("num_categories", kDefaultCategoryCount);
    config.invert = j.value("invert", true);
    config.cut = j.value("cut", CutOptions{});
}

// TowerConfig serialization
inline void to_json(nlohmann::json& j, const TowerConfig& config) {
    j = {
        {"floor_count", config.floor_count},
        {"floor_height", config.floor_height},
        {"rotation_per_floor", config.rotation_per_floor}
    };
    if (config.axis_point) {
        j["axis_point"] = *config.axis_point;
    }
}

inline void from_json(const nlohmann::json& j, TowerConfig& config) {
    config.floor_count = j.value("floor_count", 10);
    config.floor_height = j.value("floor_height", 3.5);
    config.rotation_per_floor = j.value("rotation_per_floor", 5);
    if (j.contains("axis_point") && !j["axis_point"].is_null()) {
        config.axis_point = j["axis_point"].get<Vec3>();
    } else {
        config.axis_point.reset();
    }
}

// FenestrationRecord serialization (report output only)
inline void to_json(nlohmann::json& j, const FenestrationRecord& record) {
    j = {
        {"id", record.id},
        {"scale_factor", record.scale_factor},
        {"opening_area", record.opening_area},
        {"panel_area", record.panel_area},
        {"opening_percent", record.opening_percent},
        {"category", record.category},
        {"data_value", record.data_value},
        {"normalized_value", record.normalized_value}
    };
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_SERIALIZATION_CONFIG_JSON_HPP
