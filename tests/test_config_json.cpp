#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/geometry_json.hpp>
#include <serialization/json_serialization.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace envelopekit;
using envelopekit::test::expect_near;

TEST(ConfigJsonTest, FenestrationDefaultsFromEmptyObject) {
    auto config = nlohmann::json::object().get<FenestrationConfig>();
    EXPECT_DOUBLE_EQ(config.min_opening, 0.0);
    EXPECT_DOUBLE_EQ(config.max_opening, 0.5);
    EXPECT_EQ(config.num_categories, 11);
    EXPECT_TRUE(config.invert);
    EXPECT_EQ(config.cut.strategy, CutStrategy::ProjectAndSplit);
}

TEST(ConfigJsonTest, FenestrationRoundTrip) {
    FenestrationConfig config;
    config.min_opening = 0.1;
    config.max_opening = 0.4;
    config.num_categories = 5;
    config.invert = false;
    config.cut.strategy = CutStrategy::BooleanDifference;
    config.cut.cutter_depth = 2.5;

    nlohmann::json j = config;
    EXPECT_EQ(j["cut"]["strategy"], "boolean_difference");

    auto loaded = j.get<FenestrationConfig>();
    EXPECT_DOUBLE_EQ(loaded.min_opening, 0.1);
    EXPECT_DOUBLE_EQ(loaded.max_opening, 0.4);
    EXPECT_EQ(loaded.num_categories, 5);
    EXPECT_FALSE(loaded.invert);
    EXPECT_EQ(loaded.cut.strategy, CutStrategy::BooleanDifference);
    EXPECT_DOUBLE_EQ(loaded.cut.cutter_depth, 2.5);
}

TEST(ConfigJsonTest, UnknownCutStrategyThrows) {
    nlohmann::json j = {{"strategy", "laser"}};
    EXPECT_THROW(j.get<CutOptions>(), InputValidationError);
}

TEST(ConfigJsonTest, TowerAxisPointOptional) {
    auto config = nlohmann::json{{"floor_count", 6}}.get<TowerConfig>();
    EXPECT_EQ(config.floor_count, 6);
    EXPECT_DOUBLE_EQ(config.floor_height, 3.5);
    EXPECT_EQ(config.rotation_per_floor, 5);
    EXPECT_FALSE(config.axis_point.has_value());

    config.axis_point = Vec3(1.0, 2.0, 0.0);
    nlohmann::json j = config;
    auto loaded = j.get<TowerConfig>();
    ASSERT_TRUE(loaded.axis_point.has_value());
    expect_near(*loaded.axis_point, Vec3(1.0, 2.0, 0.0));
}

TEST(ConfigJsonTest, PanelizeConfig) {
    auto config = nlohmann::json{{"u_count", 3}, {"prefix", "F"}}.get<PanelizeConfig>();
    EXPECT_EQ(config.u_count, 3);
    EXPECT_EQ(config.v_count, 4);
    EXPECT_EQ(config.prefix, "F");
}

TEST(GeometryJsonTest, CurveShapes) {
    Curve rect = curve_from_json({{"type", "rectangle"}, {"width", 4.0}, {"height", 2.0}});
    EXPECT_TRUE(rect.is_closed());
    EXPECT_DOUBLE_EQ(area(rect), 8.0);

    Curve hexagon = curve_from_json({{"type", "polygon"}, {"radius", 1.0}, {"sides", 6}});
    EXPECT_EQ(hexagon.point_count(), 6u);

    Curve closed = curve_from_json({
        {"type", "polyline"},
        {"points", {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 0, 0}}}
    });
    EXPECT_TRUE(closed.is_closed());
    EXPECT_EQ(closed.point_count(), 3u);
}

TEST(GeometryJsonTest, UnknownCurveTypeThrows) {
    EXPECT_THROW(curve_from_json({{"type", "spline"}}), InputValidationError);
}

TEST(GeometryJsonTest, SurfaceRoundTrip) {
    SurfacePtr cylinder = envelopekit::test::quarter_cylinder();
    nlohmann::json j = surface_to_json(cylinder);
    EXPECT_EQ(j["type"], "cylinder");

    SurfacePtr loaded = surface_from_json(j);
    ASSERT_NE(loaded, nullptr);
    expect_near(loaded->point_at(0.3, 4.0), cylinder->point_at(0.3, 4.0), 1e-12);
}

TEST(GeometryJsonTest, HoledFaceWritesLoops) {
    BrepFace face = BrepFace::from_surface(envelopekit::test::flat_surface());
    Curve square = Curve::rectangle(Plane(Vec3(5, 5, 0), vec3::unit_x(), vec3::unit_y()), 2.0, 2.0);
    auto cutter = extrude(square.transformed(Transform::translation(Vec3(0, 0, -0.5))), Vec3(0, 0, 1));
    ASSERT_TRUE(cutter.has_value());
    auto cut = boolean_difference(Brep(face.shape()), *cutter, 0.01);
    ASSERT_TRUE(cut.has_value());

    nlohmann::json j = brep_to_json(*cut);
    EXPECT_EQ(j["type"], "brep");
    ASSERT_EQ(j["faces"].size(), 1u);
    const auto& written = j["faces"][0];
    EXPECT_EQ(written["surface"]["type"], "plane");
    EXPECT_EQ(written["outer_loop"].size(), 4u);
    ASSERT_EQ(written["inner_loops"].size(), 1u);
    EXPECT_EQ(written["inner_loops"][0].size(), 4u);
    EXPECT_NEAR(written["area"].get<double>(), 96.0, 1e-6);
}

TEST(GeometryJsonTest, GeometryVariants) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(geometry_from_json(nullptr)));
    EXPECT_TRUE(std::holds_alternative<Vec3>(geometry_from_json({1.0, 2.0, 3.0})));

    nlohmann::json plane = {
        {"type", "plane"}, {"u_domain", {0.0, 10.0}}, {"v_domain", {0.0, 5.0}}
    };
    EXPECT_TRUE(std::holds_alternative<SurfacePtr>(geometry_from_json(plane)));

    nlohmann::json brep = {{"type", "brep"}, {"faces", nlohmann::json::array({plane})}};
    Geometry loaded = geometry_from_json(brep);
    ASSERT_TRUE(std::holds_alternative<Brep>(loaded));
    EXPECT_EQ(std::get<Brep>(loaded).face_count(), 1u);

    nlohmann::json circle = {{"type", "circle"}, {"radius", 2.0}};
    EXPECT_TRUE(std::holds_alternative<Curve>(geometry_from_json(circle)));
}

TEST(GeometryJsonTest, BadPointThrows) {
    EXPECT_THROW(nlohmann::json::array({1.0, 2.0}).get<Vec3>(), InputValidationError);
}

TEST(SerializedDataTest, EnvelopeFields) {
    json::SerializedData data;
    data.step = "tower";
    data.data = {{"floor_curves", nlohmann::json::array()}};

    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["step"], "tower");
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_TRUE(j["data"].contains("floor_curves"));
}

TEST(SerializedDataTest, ReadConfigRejectsBadFiles) {
    auto dir = std::filesystem::temp_directory_path();
    auto malformed = dir / "envelopekit_malformed_config.json";
    auto array = dir / "envelopekit_array_config.json";
    std::ofstream(malformed) << "{\"u_count\": ";
    std::ofstream(array) << "[1, 2, 3]";

    EXPECT_THROW(json::read_config((dir / "envelopekit_missing_config.json").string()), InputValidationError);
    EXPECT_THROW(json::read_config(malformed.string()), InputValidationError);
    EXPECT_THROW(json::read_config(array.string()), InputValidationError);

    std::filesystem::remove(malformed);
    std::filesystem::remove(array);
}

TEST(SerializedDataTest, ReadConfigLoadsObject) {
    auto path = std::filesystem::temp_directory_path() / "envelopekit_tower_config.json";
    std::ofstream(path) << R"({"floor_count": 8, "floor_height": 4.0})";

    auto config = json::read_config(path.string()).get<TowerConfig>();
    EXPECT_EQ(config.floor_count, 8);
    EXPECT_DOUBLE_EQ(config.floor_height, 4.0);

    std::filesystem::remove(path);
}
