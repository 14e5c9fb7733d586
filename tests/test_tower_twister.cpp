#include <gtest/gtest.h>
#include <tower/tower_twister.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <limits>

using namespace envelopekit;
using envelopekit::test::expect_near;

namespace {

Curve square_plan() {
    return Curve::rectangle(Plane::world_xy(), 2.0, 2.0);
}

}  // namespace

TEST(FloorTransformTest, GroundFloorIsIdentity) {
    EXPECT_TRUE(floor_transform(0, 3.5, 5, vec3::zero()).is_identity());
}

TEST(FloorTransformTest, TranslateThenRotateAboutRaisedAxis) {
    Transform xf = floor_transform(2, 3.0, 45, Vec3(1.0, 1.0, 0.0));
    // Axis point raised to floor elevation stays fixed
    expect_near(xf.apply(Vec3(1.0, 1.0, 0.0)), Vec3(1.0, 1.0, 6.0), 1e-12);
    // 90 degrees total
    expect_near(xf.apply(Vec3(2.0, 1.0, 0.0)), Vec3(1.0, 2.0, 6.0), 1e-12);
}

TEST(TwistTowerTest, FloorAndSurfaceCounts) {
    TowerResult tower = twist_tower(square_plan(), 4, 3.0, 10);
    ASSERT_EQ(tower.floor_curves.size(), 4u);
    // One face per plan segment per floor pair
    EXPECT_EQ(tower.surfaces.size(), 3u * 4u);
    for (const auto& surface : tower.surfaces) {
        EXPECT_NE(surface, nullptr);
    }
}

TEST(TwistTowerTest, FloorsAreElevatedAndRotated) {
    TowerResult tower = twist_tower(square_plan(), 3, 3.0, 90);

    expect_near(tower.floor_curves[0].points()[0], Vec3(-1.0, -1.0, 0.0), 1e-12);
    expect_near(tower.floor_curves[1].points()[0], Vec3(1.0, -1.0, 3.0), 1e-12);
    expect_near(tower.floor_curves[2].points()[0], Vec3(1.0, 1.0, 6.0), 1e-12);

    for (const auto& floor : tower.floor_curves) {
        EXPECT_TRUE(floor.is_closed());
        EXPECT_EQ(floor.point_count(), 4u);
    }
}

TEST(TwistTowerTest, ExplicitAxisPoint) {
    TowerResult tower = twist_tower(square_plan(), 2, 3.0, 180, Vec3(1.0, 0.0, 0.0));
    expect_near(tower.floor_curves[1].points()[0], Vec3(3.0, 1.0, 3.0), 1e-12);
}

TEST(TwistTowerTest, AxisDefaultsToPlanCenter) {
    Curve offset = Curve::rectangle(Plane(Vec3(10.0, 5.0, 0.0), vec3::unit_x(), vec3::unit_y()), 2.0, 2.0);
    TowerResult tower = twist_tower(offset, 2, 3.0, 37);
    expect_near(tower.floor_curves[1].bounding_box().center(), Vec3(10.0, 5.0, 3.0), 1e-9);
}

TEST(TwistTowerTest, NoRotationGivesVerticalWalls) {
    TowerResult tower = twist_tower(square_plan(), 2, 4.0, 0);
    double total = 0.0;
    for (const auto& surface : tower.surfaces) {
        total += area(*surface);
    }
    EXPECT_NEAR(total, 8.0 * 4.0, 1e-6);
}

TEST(TwistTowerTest, BaseCurveUnchanged) {
    Curve base = square_plan();
    Curve before = base;
    twist_tower(base, 5, 3.5, 15);
    EXPECT_EQ(base, before);
}

TEST(TwistTowerTest, ConfigOverload) {
    TowerConfig config;
    config.floor_count = 3;
    config.floor_height = 2.0;
    config.rotation_per_floor = 0;
    TowerResult tower = twist_tower(square_plan(), config);
    EXPECT_EQ(tower.floor_curves.size(), 3u);
    EXPECT_DOUBLE_EQ(tower.floor_curves[2].bounding_box().min.z, 4.0);
}

TEST(TwistTowerTest, RejectsInvalidInput) {
    EXPECT_THROW(twist_tower(Curve{}, 4, 3.0, 5), InputValidationError);
    EXPECT_THROW(twist_tower(Curve::polyline({{0, 0, 0}, {1, 0, 0}, {1, 1, 0}}), 4, 3.0, 5),
                 InputValidationError);
    EXPECT_THROW(twist_tower(square_plan(), 1, 3.0, 5), InputValidationError);
    EXPECT_THROW(twist_tower(square_plan(), 4, 0.0, 5), InputValidationError);
    EXPECT_THROW(twist_tower(square_plan(), 4, -1.0, 5), InputValidationError);
    EXPECT_THROW(twist_tower(square_plan(), 4, std::numeric_limits<double>::quiet_NaN(), 5),
                 InputValidationError);
}

TEST(TwistTowerTest, DegeneratePlanRejectedBeforeLofting) {
    Vec3 p(1.0, 1.0, 0.0);
    EXPECT_THROW(twist_tower(Curve({p, p, p}, true), 3, 3.0, 0), InputValidationError);

    // Three collinear points enclose nothing
    Curve flat({{0, 0, 0}, {1, 0, 0}, {2, 0, 0}}, true);
    EXPECT_THROW(twist_tower(flat, 3, 3.0, 0), InputValidationError);

    Curve two({{0, 0, 0}, {1, 0, 0}}, true);
    EXPECT_THROW(twist_tower(two, 3, 3.0, 0), InputValidationError);
}

TEST(TwistTowerTest, HalfTurnPerFloorLofts) {
    TowerResult tower = twist_tower(Curve::rectangle(Plane::world_xy(), 4.0, 2.0), 2, 3.0, 180);
    ASSERT_EQ(tower.floor_curves.size(), 2u);
    EXPECT_EQ(tower.surfaces.size(), 4u);
    expect_near(tower.floor_curves[1].points()[0], Vec3(2.0, 1.0, 3.0), 1e-12);
}
