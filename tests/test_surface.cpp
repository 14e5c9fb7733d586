#include <gtest/gtest.h>
#include <geometry/geometry.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace envelopekit;
using envelopekit::test::expect_near;

TEST(SurfaceTest, PlaneEvaluatesOnPlacement) {
    auto surface = envelopekit::test::flat_surface(10.0, 5.0);
    EXPECT_DOUBLE_EQ(surface->domain(0).max, 10.0);
    EXPECT_DOUBLE_EQ(surface->domain(1).max, 5.0);
    expect_near(surface->point_at(2.0, 3.0), Vec3(2.0, 3.0, 0.0));
    expect_near(surface->normal_at(1.0, 1.0), vec3::unit_z());
}

TEST(SurfaceTest, BilinearCornersMatchParameters) {
    SurfacePtr patch = Surface::bilinear({0, 0, 0}, {2, 0, 0}, {2, 2, 1}, {0, 2, 0});
    EXPECT_EQ(patch->type_name(), "bilinear");
    expect_near(patch->point_at(0.0, 0.0), Vec3(0, 0, 0), 1e-12);
    expect_near(patch->point_at(1.0, 0.0), Vec3(2, 0, 0), 1e-12);
    expect_near(patch->point_at(1.0, 1.0), Vec3(2, 2, 1), 1e-12);
    expect_near(patch->point_at(0.0, 1.0), Vec3(0, 2, 0), 1e-12);
    expect_near(patch->point_at(0.5, 0.5), Vec3(1, 1, 0.25), 1e-12);
}

TEST(SurfaceTest, CylinderPointsLieOnRadius) {
    auto cylinder = envelopekit::test::quarter_cylinder();
    Vec3 p = cylinder->point_at(0.7, 12.0);
    EXPECT_NEAR(std::hypot(p.x, p.y), 10.0, 1e-12);
    EXPECT_DOUBLE_EQ(p.z, 12.0);
    // Outward normal
    Vec3 n = cylinder->normal_at(0.0, 0.0);
    expect_near(n, vec3::unit_x(), 1e-12);
    EXPECT_EQ(cylinder->type_name(), "cylinder");
    EXPECT_DOUBLE_EQ(cylinder->radius().value(), 10.0);
}

TEST(SurfaceTest, PlacementOfAnalyticSurfaces) {
    Plane tilted(Vec3(1, 2, 3), vec3::unit_y(), vec3::unit_z());
    SurfacePtr plane = Surface::plane(tilted, Interval{0.0, 4.0}, Interval{-1.0, 1.0});
    ASSERT_TRUE(plane->placement().has_value());
    expect_near(plane->placement()->origin, tilted.origin, 1e-12);
    expect_near(plane->placement()->x_axis, tilted.x_axis, 1e-12);
    expect_near(plane->point_at(2.0, 1.0), tilted.point_at(2.0, 1.0), 1e-12);
    EXPECT_FALSE(plane->radius().has_value());

    SurfacePtr patch = Surface::bilinear({0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0});
    EXPECT_FALSE(patch->placement().has_value());
}

TEST(SurfaceTest, CornersFollowDomain) {
    auto surface = envelopekit::test::flat_surface(10.0, 5.0);
    auto corners = surface->corners();
    expect_near(corners[0], Vec3(0, 0, 0), 1e-12);
    expect_near(corners[1], Vec3(10, 0, 0), 1e-12);
    expect_near(corners[2], Vec3(10, 5, 0), 1e-12);
    expect_near(corners[3], Vec3(0, 5, 0), 1e-12);
}

TEST(SurfaceTest, RejectsEmptyRanges) {
    EXPECT_THROW(Surface::plane(Plane::world_xy(), Interval{1.0, 1.0}, Interval{0.0, 1.0}),
                 InputValidationError);
    EXPECT_THROW(Surface::cylinder(Plane::world_xy(), 0.0, Interval{0.0, 1.0}, Interval{0.0, 1.0}),
                 InputValidationError);
    EXPECT_THROW(Surface::cylinder(Plane::world_xy(), 1.0, Interval{0.0, 7.0}, Interval{0.0, 1.0}),
                 InputValidationError);
}

TEST(SurfaceTest, FrameAtMidpoint) {
    SurfacePtr patch = Surface::bilinear({0, 0, 0}, {4, 0, 0}, {4, 2, 0}, {0, 2, 0});
    auto frame = patch->frame_at(0.5, 0.5);
    ASSERT_TRUE(frame.has_value());
    expect_near(frame->origin, Vec3(2, 1, 0));
    expect_near(frame->x_axis, vec3::unit_x());
    expect_near(frame->z_axis, vec3::unit_z());
}

TEST(SurfaceTest, FrameAtDegeneratePointIsEmpty) {
    // Corner b == a collapses dS/du along v = 0
    SurfacePtr patch = Surface::bilinear({0, 0, 0}, {0, 0, 0}, {1, 1, 0}, {0, 1, 0});
    EXPECT_FALSE(patch->frame_at(0.0, 0.0).has_value());
}

TEST(GeometryTest, CoerceSurfaceUnwrapsFacesAndBreps) {
    auto surface = envelopekit::test::flat_surface();
    EXPECT_EQ(coerce_surface(Geometry{surface}), surface);
    EXPECT_EQ(coerce_surface(Geometry{BrepFace::from_surface(surface)}), surface);

    // A brep's face carries its own copy of the surface, bounded like the input
    SurfacePtr from_brep = coerce_surface(Geometry{to_brep(surface)});
    ASSERT_TRUE(from_brep);
    EXPECT_EQ(from_brep->type_name(), "plane");
    EXPECT_NEAR(from_brep->domain(0).max, 10.0, 1e-9);
    EXPECT_NEAR(from_brep->domain(1).max, 10.0, 1e-9);
}

TEST(GeometryTest, CoerceSurfaceRejectsNothing) {
    EXPECT_THROW(coerce_surface(Geometry{}), InputValidationError);
    EXPECT_THROW(coerce_surface(Geometry{SurfacePtr{}}), InputValidationError);
    EXPECT_THROW(coerce_surface(Geometry{Brep{}}), InputValidationError);
}

TEST(GeometryTest, CoerceSurfaceRejectsCurvesAndPoints) {
    EXPECT_THROW(coerce_surface(Geometry{envelopekit::test::unit_square()}), UnsupportedInputError);
    EXPECT_THROW(coerce_surface(Geometry{Vec3(1, 2, 3)}), UnsupportedInputError);
}

TEST(GeometryTest, TypeNames) {
    EXPECT_EQ(geometry_type_name(Geometry{}), "nothing");
    EXPECT_EQ(geometry_type_name(Geometry{envelopekit::test::flat_surface()}), "plane surface");
    EXPECT_EQ(geometry_type_name(Geometry{Vec3()}), "point");
}
