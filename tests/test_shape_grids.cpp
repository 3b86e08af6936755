#include <gtest/gtest.h>
#include "errors.h"
#include "shape_grids.h"
#include <cmath>
#include <numbers>

using namespace ShapeKit;

namespace {
    ShapeParams Resolution(int rows, int cols) {
        ShapeParams p;
        p.rows = rows;
        p.cols = cols;
        return p;
    }
}

TEST(ShapeGridsTest, ParseShapeNames) {
    EXPECT_EQ(ParseShapeKind("sphere"), ShapeKind::Sphere);
    EXPECT_EQ(ParseShapeKind("Torus"), ShapeKind::Torus);
    EXPECT_EQ(ParseShapeKind("worm"), ShapeKind::Worm);
    EXPECT_EQ(ShapeName(ShapeKind::Revolution), "revolution");
    EXPECT_THROW(ParseShapeKind("cube"), ConfigurationError);
    EXPECT_TRUE(IsTubeShape(ShapeKind::Extrusion));
    EXPECT_FALSE(IsTubeShape(ShapeKind::Disk));
}

TEST(ShapeGridsTest, DefaultResolutions) {
    auto sphere = MakeShapeGrid(ShapeKind::Sphere, {});
    EXPECT_EQ(sphere->Rows(), 128);
    EXPECT_EQ(sphere->Cols(), 256);
    auto plane = MakeShapeGrid(ShapeKind::Plane, {});
    EXPECT_EQ(plane->Rows(), 256);
    EXPECT_EQ(plane->Cols(), 256);
}

TEST(ShapeGridsTest, SphereUnperturbedHasUnitRadius) {
    auto grid = MakeShapeGrid(ShapeKind::Sphere, Resolution(8, 16));
    auto vertices = grid->ToCartesian(grid->Base());
    ASSERT_EQ(vertices.size(), 8u * 16u);
    for (const auto& v : vertices) {
        EXPECT_NEAR(glm::length(v), 1.0, 1e-12);
    }
    // First row is the south pole, last row the north pole.
    EXPECT_NEAR(vertices.front().z, -1.0, 1e-12);
    EXPECT_NEAR(vertices.back().z, 1.0, 1e-12);
    EXPECT_EQ(grid->AmplitudeLimit().value(), 1.0);
}

TEST(ShapeGridsTest, SphereModulationCoordinatesAreTurns) {
    auto grid = MakeShapeGrid(ShapeKind::Sphere, Resolution(8, 16));
    EXPECT_NEAR(grid->ModulationX()(0, 0), -0.5, 1e-12);
    EXPECT_NEAR(grid->ModulationX()(0, 8), 0.0, 1e-12);
    EXPECT_NEAR(grid->ModulationY()(0, 0), -0.25, 1e-12);
    EXPECT_NEAR(grid->ModulationY()(7, 0), 0.25, 1e-12);
}

TEST(ShapeGridsTest, SphereDistances) {
    auto grid = MakeShapeGrid(ShapeKind::Sphere, Resolution(9, 16));
    const double pi = std::numbers::pi;
    EXPECT_NEAR(grid->Distance({0.0, 0.0}, {pi / 2.0, 0.0}), pi / 2.0, 1e-12);
    EXPECT_NEAR(grid->Distance({0.0, pi / 2.0}, {1.0, pi / 2.0}), 0.0, 1e-7);
    EXPECT_NEAR(grid->Distance({-pi + 0.1, 0.0}, {pi - 0.1, 0.0}), 0.2, 1e-12);

    Field d = grid->DistanceField({0.0, 0.0});
    // Row 4 is the equator, column 8 is azimuth 0.
    EXPECT_NEAR(d(4, 8), 0.0, 1e-7);
    EXPECT_NEAR(d(8, 0), pi / 2.0, 1e-12);
}

TEST(ShapeGridsTest, PlaneUnperturbedIsFlat) {
    ShapeParams p = Resolution(4, 8);
    auto grid = MakeShapeGrid(ShapeKind::Plane, p);
    auto vertices = grid->ToCartesian(grid->Base());
    ASSERT_EQ(vertices.size(), 32u);
    for (const auto& v : vertices) {
        EXPECT_DOUBLE_EQ(v.z, 0.0);
    }
    // Width 1, height rows/cols.
    EXPECT_DOUBLE_EQ(vertices.front().x, -0.5);
    EXPECT_DOUBLE_EQ(vertices.back().x, 0.5);
    EXPECT_DOUBLE_EQ(vertices.front().y, -0.25);
    EXPECT_DOUBLE_EQ(vertices.back().y, 0.25);
    EXPECT_FALSE(grid->AmplitudeLimit().has_value());
    EXPECT_FALSE(grid->Topology().wrap_cols);
}

TEST(ShapeGridsTest, PolarDiskIsUnitDisk) {
    auto grid = MakeShapeGrid(ShapeKind::Disk, Resolution(5, 12));
    auto vertices = grid->ToCartesian(grid->Base());
    for (int i = 0; i < 5; ++i) {
        for (int j = 0; j < 12; ++j) {
            const auto& v = vertices[i * 12 + j];
            EXPECT_DOUBLE_EQ(v.y, 0.0);
            EXPECT_NEAR(std::hypot(v.x, v.z), i / 4.0, 1e-12);
        }
    }
    EXPECT_TRUE(grid->Topology().wrap_cols);
}

TEST(ShapeGridsTest, CartesianDiskStaysInsideUnitCircle) {
    ShapeParams p = Resolution(9, 9);
    p.disk_coords = DiskCoords::Cartesian;
    auto grid = MakeShapeGrid(ShapeKind::Disk, p);
    auto vertices = grid->ToCartesian(grid->Base());
    for (const auto& v : vertices) {
        EXPECT_LE(std::hypot(v.x, v.z), 1.0 + 1e-12);
    }
    // Square corners land on the circle.
    EXPECT_NEAR(std::hypot(vertices.front().x, vertices.front().z), 1.0, 1e-12);
    EXPECT_FALSE(grid->Topology().wrap_cols);
}

TEST(ShapeGridsTest, TorusUnperturbed) {
    auto grid = MakeShapeGrid(ShapeKind::Torus, Resolution(8, 16));
    auto vertices = grid->ToCartesian(grid->Base());
    ASSERT_EQ(vertices.size(), 128u);
    for (const auto& v : vertices) {
        // Distance from the tube centre circle equals the minor radius.
        const double ring = std::hypot(v.x, v.y) - 1.0;
        EXPECT_NEAR(std::hypot(ring, v.z), 0.4, 1e-12);
    }
    EXPECT_DOUBLE_EQ(grid->AmplitudeLimit().value(), 0.4);
    EXPECT_TRUE(grid->Topology().wrap_rows);
}

TEST(ShapeGridsTest, TorusMajorRadiusModulation) {
    ShapeParams p = Resolution(4, 8);
    p.major_radius_components = {SineComponent::Carrier({1, 0.2, 90})};
    auto grid = MakeShapeGrid(ShapeKind::Torus, p);
    const auto& torus = dynamic_cast<const TorusGrid&>(*grid);
    ASSERT_EQ(torus.MajorRadius().size(), 8u);
    // Column 4 is theta 0: 1 + 0.2 sin(90 deg).
    EXPECT_NEAR(torus.MajorRadius()[4], 1.2, 1e-12);

    p.major_radius_components = {SineComponent::Carrier({1, 1.5})};
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Torus, p), AmplitudeError);
}

TEST(ShapeGridsTest, CylinderUnperturbed) {
    auto grid = MakeShapeGrid(ShapeKind::Cylinder, Resolution(5, 12));
    auto vertices = grid->ToCartesian(grid->Base());
    ASSERT_EQ(vertices.size(), 60u);
    for (const auto& v : vertices) {
        EXPECT_NEAR(std::hypot(v.x, v.z), 1.0, 1e-12);
        EXPECT_LE(std::abs(v.y), std::numbers::pi + 1e-12);
    }
    EXPECT_NEAR(vertices.front().y, -std::numbers::pi, 1e-12);
}

TEST(ShapeGridsTest, CylinderCapsAddCenters) {
    ShapeParams p = Resolution(5, 12);
    p.caps = true;
    auto grid = MakeShapeGrid(ShapeKind::Cylinder, p);
    auto vertices = grid->ToCartesian(grid->Base());
    ASSERT_EQ(vertices.size(), 62u);
    EXPECT_NEAR(vertices[60].y, -std::numbers::pi, 1e-12);
    EXPECT_NEAR(vertices[61].y, std::numbers::pi, 1e-12);
    EXPECT_TRUE(grid->Topology().caps);
}

TEST(ShapeGridsTest, RevolutionFollowsRadiusCurve) {
    ShapeParams p = Resolution(3, 8);
    p.rcurve = {1.0, 0.5};
    auto grid = MakeShapeGrid(ShapeKind::Revolution, p);
    EXPECT_DOUBLE_EQ(grid->Base()(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(grid->Base()(1, 3), 0.75);
    EXPECT_DOUBLE_EQ(grid->Base()(2, 7), 0.5);
}

TEST(ShapeGridsTest, ExtrusionCombinesCurves) {
    ShapeParams p = Resolution(3, 4);
    p.ecurve = {1.0, 2.0};
    p.rcurve = {1.0, 3.0};
    auto grid = MakeShapeGrid(ShapeKind::Extrusion, p);
    // ecurve resampled to {1, 1.5, 2, 1.5}, rcurve to {1, 2, 3}.
    EXPECT_DOUBLE_EQ(grid->Base()(1, 2), 4.0);

    p.curve_combine = CurveCombine::Add;
    auto added = MakeShapeGrid(ShapeKind::Extrusion, p);
    EXPECT_DOUBLE_EQ(added->Base()(1, 2), 4.0);
    EXPECT_DOUBLE_EQ(added->Base()(2, 1), 4.5);
}

TEST(ShapeGridsTest, WormSpineOffsetsCrossSections) {
    ShapeParams p = Resolution(3, 8);
    p.spine = {{0, 0, 0}, {0.5, 0, 0}, {1, 0, 0}};
    auto grid = MakeShapeGrid(ShapeKind::Worm, p);
    auto vertices = grid->ToCartesian(grid->Base());
    // Row 2 is shifted by one unit along x.
    double cx = 0.0;
    for (int j = 0; j < 8; ++j) {
        cx += vertices[2 * 8 + j].x;
    }
    EXPECT_NEAR(cx / 8.0, 1.0, 1e-12);
}

TEST(ShapeGridsTest, MultiplyCombineScalesPerturbations) {
    ShapeParams p = Resolution(3, 4);
    p.rcurve = {2.0, 2.0};
    p.perturbation_combine = CurveCombine::Multiply;
    auto grid = MakeShapeGrid(ShapeKind::Revolution, p);
    Field ones = Field::Ones(3, 4);
    EXPECT_TRUE((grid->PreparePerturbation(ones) == 2.0).all());
}

TEST(ShapeGridsTest, TubeDistanceWrapsAngle) {
    auto grid = MakeShapeGrid(ShapeKind::Cylinder, Resolution(4, 8));
    const double pi = std::numbers::pi;
    EXPECT_NEAR(grid->Distance({-pi + 0.1, 0.0}, {pi - 0.1, 0.0}), 0.2, 1e-12);
    EXPECT_NEAR(grid->Distance({0.0, 0.0}, {0.0, 1.5}), 1.5, 1e-12);
}

TEST(ShapeGridsTest, InvalidConfigurationsThrow) {
    ShapeParams caps;
    caps.caps = true;
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Sphere, caps), ConfigurationError);

    ShapeParams curve;
    curve.rcurve = {1.0, 2.0};
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Cylinder, curve), ConfigurationError);
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Plane, curve), ConfigurationError);

    EXPECT_THROW(MakeShapeGrid(ShapeKind::Revolution, {}), ConfigurationError);
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Extrusion, {}), ConfigurationError);
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Worm, {}), ConfigurationError);

    EXPECT_THROW(MakeShapeGrid(ShapeKind::Torus, Resolution(2, 8)), ConfigurationError);
    EXPECT_THROW(MakeShapeGrid(ShapeKind::Plane, Resolution(1, 8)), ConfigurationError);
}

TEST(ShapeGridsTest, RandomPointsStayInDomain) {
    std::mt19937 rng(42);
    auto sphere = MakeShapeGrid(ShapeKind::Sphere, Resolution(8, 16));
    auto disk = MakeShapeGrid(ShapeKind::Disk, Resolution(8, 16));
    for (int k = 0; k < 200; ++k) {
        auto s = sphere->RandomPoint(rng);
        EXPECT_LE(std::abs(s.y), std::numbers::pi / 2.0);
        auto d = disk->RandomPoint(rng);
        EXPECT_LE(glm::length(d), 1.0 + 1e-12);
    }
}
