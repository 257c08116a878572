#include <gtest/gtest.h>

#include "mass/apparent_mass.hpp"

#include <cmath>
#include <stdexcept>

using namespace mass;

class ApparentMassTest : public ::testing::Test {
protected:
    CanopyGeometry canopy{8.0, 2.5, 20.0};
};

TEST_F(ApparentMassTest, GeometryFromArea) {
    CanopyGeometry geom = canopy_geometry_from_area(20.439, 2.5);

    EXPECT_NEAR(geom.span, 20.439 / 2.5, 1e-12);
    EXPECT_DOUBLE_EQ(geom.chord, 2.5);
    EXPECT_DOUBLE_EQ(geom.area, 20.439);
}

TEST_F(ApparentMassTest, GeometryRejectsNonPositiveChord) {
    EXPECT_THROW(canopy_geometry_from_area(20.0, 0.0), std::invalid_argument);
    EXPECT_THROW(canopy_geometry_from_area(20.0, -1.0), std::invalid_argument);
}

TEST_F(ApparentMassTest, FlatPlateAddedMass) {
    ApparentMass m = compute_apparent_mass(canopy, 1.225);

    // π/4·ρ·c²·b, π/4·ρ·b²·c, π/4·ρ·t²·b with t = 0.1c
    EXPECT_NEAR(m.z, 48.1056, 1e-3);
    EXPECT_NEAR(m.y, M_PI / 4.0 * 1.225 * 64.0 * 2.5, 1e-9);
    EXPECT_NEAR(m.x, M_PI / 4.0 * 1.225 * 0.0625 * 8.0, 1e-9);
}

TEST_F(ApparentMassTest, NormalTermDominatesChordwise) {
    ApparentMass m = compute_apparent_mass(canopy);

    EXPECT_GT(m.z, 50.0 * m.x);
}

TEST_F(ApparentMassTest, AddedMassScalesWithDensity) {
    ApparentMass sea_level = compute_apparent_mass(canopy, 1.225);
    ApparentMass half = compute_apparent_mass(canopy, 0.6125);

    EXPECT_NEAR(half.z, 0.5 * sea_level.z, 1e-9);
    EXPECT_NEAR(half.y, 0.5 * sea_level.y, 1e-9);
}

TEST_F(ApparentMassTest, AddedInertia) {
    ApparentInertia I = compute_apparent_inertia(canopy, 1.225);
    const double k = M_PI / 4.0 * 1.225;

    EXPECT_NEAR(I.Ixx, k * 2.5 * 2.5 * 512.0 / 12.0, 1e-9);
    EXPECT_NEAR(I.Iyy, k * 8.0 * 2.5 * 2.5 * 2.5 / 12.0, 1e-9);
    EXPECT_NEAR(I.Izz, k * 0.0625 * 512.0 / 12.0, 1e-9);
}

TEST_F(ApparentMassTest, FullDeployMatchesFullGeometry) {
    ApparentMassResult deployed = apparent_mass_at_deploy(canopy, 1.0);
    ApparentMassResult full = compute_apparent_mass_result(canopy);

    EXPECT_NEAR(deployed.mass.z, full.mass.z, 1e-9);
    EXPECT_NEAR(deployed.inertia.Ixx, full.inertia.Ixx, 1e-9);
}

TEST_F(ApparentMassTest, PackedCanopyHasSmallAddedMass) {
    ApparentMassResult packed = apparent_mass_at_deploy(canopy, 0.0);
    ApparentMass full = compute_apparent_mass(canopy);

    // span × 0.1, chord × 0.2
    EXPECT_NEAR(packed.mass.z, full.z * 0.2 * 0.2 * 0.1, 1e-9);
    EXPECT_LT(packed.mass.z, full.z);
}

TEST_F(ApparentMassTest, DeployFractionIsClamped) {
    EXPECT_NEAR(apparent_mass_at_deploy(canopy, 1.5).mass.z, apparent_mass_at_deploy(canopy, 1.0).mass.z, 1e-12);
    EXPECT_NEAR(apparent_mass_at_deploy(canopy, -0.5).mass.z, apparent_mass_at_deploy(canopy, 0.0).mass.z, 1e-12);
}

TEST_F(ApparentMassTest, AddedMassGrowsWithDeploy) {
    double previous = 0.0;
    for (double d : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        const double mz = apparent_mass_at_deploy(canopy, d).mass.z;
        EXPECT_GT(mz, previous);
        previous = mz;
    }
}

TEST_F(ApparentMassTest, EffectiveMassAddsPerAxis) {
    ApparentMass apparent{1.0, 2.0, 3.0};

    Eigen::Vector3d m = effective_mass(80.0, apparent);

    EXPECT_TRUE(m.isApprox(Eigen::Vector3d(81.0, 82.0, 83.0)));
}

TEST_F(ApparentMassTest, EffectiveInertiaKeepsProducts) {
    common::InertiaComponents physical;
    physical.Ixx = 10.0;
    physical.Iyy = 20.0;
    physical.Izz = 30.0;
    physical.Ixz = -4.0;

    common::InertiaComponents I = effective_inertia(physical, ApparentInertia{1.0, 2.0, 3.0});

    EXPECT_DOUBLE_EQ(I.Ixx, 11.0);
    EXPECT_DOUBLE_EQ(I.Iyy, 22.0);
    EXPECT_DOUBLE_EQ(I.Izz, 33.0);
    EXPECT_DOUBLE_EQ(I.Ixz, -4.0);
}
