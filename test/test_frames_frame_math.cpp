#include <gtest/gtest.h>

#include "frames/frame_math.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <vector>

using namespace frames;

namespace {
constexpr double g = STANDARD_GRAVITY;
constexpr double DEG = M_PI / 180.0;

auto render_matrix() -> Eigen::Matrix3d {
    Eigen::Matrix3d T;
    T << 0, -1, 0,
         0, 0, -1,
         1, 0, 0;
    return T;
}

auto same_rotation(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b) -> bool {
    return std::abs(std::abs(a.dot(b)) - 1.0) < 1e-9;
}
} // namespace

// ============================================
// DCM
// ============================================

TEST(FrameMathTest, BodyToInertialIdentityAtZero) {
    EXPECT_TRUE(dcm_body_to_inertial(0.0, 0.0, 0.0).isApprox(Eigen::Matrix3d::Identity()));
}

TEST(FrameMathTest, BodyToInertialIsOrthonormal) {
    for (double phi : {-2.0, -0.3, 0.7, 2.5}) {
        for (double theta : {-1.2, 0.1, 1.0}) {
            for (double psi : {-3.0, 0.4, 1.9}) {
                Eigen::Matrix3d R = dcm_body_to_inertial(phi, theta, psi);
                EXPECT_TRUE((R * R.transpose()).isApprox(Eigen::Matrix3d::Identity(), 1e-12));
                EXPECT_NEAR(R.determinant(), 1.0, 1e-12);
            }
        }
    }
}

TEST(FrameMathTest, PureYawPointsNoseEast) {
    Eigen::Vector3d nose = dcm_body_to_inertial(0.0, 0.0, M_PI / 2) * Eigen::Vector3d::UnitX();

    EXPECT_NEAR(nose.x(), 0.0, 1e-12);
    EXPECT_NEAR(nose.y(), 1.0, 1e-12);
    EXPECT_NEAR(nose.z(), 0.0, 1e-12);
}

TEST(FrameMathTest, PitchUpPointsNoseUp) {
    Eigen::Vector3d nose = dcm_body_to_inertial(0.0, M_PI / 2, 0.0) * Eigen::Vector3d::UnitX();

    EXPECT_NEAR(nose.z(), -1.0, 1e-12);
}

TEST(FrameMathTest, RollRightPointsRightWingDown) {
    Eigen::Vector3d right_wing = dcm_body_to_inertial(M_PI / 2, 0.0, 0.0) * Eigen::Vector3d::UnitY();

    EXPECT_NEAR(right_wing.z(), 1.0, 1e-12);
}

TEST(FrameMathTest, WindToBodyIdentityAtZero) {
    EXPECT_TRUE(dcm_wind_to_body(0.0, 0.0).isApprox(Eigen::Matrix3d::Identity()));
}

TEST(FrameMathTest, WindToBodyIsOrthonormal) {
    Eigen::Matrix3d R = dcm_wind_to_body(12.0 * DEG, -7.0 * DEG);

    EXPECT_TRUE((R * R.transpose()).isApprox(Eigen::Matrix3d::Identity(), 1e-12));
    EXPECT_NEAR(R.determinant(), 1.0, 1e-12);
}

// ============================================
// QUATERNIONS
// ============================================

TEST(FrameMathTest, RenderQuaternionIdentityAtZero) {
    Eigen::Quaterniond q = body_to_inertial_quat(0.0, 0.0, 0.0);

    EXPECT_TRUE(same_rotation(q, Eigen::Quaterniond::Identity()));
}

TEST(FrameMathTest, RenderQuaternionMatchesRemappedDcm) {
    const double phi = 0.4, theta = -0.2, psi = 1.1;
    const Eigen::Matrix3d T = render_matrix();
    Eigen::Matrix3d expected = T * dcm_body_to_inertial(phi, theta, psi) * T.transpose();

    Eigen::Quaterniond q = body_to_inertial_quat(phi, theta, psi);

    EXPECT_NEAR(q.norm(), 1.0, 1e-12);
    EXPECT_TRUE(q.toRotationMatrix().isApprox(expected, 1e-12));
}

TEST(FrameMathTest, RenderQuaternionYawTurnsForwardLeft) {
    // Render forward is +z; nose east maps to render -x
    Eigen::Vector3d nose = body_to_inertial_quat(0.0, 0.0, M_PI / 2) * Eigen::Vector3d::UnitZ();

    EXPECT_NEAR(nose.x(), -1.0, 1e-12);
    EXPECT_NEAR(nose.y(), 0.0, 1e-12);
    EXPECT_NEAR(nose.z(), 0.0, 1e-12);
}

TEST(FrameMathTest, EquivalentAttitudesGiveSameQuaternion) {
    // (φ, θ, ψ) and (φ + π, π − θ, ψ + π) describe the same attitude
    std::vector<Eigen::Vector3d> attitudes = {
        {0.3, 0.2, 0.1},
        {-1.0, 1.4, 2.0},
        {2.9, 89.9 * DEG, -0.5},
    };

    for (const auto& a : attitudes) {
        Eigen::Quaterniond q1 = body_to_inertial_quat(a.x(), a.y(), a.z());
        Eigen::Quaterniond q2 = body_to_inertial_quat(a.x() + M_PI, M_PI - a.y(), a.z() + M_PI);
        EXPECT_TRUE(same_rotation(q1, q2));

        Eigen::Quaterniond n1 = body_to_inertial_quat_ned(a.x(), a.y(), a.z());
        Eigen::Quaterniond n2 = body_to_inertial_quat_ned(a.x() + M_PI, M_PI - a.y(), a.z() + M_PI);
        EXPECT_TRUE(same_rotation(n1, n2));
    }
}

TEST(FrameMathTest, NedQuaternionRotatesLikeDcm) {
    const double phi = -0.6, theta = 0.3, psi = 2.2;
    Eigen::Vector3d v(1.0, -2.0, 0.5);

    Eigen::Vector3d expected = dcm_body_to_inertial(phi, theta, psi) * v;
    Eigen::Vector3d actual = body_to_inertial_quat_ned(phi, theta, psi) * v;

    EXPECT_TRUE(actual.isApprox(expected, 1e-12));
}

TEST(FrameMathTest, WindAttitudeReducesToWindQuaternion) {
    Eigen::Quaterniond q_wind = body_to_inertial_quat(0.2, -0.4, 1.3);
    Eigen::Quaterniond q_body = body_quat_from_wind_attitude(0.2, -0.4, 1.3, 0.0, 0.0);

    EXPECT_TRUE(same_rotation(q_wind, q_body));
}

TEST(FrameMathTest, PositiveAlphaPitchesNoseUp) {
    Eigen::Quaterniond q = body_quat_from_wind_attitude(0.0, 0.0, 0.0, 10.0 * DEG, 0.0);

    // Render forward +z, render up +y
    Eigen::Vector3d nose = q * Eigen::Vector3d::UnitZ();
    EXPECT_GT(nose.y(), 0.0);
    EXPECT_NEAR(nose.y(), std::sin(10.0 * DEG), 1e-12);
}

TEST(FrameMathTest, WindDirectionFromAheadAtZero) {
    Eigen::Vector3d wind = wind_direction_body(0.0, 0.0);

    EXPECT_TRUE(wind.isApprox(Eigen::Vector3d(0.0, 0.0, 1.0)));
}

TEST(FrameMathTest, WindDirectionIsUnitAndFollowsConvention) {
    const double alpha = 8.0 * DEG, beta = 5.0 * DEG;
    Eigen::Vector3d wind = wind_direction_body(alpha, beta);

    EXPECT_NEAR(wind.norm(), 1.0, 1e-12);
    EXPECT_NEAR(wind.x(), std::sin(beta) * std::cos(alpha), 1e-12);
    EXPECT_NEAR(wind.y(), -std::sin(alpha), 1e-12);
    EXPECT_NEAR(wind.z(), std::cos(beta) * std::cos(alpha), 1e-12);
}

// ============================================
// EULER RATES
// ============================================

TEST(FrameMathTest, EulerRatesRoundTrip) {
    const double p = 0.3, q = -0.2, r = 0.5;

    for (double phi : {-2.5, -0.5, 0.0, 30.0 * DEG, 1.5}) {
        for (double theta : {-1.3, -0.2, 0.0, 15.0 * DEG, 1.3}) {
            common::EulerRates euler = euler_rates(p, q, r, phi, theta);
            common::BodyRates body = euler_rates_to_body_rates(
                euler.phi_dot, euler.theta_dot, euler.psi_dot, phi, theta);

            EXPECT_NEAR(body.p, p, 1e-10);
            EXPECT_NEAR(body.q, q, 1e-10);
            EXPECT_NEAR(body.r, r, 1e-10);
        }
    }
}

TEST(FrameMathTest, LevelYawRateIsPureR) {
    common::BodyRates body = euler_rates_to_body_rates(0.0, 0.0, 0.5, 0.0, 0.0);

    EXPECT_NEAR(body.p, 0.0, 1e-12);
    EXPECT_NEAR(body.q, 0.0, 1e-12);
    EXPECT_NEAR(body.r, 0.5, 1e-12);
}

TEST(FrameMathTest, PitchedYawRateCouplesIntoRoll) {
    const double theta = 20.0 * DEG;
    common::BodyRates body = euler_rates_to_body_rates(0.0, 0.0, 0.5, 0.0, theta);

    EXPECT_NEAR(body.p, -0.5 * std::sin(theta), 1e-12);
    EXPECT_NEAR(body.r, 0.5 * std::cos(theta), 1e-12);
}

TEST(FrameMathTest, EulerRatesEqualBodyRatesAtZeroAttitude) {
    common::EulerRates euler = euler_rates(0.1, 0.2, 0.3, 0.0, 0.0);

    EXPECT_NEAR(euler.phi_dot, 0.1, 1e-12);
    EXPECT_NEAR(euler.theta_dot, 0.2, 1e-12);
    EXPECT_NEAR(euler.psi_dot, 0.3, 1e-12);
}

// ============================================
// GRAVITY AND VELOCITY
// ============================================

TEST(FrameMathTest, GravityLevel) {
    EXPECT_TRUE(gravity_body(0.0, 0.0).isApprox(Eigen::Vector3d(0.0, 0.0, g)));
}

TEST(FrameMathTest, GravityNoseUp) {
    Eigen::Vector3d gb = gravity_body(0.0, M_PI / 2);

    EXPECT_NEAR(gb.x(), -g, 1e-9);
    EXPECT_NEAR(gb.y(), 0.0, 1e-9);
    EXPECT_NEAR(gb.z(), 0.0, 1e-9);
}

TEST(FrameMathTest, GravityRolledRight) {
    Eigen::Vector3d gb = gravity_body(M_PI / 2, 0.0);

    EXPECT_NEAR(gb.x(), 0.0, 1e-9);
    EXPECT_NEAR(gb.y(), g, 1e-9);
    EXPECT_NEAR(gb.z(), 0.0, 1e-9);
}

TEST(FrameMathTest, GravityInverted) {
    Eigen::Vector3d gb = gravity_body(M_PI, 0.0);

    EXPECT_NEAR(gb.x(), 0.0, 1e-9);
    EXPECT_NEAR(gb.y(), 0.0, 1e-9);
    EXPECT_NEAR(gb.z(), -g, 1e-9);
}

TEST(FrameMathTest, GravityMatchesRotatedInertialGravity) {
    const double phi = 0.4, theta = -0.3, psi = 1.0;
    Eigen::Vector3d expected = dcm_body_to_inertial(phi, theta, psi).transpose() * Eigen::Vector3d(0.0, 0.0, g);

    EXPECT_TRUE(gravity_body(phi, theta).isApprox(expected, 1e-12));
}

TEST(FrameMathTest, BodyVelocityRotatedByHeading) {
    common::Attitude heading_east{0.0, 0.0, M_PI / 2};
    Eigen::Vector3d v = body_to_inertial_velocity(Eigen::Vector3d(10.0, 0.0, 0.0), heading_east);

    EXPECT_NEAR(v.x(), 0.0, 1e-9);
    EXPECT_NEAR(v.y(), 10.0, 1e-9);
    EXPECT_NEAR(v.z(), 0.0, 1e-9);
}

// ============================================
// RENDER BOUNDARY
// ============================================

TEST(FrameMathTest, NedToRenderAxes) {
    EXPECT_TRUE(ned_to_render(Eigen::Vector3d::UnitX()).isApprox(Eigen::Vector3d(0.0, 0.0, 1.0)));
    EXPECT_TRUE(ned_to_render(Eigen::Vector3d::UnitY()).isApprox(Eigen::Vector3d(-1.0, 0.0, 0.0)));
    EXPECT_TRUE(ned_to_render(Eigen::Vector3d::UnitZ()).isApprox(Eigen::Vector3d(0.0, -1.0, 0.0)));
}

TEST(FrameMathTest, RenderToNedInvertsNedToRender) {
    Eigen::Vector3d v(1.5, -2.0, 0.25);

    EXPECT_TRUE(render_to_ned(ned_to_render(v)).isApprox(v));
}
