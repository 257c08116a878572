#include "frames/frame_math.hpp"

#include <cmath>

namespace frames {

namespace {

/// @brief NED → render axis permutation, (x, y, z)_render = (−y, −z, x)_NED
auto ned_to_render_matrix() -> Eigen::Matrix3d {
    Eigen::Matrix3d T;
    T <<  0.0, -1.0,  0.0,
          0.0,  0.0, -1.0,
          1.0,  0.0,  0.0;
    return T;
}

} // namespace

auto dcm_body_to_inertial(double phi, double theta, double psi) -> Eigen::Matrix3d {
    const double cp = std::cos(phi),   sp = std::sin(phi);
    const double ct = std::cos(theta), st = std::sin(theta);
    const double cy = std::cos(psi),   sy = std::sin(psi);

    // Inertial-to-body R_EB = Rx(φ)·Ry(θ)·Rz(ψ):
    //   [ ct*cy,              ct*sy,             -st    ]
    //   [ sp*st*cy - cp*sy,   sp*st*sy + cp*cy,   sp*ct ]
    //   [ cp*st*cy + sp*sy,   cp*st*sy - sp*cy,   cp*ct ]
    Eigen::Matrix3d R_EB;
    R_EB << ct * cy,                 ct * sy,                 -st,
            sp * st * cy - cp * sy,  sp * st * sy + cp * cy,  sp * ct,
            cp * st * cy + sp * sy,  cp * st * sy - sp * cy,  cp * ct;

    return R_EB.transpose();
}

auto dcm_wind_to_body(double alpha, double beta) -> Eigen::Matrix3d {
    const double ca = std::cos(alpha), sa = std::sin(alpha);
    const double cb = std::cos(beta),  sb = std::sin(beta);

    Eigen::Matrix3d R_BW;
    R_BW <<  ca * cb,  sa,  -ca * sb,
            -sa * cb,  ca,   sa * sb,
             sb,       0.0,  cb;
    return R_BW;
}

auto body_to_inertial_quat(double phi, double theta, double psi) -> Eigen::Quaterniond {
    const Eigen::Matrix3d T = ned_to_render_matrix();
    const Eigen::Matrix3d R_render = T * dcm_body_to_inertial(phi, theta, psi) * T.transpose();

    Eigen::Quaterniond q(R_render);
    q.normalize();
    return q;
}

auto body_to_inertial_quat_ned(double phi, double theta, double psi) -> Eigen::Quaterniond {
    Eigen::Quaterniond q(dcm_body_to_inertial(phi, theta, psi));
    q.normalize();
    return q;
}

auto body_quat_from_wind_attitude(
    double wind_phi,
    double wind_theta,
    double wind_psi,
    double alpha,
    double beta
) -> Eigen::Quaterniond {
    const Eigen::Quaterniond q_wind = body_to_inertial_quat(wind_phi, wind_theta, wind_psi);
    const Eigen::Quaterniond q_alpha(Eigen::AngleAxisd(-alpha, Eigen::Vector3d::UnitX()));
    const Eigen::Quaterniond q_beta(Eigen::AngleAxisd(beta, Eigen::Vector3d::UnitY()));

    return (q_wind * q_alpha * q_beta).normalized();
}

auto wind_direction_body(double alpha, double beta) -> Eigen::Vector3d {
    Eigen::Vector3d dir(
        std::sin(beta) * std::cos(alpha),
        -std::sin(alpha),
        std::cos(beta) * std::cos(alpha)
    );
    return dir.normalized();
}

auto euler_rates(double p, double q, double r, double phi, double theta) -> common::EulerRates {
    const double sp = std::sin(phi), cp = std::cos(phi);
    const double ct = std::cos(theta), tt = std::tan(theta);

    common::EulerRates rates;
    rates.phi_dot = p + (sp * tt) * q + (cp * tt) * r;
    rates.theta_dot = cp * q - sp * r;
    rates.psi_dot = (sp / ct) * q + (cp / ct) * r;
    return rates;
}

auto euler_rates_to_body_rates(
    double phi_dot,
    double theta_dot,
    double psi_dot,
    double phi,
    double theta
) -> common::BodyRates {
    const double sp = std::sin(phi), cp = std::cos(phi);
    const double st = std::sin(theta), ct = std::cos(theta);

    common::BodyRates rates;
    rates.p = phi_dot - psi_dot * st;
    rates.q = theta_dot * cp + psi_dot * sp * ct;
    rates.r = -theta_dot * sp + psi_dot * cp * ct;
    return rates;
}

auto gravity_body(double phi, double theta, double g) -> Eigen::Vector3d {
    const double st = std::sin(theta), ct = std::cos(theta);
    return {
        -g * st,
        g * std::sin(phi) * ct,
        g * std::cos(phi) * ct
    };
}

auto body_to_inertial_velocity(const Eigen::Vector3d& velocity_body, const common::Attitude& attitude) -> Eigen::Vector3d {
    return dcm_body_to_inertial(attitude.phi, attitude.theta, attitude.psi) * velocity_body;
}

auto ned_to_render(const Eigen::Vector3d& v) -> Eigen::Vector3d {
    return {-v.y(), -v.z(), v.x()};
}

auto render_to_ned(const Eigen::Vector3d& v) -> Eigen::Vector3d {
    return {v.z(), -v.x(), -v.y()};
}

} // namespace frames
