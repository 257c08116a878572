#include "dynamics/rigid_body_eom.hpp"

#include <cmath>
#include <vector>

namespace dynamics {

namespace {
// Axes whose principal moment falls below this fraction of the largest one
// carry no rotational inertia.
constexpr double SINGULAR_AXIS_RATIO = 1e-9;
} // namespace

auto translational_eom(
    const Eigen::Vector3d& force,
    double mass,
    const Eigen::Vector3d& velocity,
    const common::BodyRates& rates
) -> common::TranslationalAcceleration {
    const double u = velocity.x(), v = velocity.y(), w = velocity.z();
    const double p = rates.p, q = rates.q, r = rates.r;

    Eigen::Vector3d specific_force = Eigen::Vector3d::Zero();
    if (mass > 0.0) {
        specific_force = force / mass;
    }

    common::TranslationalAcceleration accel;
    accel.u_dot = specific_force.x() - (q * w - r * v);
    accel.v_dot = specific_force.y() - (r * u - p * w);
    accel.w_dot = specific_force.z() - (p * v - q * u);
    return accel;
}

auto translational_eom_anisotropic(
    const Eigen::Vector3d& force,
    const Eigen::Vector3d& mass_axis,
    const Eigen::Vector3d& velocity,
    const common::BodyRates& rates
) -> common::TranslationalAcceleration {
    const double u = velocity.x(), v = velocity.y(), w = velocity.z();
    const double p = rates.p, q = rates.q, r = rates.r;
    const double mx = mass_axis.x(), my = mass_axis.y(), mz = mass_axis.z();

    common::TranslationalAcceleration accel;
    if (mx > 0.0) {
        accel.u_dot = (force.x() + my * r * v - mz * q * w) / mx;
    }
    if (my > 0.0) {
        accel.v_dot = (force.y() + mz * p * w - mx * r * u) / my;
    }
    if (mz > 0.0) {
        accel.w_dot = (force.z() + mx * q * u - my * p * v) / mz;
    }
    return accel;
}

auto rotational_eom(
    const Eigen::Vector3d& moment,
    const common::InertiaComponents& inertia,
    const common::BodyRates& rates
) -> common::AngularAcceleration {
    const Eigen::Matrix3d I = inertia.to_matrix();
    const double scale = I.diagonal().cwiseAbs().maxCoeff();
    if (scale <= 0.0) {
        return {};
    }

    const Eigen::Vector3d omega(rates.p, rates.q, rates.r);

    // Euler's rotation equation: I * dω/dt = M - ω × (I * ω)
    const Eigen::Vector3d rhs = moment - omega.cross(I * omega);

    std::vector<int> active;
    for (int i = 0; i < 3; ++i) {
        if (std::abs(I(i, i)) > SINGULAR_AXIS_RATIO * scale) {
            active.push_back(i);
        }
    }

    // Solve over the axes that have inertia; the others stay at 0
    const int n = static_cast<int>(active.size());
    Eigen::MatrixXd I_active(n, n);
    Eigen::VectorXd rhs_active(n);
    for (int i = 0; i < n; ++i) {
        rhs_active(i) = rhs(active[i]);
        for (int j = 0; j < n; ++j) {
            I_active(i, j) = I(active[i], active[j]);
        }
    }

    Eigen::FullPivLU<Eigen::MatrixXd> lu(I_active);
    lu.setThreshold(SINGULAR_AXIS_RATIO);
    if (!lu.isInvertible()) {
        return {};
    }
    const Eigen::VectorXd solved = lu.solve(rhs_active);

    Eigen::Vector3d omega_dot = Eigen::Vector3d::Zero();
    for (int i = 0; i < n; ++i) {
        omega_dot(active[i]) = solved(i);
    }

    common::AngularAcceleration accel;
    accel.p_dot = omega_dot.x();
    accel.q_dot = omega_dot.y();
    accel.r_dot = omega_dot.z();
    return accel;
}

} // namespace dynamics
