#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

namespace frames {

/// @brief Local flow condition at a point on the body
struct FlowAngles {
    double alpha = 0.0;     ///< Angle of attack atan2(w, u) (rad)
    double beta = 0.0;      ///< Sideslip asin(v / V) (rad)
    double airspeed = 0.0;  ///< |V| (m/s)
};

/// @brief Aerodynamic unit directions in NED body axes
///
/// @details At α = β = 0 the wind comes from straight ahead (+x), lift is
///          −z (up) and side is +y. Positive α tilts the wind to come from
///          below (+z), positive β from the right (+y).
///
///          lift = normalize((wind × up) × wind), up = (0, 0, −1)
///          side = wind × lift
///
///          Near |α| = 90° the double cross product vanishes and lift falls
///          back to −x.
///
/// @param alpha Angle of attack (rad)
/// @param beta Sideslip (rad)
auto compute_wind_frame_ned(double alpha, double beta) -> common::WindFrame;

/// @brief Angle of attack, sideslip and airspeed of a body-frame velocity
///
/// @details Angles are zero below 1e-6 m/s; v/V is clamped to [−1, 1]
///          before the asin.
auto local_flow_angles(const Eigen::Vector3d& velocity_body) -> FlowAngles;

} // namespace frames
