#include "frames/wind_frame.hpp"

#include <algorithm>
#include <cmath>

namespace frames {

namespace {
constexpr double DEGENERATE_LIFT_NORM = 1e-10;
constexpr double MIN_AIRSPEED = 1e-6;
} // namespace

auto compute_wind_frame_ned(double alpha, double beta) -> common::WindFrame {
    const double ca = std::cos(alpha), sa = std::sin(alpha);
    const double cb = std::cos(beta),  sb = std::sin(beta);

    common::WindFrame frame;
    frame.wind_dir = Eigen::Vector3d(cb * ca, sb * ca, sa);

    // wind × up with up = (0, 0, -1)
    const Eigen::Vector3d temp(-frame.wind_dir.y(), frame.wind_dir.x(), 0.0);
    Eigen::Vector3d lift = temp.cross(frame.wind_dir);

    const double norm = lift.norm();
    if (norm > DEGENERATE_LIFT_NORM) {
        frame.lift_dir = lift / norm;
    } else {
        frame.lift_dir = Eigen::Vector3d(-1.0, 0.0, 0.0);
    }

    frame.side_dir = frame.wind_dir.cross(frame.lift_dir);
    return frame;
}

auto local_flow_angles(const Eigen::Vector3d& velocity_body) -> FlowAngles {
    FlowAngles flow;
    flow.airspeed = velocity_body.norm();
    if (flow.airspeed <= MIN_AIRSPEED) {
        return flow;
    }

    flow.alpha = std::atan2(velocity_body.z(), velocity_body.x());
    flow.beta = std::asin(std::clamp(velocity_body.y() / flow.airspeed, -1.0, 1.0));
    return flow;
}

} // namespace frames
