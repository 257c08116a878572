#include "aero/aero_aggregator.hpp"
#include "frames/wind_frame.hpp"

#include <cmath>
#include <stdexcept>

namespace aero {

namespace {
constexpr double QUARTER_CHORD = 0.25;
} // namespace

auto compute_segment_force(
    const IAeroSegment& segment,
    double alpha,
    double beta,
    double rho,
    double airspeed
) -> common::SegmentForceResult {
    const double q_bar = 0.5 * rho * airspeed * airspeed;
    const double qS = q_bar * segment.area();
    const common::AeroCoefficients c = segment.compute_coefficients(alpha, beta);

    common::SegmentForceResult result;
    result.lift = qS * c.cl;
    result.drag = qS * c.cd;
    result.side = qS * c.cy;
    result.moment = qS * segment.chord() * c.cm;
    result.cp = c.cp;
    return result;
}

auto segment_force_vector(
    const common::SegmentForceResult& forces,
    const Eigen::Vector3d& wind_dir,
    const Eigen::Vector3d& lift_dir,
    const Eigen::Vector3d& side_dir
) -> Eigen::Vector3d {
    return forces.lift * lift_dir - forces.drag * wind_dir + forces.side * side_dir;
}

auto center_of_pressure(
    const IAeroSegment& segment,
    double cp,
    double reference_height
) -> Eigen::Vector3d {
    // Chord runs from LE (+x) to TE (-x); NED pitch-up turns +x toward -z.
    // A swung segment turns its chord line further by chord_rotation().
    const double offset = -(cp - QUARTER_CHORD) * segment.chord() / reference_height;
    const double pitch = -segment.pitch_offset() + segment.chord_rotation();

    Eigen::Vector3d normalized = segment.position();
    normalized.x() += offset * std::cos(pitch);
    normalized.z() += offset * std::sin(pitch);
    return normalized * reference_height;
}

auto sum_all_segments(
    const AeroSegments& segments,
    const std::vector<common::SegmentForceResult>& segment_forces,
    const Eigen::Vector3d& cg_m,
    double reference_height,
    const Eigen::Vector3d& wind_dir,
    const Eigen::Vector3d& lift_dir,
    const Eigen::Vector3d& side_dir
) -> common::SystemForceMoment {
    if (segments.size() != segment_forces.size()) {
        throw std::invalid_argument("Segment and force lists must have the same length");
    }

    common::SystemForceMoment total;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = *segments[i];
        const auto& f = segment_forces[i];

        const Eigen::Vector3d force = segment_force_vector(f, wind_dir, lift_dir, side_dir);
        const Eigen::Vector3d arm = center_of_pressure(segment, f.cp, reference_height) - cg_m;

        total.force += force;
        total.moment += arm.cross(force);
        total.moment.y() += f.moment;
    }
    return total;
}

auto evaluate_aero_forces(
    const AeroSegments& segments,
    const Eigen::Vector3d& cg_m,
    double reference_height,
    const Eigen::Vector3d& body_velocity,
    const common::BodyRates& rates,
    double rho
) -> AeroEvaluation {
    const Eigen::Vector3d omega(rates.p, rates.q, rates.r);

    AeroEvaluation result;
    result.per_segment.reserve(segments.size());

    for (const auto& segment_ptr : segments) {
        const auto& segment = *segment_ptr;
        const Eigen::Vector3d position_m = segment.position() * reference_height;

        // Rotating-frame velocity correction
        const Eigen::Vector3d local_velocity = body_velocity + omega.cross(position_m - cg_m);
        const frames::FlowAngles flow = frames::local_flow_angles(local_velocity);

        const common::SegmentForceResult f = compute_segment_force(segment, flow.alpha, flow.beta, rho, flow.airspeed);
        const common::WindFrame wind = frames::compute_wind_frame_ned(flow.alpha, flow.beta);

        const Eigen::Vector3d force = segment_force_vector(f, wind.wind_dir, wind.lift_dir, wind.side_dir);
        const Eigen::Vector3d arm = center_of_pressure(segment, f.cp, reference_height) - cg_m;

        result.system.force += force;
        result.system.moment += arm.cross(force);
        result.system.moment.y() += f.moment;

        SegmentAeroResult detail;
        detail.name = segment.name();
        detail.forces = f;
        detail.local_velocity = local_velocity;
        detail.local_airspeed = flow.airspeed;
        detail.local_alpha = flow.alpha;
        detail.local_beta = flow.beta;
        detail.position_m = position_m;
        result.per_segment.push_back(detail);
    }

    return result;
}

} // namespace aero
