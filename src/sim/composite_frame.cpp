#include "sim/composite_frame.hpp"
#include "dynamics/pilot_pendulum.hpp"
#include "mass/mass_properties.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace sim {

namespace {
constexpr double FULL_DEPLOY = 0.999;

auto swing_aero_segments(const CompositeFrameConfig& config, double swing_angle) -> aero::AeroSegments {
    const auto& names = config.pilot_aero_segments;

    aero::AeroSegments segments;
    segments.reserve(config.aero_segments.size());
    for (const auto& segment : config.aero_segments) {
        if (std::find(names.begin(), names.end(), segment->name()) != names.end()) {
            segments.push_back(std::make_shared<aero::SwungSegment>(segment, config.pivot, swing_angle));
        } else {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // namespace

auto deploy_canopy_segments(const common::MassSegments& segments, double deploy) -> common::MassSegments {
    const double d = std::clamp(deploy, 0.0, 1.0);
    if (d >= FULL_DEPLOY) {
        return segments;
    }

    const double span_scale = MIN_DEPLOY_SPAN + (1.0 - MIN_DEPLOY_SPAN) * d;
    const double chord_offset = DEPLOY_CHORD_OFFSET * (1.0 - d);

    common::MassSegments deployed = segments;
    for (auto& segment : deployed) {
        segment.normalized_position.x() += chord_offset;
        segment.normalized_position.y() *= span_scale;
    }
    return deployed;
}

auto build_composite_frame(
    const CompositeFrameConfig& config,
    double deploy,
    double swing_angle
) -> CompositeFrame {
    if (config.reference_height <= 0.0) {
        throw std::invalid_argument("Reference height must be positive");
    }
    if (config.total_mass <= 0.0) {
        throw std::invalid_argument("Total mass must be positive");
    }

    CompositeFrame frame;
    frame.aero_segments = swing_aero_segments(config, swing_angle);
    frame.total_mass = config.total_mass;
    frame.reference_height = config.reference_height;
    frame.rho = config.rho;
    frame.deploy = deploy;
    frame.swing_angle = swing_angle;

    // Mass segments at the current swing angle and deploy fraction
    const common::MassSegments pilot = dynamics::rotate_pilot_segments(
        config.pilot_segments, config.pivot.x(), config.pivot.y(), swing_angle);
    const common::MassSegments canopy = deploy_canopy_segments(config.canopy_segments, deploy);
    const common::MassSegments air = deploy_canopy_segments(config.inertia_only_segments, deploy);

    frame.weight_segments = config.body_segments;
    frame.weight_segments.insert(frame.weight_segments.end(), canopy.begin(), canopy.end());
    frame.weight_segments.insert(frame.weight_segments.end(), pilot.begin(), pilot.end());

    frame.inertia_segments = frame.weight_segments;
    frame.inertia_segments.insert(frame.inertia_segments.end(), air.begin(), air.end());

    frame.cg = mass::compute_center_of_mass(frame.weight_segments, config.reference_height, config.total_mass);
    frame.inertia = mass::compute_inertia_about(
        frame.inertia_segments, config.reference_height, config.total_mass, frame.cg);

    // Apparent mass
    if (config.canopy) {
        frame.apparent_mass = deploy < FULL_DEPLOY
            ? mass::apparent_mass_at_deploy(*config.canopy, deploy, config.rho)
            : mass::compute_apparent_mass_result(*config.canopy, config.rho);
    }
    frame.effective_mass = mass::effective_mass(config.total_mass, frame.apparent_mass.mass);
    frame.effective_inertia = mass::effective_inertia(frame.inertia, frame.apparent_mass.inertia);

    frame.pendulum = dynamics::compute_pilot_pendulum_params(
        pilot, config.pivot.x(), config.pivot.y(), config.reference_height, config.total_mass);

    return frame;
}

auto frame_needs_rebuild(
    const CompositeFrame& frame,
    double deploy,
    double swing_angle,
    double deploy_tolerance,
    double swing_tolerance
) -> bool {
    return std::abs(frame.deploy - deploy) > deploy_tolerance ||
           std::abs(frame.swing_angle - swing_angle) > swing_tolerance;
}

auto frame_to_flight_model(
    const CompositeFrame& frame,
    const CompositeFrameConfig& config,
    bool use_apparent_mass,
    bool with_pendulum
) -> dynamics::FlightModel {
    dynamics::FlightModel model;
    model.aero_segments = frame.aero_segments;
    model.cg_m = frame.cg;
    model.reference_height = frame.reference_height;
    model.mass = frame.total_mass;
    model.rho = frame.rho;

    if (use_apparent_mass) {
        model.mass_axis = frame.effective_mass;
        model.inertia = frame.effective_inertia;
    } else {
        model.inertia = frame.inertia;
    }

    if (with_pendulum) {
        if (config.pilot_segments.empty()) {
            throw std::invalid_argument("Pendulum requested but the vehicle has no pilot segments");
        }
        dynamics::PendulumModel pendulum;
        pendulum.pilot_segments = config.pilot_segments;
        pendulum.pivot_x = config.pivot.x();
        pendulum.pivot_z = config.pivot.y();
        pendulum.params = frame.pendulum;
        pendulum.total_weight = config.total_mass;
        model.pendulum = pendulum;
    }

    return model;
}

} // namespace sim
