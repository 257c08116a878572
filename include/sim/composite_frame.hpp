#pragma once

/// @file composite_frame.hpp
/// @brief Snapshot of the assembled vehicle for one configuration.
///
/// CG, inertia and apparent mass depend on the canopy deploy fraction and
/// the pilot swing angle. They are computed once per configuration change
/// and reused across integration steps. Rebuild when frame_needs_rebuild()
/// says so.

#include "aero/aero_segment.hpp"
#include "common/types.hpp"
#include "dynamics/flight_dynamics.hpp"
#include "mass/apparent_mass.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <vector>

namespace sim {

constexpr double DEPLOY_CHORD_OFFSET = 0.15;  ///< Forward x shift of the canopy at zero deploy, normalized
constexpr double MIN_DEPLOY_SPAN = 0.1;       ///< Span fraction of the canopy at zero deploy

/// @brief Inputs for assembling a frame
struct CompositeFrameConfig {
    aero::AeroSegments aero_segments;
    std::vector<std::string> pilot_aero_segments;  ///< Names of aero segments that swing with the pilot
    common::MassSegments body_segments;          ///< Weight segments that neither swing nor deploy
    common::MassSegments canopy_segments;        ///< Canopy structure, scaled by deploy
    common::MassSegments pilot_segments;         ///< Weight segments rotated about the pivot
    common::MassSegments inertia_only_segments;  ///< Enclosed canopy air: inertia, no weight, scaled by deploy
    Eigen::Vector2d pivot = Eigen::Vector2d::Zero();  ///< Riser pivot {x, z}, normalized
    double reference_height = 1.875;             ///< m
    double total_mass = 77.5;                    ///< kg
    double rho = mass::SEA_LEVEL_DENSITY;        ///< kg/m³
    std::optional<mass::CanopyGeometry> canopy;  ///< Fully deployed planform, if any
};

/// @brief Assembled vehicle at one deploy fraction and swing angle
struct CompositeFrame {
    aero::AeroSegments aero_segments;       ///< Pilot aero segments swung by swing_angle
    common::MassSegments weight_segments;   ///< Body + deployed canopy + rotated pilot
    common::MassSegments inertia_segments;  ///< Weight segments + enclosed air

    Eigen::Vector3d cg = Eigen::Vector3d::Zero();  ///< System CG (m, NED body)
    common::InertiaComponents inertia;             ///< Physical inertia about the CG
    double total_mass = 0.0;                       ///< kg

    mass::ApparentMassResult apparent_mass;        ///< Zero without a canopy
    Eigen::Vector3d effective_mass = Eigen::Vector3d::Zero();
    common::InertiaComponents effective_inertia;

    common::PilotPendulumParams pendulum;          ///< Zero without pilot segments

    double reference_height = 0.0;
    double rho = 0.0;
    double deploy = 1.0;       ///< Deploy fraction this frame was built at
    double swing_angle = 0.0;  ///< Swing angle this frame was built at (rad)
};

/// @brief Assemble the vehicle
///
/// @details Pilot mass and aero segments are rotated by swing_angle about the
///          pivot. Below full deploy the canopy and its enclosed air shrink
///          toward the centerline, y·(0.1 + 0.9·d), and move forward by
///          0.15·(1 − d). Then
///          - CG from body + canopy + pilot segments
///          - inertia from those plus the inertia-only segments, about the CG
///          - apparent mass at the deploy fraction (full canopy at ≥ 0.999)
///          - effective mass and inertia
///          - pendulum parameters about the pivot
///
/// @param config Assembly inputs
/// @param deploy Canopy deploy fraction, 0 to 1
/// @param swing_angle Pilot swing (rad)
/// @throws std::invalid_argument if reference height or total mass is not positive
auto build_composite_frame(
    const CompositeFrameConfig& config,
    double deploy = 1.0,
    double swing_angle = 0.0
) -> CompositeFrame;

/// @brief True when deploy or swing moved past their tolerances
auto frame_needs_rebuild(
    const CompositeFrame& frame,
    double deploy,
    double swing_angle,
    double deploy_tolerance = 1e-3,
    double swing_tolerance = 1.745e-4
) -> bool;

/// @brief Canopy mass segments at a deploy fraction
///
/// @details y' = y·(0.1 + 0.9·d), x' = x + 0.15·(1 − d), z unchanged, with d
///          clamped to [0, 1]. Returned unchanged at full deploy (≥ 0.999).
auto deploy_canopy_segments(const common::MassSegments& segments, double deploy) -> common::MassSegments;

/// @brief Flight model for the integrator
///
/// @param use_apparent_mass Use effective (physical + apparent) mass and inertia
/// @param with_pendulum Attach the pilot pendulum (needs pilot segments)
/// @throws std::invalid_argument if a pendulum is requested without pilot segments
auto frame_to_flight_model(
    const CompositeFrame& frame,
    const CompositeFrameConfig& config,
    bool use_apparent_mass = true,
    bool with_pendulum = false
) -> dynamics::FlightModel;

} // namespace sim
