#pragma once

/// @file vehicle_config.hpp
/// @brief JSON vehicle definitions and trajectory output.
///
/// A vehicle file describes the mass model, the aero segments, an optional
/// canopy planform and pilot pendulum, and the initial flight condition:
///
///     {
///       "name": "ibex-ul",
///       "reference_length": 1.875, "total_mass": 77.5, "rho": 1.225,
///       "mass_segments": [{"name": "head", "mass_ratio": 0.14, "position": [x, y, z]}],
///       "inertia_only_segments": [...],
///       "pilot": {"segments": ["head", ...], "aero_segments": ["pilot_body"],
///                 "pivot": [x, z]},
///       "canopy": {"area": 20.4, "chord": 2.5, "segments": ["canopy_c", ...]},
///       "aero_segments": [{"name": "cell_c", "position": [x, y, z], "area": 2.9,
///                          "chord": 2.5, "cl_alpha": 5.0, "alpha_0": -3.0, ...}],
///       "initial_state": {"velocity": [u, v, w], "attitude_deg": [φ, θ, ψ],
///                         "rates": [p, q, r]}
///     }
///
/// Pilot segments swing about the pivot; canopy segments and the
/// inertia-only air shrink with the deploy fraction.
///
/// Positions are normalized by reference_length. Angles in the file are in
/// degrees (alpha_0, attitude_deg, pitch_offset_deg); everything in memory is
/// in radians.

#include "aero/aero_segment.hpp"
#include "common/types.hpp"
#include "mass/apparent_mass.hpp"
#include "sim/composite_frame.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace config {

/// @brief Flight condition at t = 0
struct InitialState {
    Eigen::Vector3d velocity = Eigen::Vector3d::Zero();  ///< Body velocity (m/s)
    common::Attitude attitude;                           ///< rad
    common::BodyRates rates;                             ///< rad/s
};

/// @brief Pilot hung under the risers
struct PilotConfig {
    std::vector<std::string> segment_names;          ///< Names of mass_segments that swing
    std::vector<std::string> aero_segment_names;     ///< Names of aero_segments that swing
    Eigen::Vector2d pivot = Eigen::Vector2d::Zero(); ///< Riser pivot {x, z}, normalized
};

/// @brief Parsed vehicle file
struct VehicleConfig {
    std::string name;
    double reference_length = 0.0;  ///< m
    double total_mass = 0.0;        ///< kg
    double rho = mass::SEA_LEVEL_DENSITY;

    common::MassSegments mass_segments;
    common::MassSegments inertia_only_segments;
    std::optional<PilotConfig> pilot;
    std::optional<mass::CanopyGeometry> canopy;
    std::vector<std::string> canopy_segment_names;  ///< Names of mass_segments scaled by deploy
    aero::AeroSegments aero_segments;
    InitialState initial_state;
};

/// @brief Read and parse a vehicle file
/// @throws std::runtime_error if the file cannot be opened or is malformed
/// @throws std::invalid_argument on semantically invalid values
auto load_vehicle_config(const std::string& path) -> VehicleConfig;

/// @brief Parse an already loaded vehicle document
/// @throws std::runtime_error if required keys are missing or mistyped
/// @throws std::invalid_argument on semantically invalid values
auto parse_vehicle_config(const nlohmann::json& document) -> VehicleConfig;

/// @brief Split the mass model into body, canopy and pilot parts for frame assembly
auto to_composite_frame_config(const VehicleConfig& vehicle) -> sim::CompositeFrameConfig;

/// @brief Flight state vector at t = 0, position at the origin
/// @param with_pendulum Append zero swing angle and rate
auto initial_state_vector(const VehicleConfig& vehicle, bool with_pendulum) -> Eigen::VectorXd;

/// @brief {"time": t, "state": [...]} per sample
auto trajectory_to_json(const common::Trajectory& trajectory) -> nlohmann::json;

/// @brief Write {"summary": ..., "points": [...]} pretty-printed
/// @throws std::runtime_error if the file cannot be written
auto save_trajectory_json(
    const std::string& path,
    const common::Trajectory& trajectory,
    const nlohmann::json& summary
) -> void;

} // namespace config
