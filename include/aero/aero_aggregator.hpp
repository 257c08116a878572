#pragma once

/// @file aero_aggregator.hpp
/// @brief Composition of per-segment aerodynamic forces into a system
///        force and moment about the CG.
///
/// For every segment
///
///     F_i = lift·lift_dir − drag·wind_dir + side·side_dir
///     M  += (r_cp,i − r_cg) × F_i + M_0,i·ŷ
///
/// where wind_dir points where the air comes FROM, so drag acts along
/// −wind_dir, and M_0,i is the segment's own pitching moment about its
/// aerodynamic center. All vectors are NED body axes.

#include "aero/aero_segment.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace aero {

/// @brief Per-segment detail of an aero evaluation
struct SegmentAeroResult {
    std::string name;
    common::SegmentForceResult forces;
    Eigen::Vector3d local_velocity = Eigen::Vector3d::Zero();  ///< V_cg + ω × r (m/s)
    double local_airspeed = 0.0;                               ///< m/s
    double local_alpha = 0.0;                                  ///< rad
    double local_beta = 0.0;                                   ///< rad
    Eigen::Vector3d position_m = Eigen::Vector3d::Zero();      ///< Segment AC (m)
};

/// @brief System totals plus per-segment breakdown
struct AeroEvaluation {
    common::SystemForceMoment system;
    std::vector<SegmentAeroResult> per_segment;
};

/// @brief Force magnitudes of one segment at the given flow condition
///
/// @details q = ½ρV², lift = q·S·cl, drag = q·S·cd, side = q·S·cy,
///          moment = q·S·c·cm
///
/// @param alpha Local angle of attack (rad)
/// @param beta Local sideslip (rad)
/// @param rho Air density (kg/m³)
/// @param airspeed Local airspeed (m/s)
auto compute_segment_force(
    const IAeroSegment& segment,
    double alpha,
    double beta,
    double rho,
    double airspeed
) -> common::SegmentForceResult;

/// @brief Compose a segment's force vector from its magnitudes
auto segment_force_vector(
    const common::SegmentForceResult& forces,
    const Eigen::Vector3d& wind_dir,
    const Eigen::Vector3d& lift_dir,
    const Eigen::Vector3d& side_dir
) -> Eigen::Vector3d;

/// @brief Point where a segment's force acts, in meters
///
/// @details The center of pressure sits (cp − 0.25)·chord aft of the quarter
///          chord, along the chord line pitched by the segment's
///          pitch_offset() and turned by its chord_rotation(). At cp = 0.25
///          this is the segment position.
auto center_of_pressure(
    const IAeroSegment& segment,
    double cp,
    double reference_height
) -> Eigen::Vector3d;

/// @brief Sum segment forces and moments about the system CG
///
/// @param segments Aero segments
/// @param segment_forces Force magnitudes, one per segment in the same order
/// @param cg_m System CG (m, NED body)
/// @param reference_height Scale for normalized segment positions (m)
/// @param wind_dir Unit vector, where the air comes from
/// @param lift_dir Unit vector perpendicular to the wind in the vertical plane
/// @param side_dir Unit vector wind × lift
/// @return Total force (N) and moment about the CG (N·m)
/// @throws std::invalid_argument if the two lists differ in length
auto sum_all_segments(
    const AeroSegments& segments,
    const std::vector<common::SegmentForceResult>& segment_forces,
    const Eigen::Vector3d& cg_m,
    double reference_height,
    const Eigen::Vector3d& wind_dir,
    const Eigen::Vector3d& lift_dir,
    const Eigen::Vector3d& side_dir
) -> common::SystemForceMoment;

/// @brief Aero forces with a local ω × r flow correction per segment
///
/// @details Each segment sees V_local = V_cg + ω × (r_i − r_cg), giving its
///          own α, β and airspeed and therefore its own wind frame. Body
///          rotation thus produces roll, pitch and yaw damping from the
///          geometry alone. With ω = 0 every segment sees the CG flow.
///
/// @param body_velocity CG velocity {u, v, w} (m/s)
/// @param rates Body angular rates
/// @param rho Air density (kg/m³)
auto evaluate_aero_forces(
    const AeroSegments& segments,
    const Eigen::Vector3d& cg_m,
    double reference_height,
    const Eigen::Vector3d& body_velocity,
    const common::BodyRates& rates,
    double rho
) -> AeroEvaluation;

} // namespace aero
