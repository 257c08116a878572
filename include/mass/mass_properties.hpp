#pragma once

/// @file mass_properties.hpp
/// @brief Point-mass CG and inertia tensor from normalized mass segments.
///
/// Segment positions are normalized by a reference length (pilot height for
/// human bodies) in the NED body frame. Each segment's mass is
/// mass_ratio × total_mass. Segments are point masses: no self-inertia.

#include "common/types.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace mass {

/// @brief A mass segment scaled to physical units
struct PhysicalMass {
    std::string name;
    double mass = 0.0;                                        ///< kg
    Eigen::Vector3d position = Eigen::Vector3d::Zero();       ///< m, NED body
};

/// @brief Mass-weighted mean of segment positions (m)
///
/// @param segments Mass segments (ratios need not sum to 1)
/// @param reference_length Scale applied to normalized positions (m)
/// @param total_mass Scale applied to mass ratios (kg)
/// @return CG in NED body axes, zero vector for an empty set or zero total mass
auto compute_center_of_mass(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> Eigen::Vector3d;

/// @brief Inertia tensor about the body-frame origin
///
/// @details
///     Ixx += m(y² + z²)   Ixy −= m·x·y
///     Iyy += m(x² + z²)   Ixz −= m·x·z
///     Izz += m(x² + y²)   Iyz −= m·y·z
///
/// @return Tensor components, all zero for an empty set
auto compute_inertia(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> common::InertiaComponents;

/// @brief Inertia tensor about an arbitrary point
///
/// @param origin Reference point in meters (NED body)
auto compute_inertia_about(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass,
    const Eigen::Vector3d& origin
) -> common::InertiaComponents;

/// @brief Σ mass_ratio × total_mass (kg)
auto segment_mass_sum(const common::MassSegments& segments, double total_mass) -> double;

/// @brief Segment masses and positions in physical units
auto physical_mass_positions(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> std::vector<PhysicalMass>;

} // namespace mass
