#pragma once

/// @file apparent_mass.hpp
/// @brief Added mass and inertia of the air a canopy drags along.
///
/// Flat-plate / strip-theory estimates for a thin rectangular ram-air
/// canopy of span b and chord c. Terms are added to the diagonal of the
/// physical mass and inertia before the equations of motion are evaluated:
///
///     (m + m_a_x)·u̇ = F_x + ...
///     (I_xx + I_a_xx)·ṗ = M_x + ...

#include "common/types.hpp"

#include <Eigen/Dense>

namespace mass {

/// @brief Standard sea-level air density (kg/m³)
constexpr double SEA_LEVEL_DENSITY = 1.225;

/// @brief Canopy planform used by the apparent-mass model
struct CanopyGeometry {
    double span = 0.0;   ///< Projected span (m)
    double chord = 0.0;  ///< Mean aerodynamic chord (m)
    double area = 0.0;   ///< Projected planform area (m²)
};

/// @brief Translational apparent mass per body axis (kg)
struct ApparentMass {
    double x = 0.0;  ///< Chordwise, small for a thin canopy
    double y = 0.0;  ///< Spanwise
    double z = 0.0;  ///< Normal, dominant term
};

/// @brief Rotational apparent inertia, diagonal only (kg·m²)
struct ApparentInertia {
    double Ixx = 0.0;
    double Iyy = 0.0;
    double Izz = 0.0;
};

struct ApparentMassResult {
    ApparentMass mass;
    ApparentInertia inertia;
};

/// @brief Rectangular planform from area and chord (span = area / chord)
/// @throws std::invalid_argument if chord is not positive
auto canopy_geometry_from_area(double area, double chord) -> CanopyGeometry;

/// @brief Flat-plate translational apparent mass
///
/// @details
///     m_z = π/4·ρ·c²·b        disc of diameter c along the span
///     m_y = π/4·ρ·b²·c        disc of diameter b along the chord
///     m_x = π/4·ρ·(0.1c)²·b   10% thickness plate
auto compute_apparent_mass(const CanopyGeometry& geom, double rho = SEA_LEVEL_DENSITY) -> ApparentMass;

/// @brief Strip-theory rotational apparent inertia
///
/// @details
///     I_xx = π/4·ρ·c²·b³/12
///     I_yy = π/4·ρ·b·c³/12
///     I_zz = π/4·ρ·(0.1c)²·b³/12
auto compute_apparent_inertia(const CanopyGeometry& geom, double rho = SEA_LEVEL_DENSITY) -> ApparentInertia;

auto compute_apparent_mass_result(const CanopyGeometry& geom, double rho = SEA_LEVEL_DENSITY) -> ApparentMassResult;

/// @brief Apparent mass of a partially inflated canopy
///
/// @details The deploy fraction is clamped to [0, 1]. Span scales by
///          (0.1 + 0.9·d) and chord by (0.2 + 0.8·d), so a packed canopy
///          keeps a small residual.
auto apparent_mass_at_deploy(
    const CanopyGeometry& full_geometry,
    double deploy,
    double rho = SEA_LEVEL_DENSITY
) -> ApparentMassResult;

/// @brief Physical mass plus apparent mass per axis {x, y, z} (kg)
auto effective_mass(double physical_mass, const ApparentMass& apparent) -> Eigen::Vector3d;

/// @brief Physical inertia with apparent inertia added to the diagonal
///
/// Products of inertia are left unchanged.
auto effective_inertia(
    const common::InertiaComponents& physical,
    const ApparentInertia& apparent
) -> common::InertiaComponents;

} // namespace mass
