#pragma once

#include "common/types.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <vector>

namespace aero {

/// @brief Interface for a lifting or parasitic surface of the vehicle
///
/// @details A segment is a piece of the vehicle (canopy cell, pilot body,
///          lines, bridle) with its own reference area and chord, located
///          at a fixed point of the body. Given the local flow angles it
///          returns dimensionless coefficients:
///
///          (cl, cd, cy, cm, cp) = f(α, β)
///
///          Forces follow from the dynamic pressure q = ½ρV²:
///          - lift = q·S·cl along the lift direction
///          - drag = q·S·cd against the wind
///          - side = q·S·cy along the side direction
///          - moment = q·S·c·cm about the segment's aerodynamic center
///
///          The coefficient model itself (tabulated polar, Kirchhoff
///          separation blend) lives outside this library.
///
/// @note Positions are normalized by the reference height, NED body frame.
class IAeroSegment {
public:
    virtual ~IAeroSegment() = default;

    /// @brief Segment identifier
    virtual auto name() const -> const std::string& = 0;

    /// @brief Aerodynamic center, normalized NED body position
    virtual auto position() const -> const Eigen::Vector3d& = 0;

    /// @brief Reference area S (m²)
    virtual auto area() const -> double = 0;

    /// @brief Reference chord c (m)
    virtual auto chord() const -> double = 0;

    /// @brief Static pitch of the chord line relative to body x (rad)
    ///
    /// @details 0 for a prone body (leading edge along +x), π/2 for an
    ///          upright pilot (leading edge along −z).
    virtual auto pitch_offset() const -> double { return 0.0; }

    /// @brief Extra rotation of the chord line beyond pitch_offset() (rad)
    ///
    /// @details Nonzero for a segment that swings rigidly about a pivot.
    ///          Positive turns the chord offset +x toward +z.
    virtual auto chord_rotation() const -> double { return 0.0; }

    /// @brief Coefficients at the local flow angles
    ///
    /// @details alpha is measured from body x. Implementations evaluate
    ///          their polar in the segment's own chord frame.
    ///
    /// @param alpha Local angle of attack (rad)
    /// @param beta Local sideslip (rad)
    virtual auto compute_coefficients(double alpha, double beta) const -> common::AeroCoefficients = 0;
};

using AeroSegmentPtr = std::shared_ptr<const IAeroSegment>;
using AeroSegments = std::vector<AeroSegmentPtr>;

/// @brief Attached-flow linear polar
///
/// @details
///     α_s = α − pitch_offset
///     cl = cl_α·(α_s − α₀)
///     cd = cd₀ + k·cl²
///     cy = cy_β·β
///     cm = cm₀ + cm_α·α_s
///
///          No stall: valid for the attached-flow range only. Used for
///          configuration-driven runs where the full coefficient model is
///          not available.
class LinearPolarSegment : public IAeroSegment {
public:
    struct Polar {
        double cl_alpha = 0.0;  ///< Lift slope (1/rad)
        double alpha_0 = 0.0;   ///< Zero-lift angle (rad)
        double cd_0 = 0.0;      ///< Zero-lift drag
        double k = 0.0;         ///< Induced drag factor
        double cy_beta = 0.0;   ///< Side force slope (1/rad)
        double cm_0 = 0.0;      ///< Pitching moment at α = 0
        double cm_alpha = 0.0;  ///< Pitching moment slope (1/rad)
        double cp = 0.25;       ///< Center of pressure, chord fraction
    };

    /// @brief Constructs a linear-polar segment
    /// @param name Segment identifier
    /// @param position Normalized NED body position of the aerodynamic center
    /// @param area Reference area (m²)
    /// @param chord Reference chord (m)
    /// @param polar Polar coefficients
    /// @param pitch_offset Static chord pitch (rad)
    /// @throws std::invalid_argument if area or chord is negative
    LinearPolarSegment(
        std::string name,
        const Eigen::Vector3d& position,
        double area,
        double chord,
        const Polar& polar,
        double pitch_offset = 0.0
    );

    auto name() const -> const std::string& override { return name_; }
    auto position() const -> const Eigen::Vector3d& override { return position_; }
    auto area() const -> double override { return area_; }
    auto chord() const -> double override { return chord_; }
    auto pitch_offset() const -> double override { return pitch_offset_; }

    auto compute_coefficients(double alpha, double beta) const -> common::AeroCoefficients override;

    auto polar() const -> const Polar& { return polar_; }

private:
    std::string name_;
    Eigen::Vector3d position_;
    double area_;          ///< m²
    double chord_;         ///< m
    Polar polar_;
    double pitch_offset_;  ///< rad
};

/// @brief A segment swung rigidly about a pivot in the body x-z plane
///
/// @details Wraps a neutral segment (the pilot body hanging straight down)
///          and rotates it by the swing angle δ:
///          - the aerodynamic center rotates about the pivot with the same
///            x' = dx·cos δ − dz·sin δ, z' = dx·sin δ + dz·cos δ as the
///            pilot mass segments
///          - the chord line rotates by δ (chord_rotation())
///          - coefficients are taken at α − δ, so the wrapped polar sees
///            α − (pitch_offset + δ)
///
///          Name, area, chord and the static pitch_offset() are the wrapped
///          segment's.
class SwungSegment : public IAeroSegment {
public:
    /// @param neutral Segment at zero swing
    /// @param pivot Pivot {x, z}, normalized NED
    /// @param swing_angle Swing δ (rad)
    /// @throws std::invalid_argument if neutral is null
    SwungSegment(AeroSegmentPtr neutral, const Eigen::Vector2d& pivot, double swing_angle);

    auto name() const -> const std::string& override { return neutral_->name(); }
    auto position() const -> const Eigen::Vector3d& override { return position_; }
    auto area() const -> double override { return neutral_->area(); }
    auto chord() const -> double override { return neutral_->chord(); }
    auto pitch_offset() const -> double override { return neutral_->pitch_offset(); }
    auto chord_rotation() const -> double override { return neutral_->chord_rotation() + swing_angle_; }

    auto compute_coefficients(double alpha, double beta) const -> common::AeroCoefficients override;

    auto neutral() const -> const AeroSegmentPtr& { return neutral_; }
    auto swing_angle() const -> double { return swing_angle_; }

private:
    AeroSegmentPtr neutral_;
    Eigen::Vector3d position_;
    double swing_angle_;  ///< rad
};

} // namespace aero
