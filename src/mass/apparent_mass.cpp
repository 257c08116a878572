#include "mass/apparent_mass.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mass {

namespace {
constexpr double PI_4 = M_PI / 4.0;
constexpr double THICKNESS_RATIO = 0.10;
} // namespace

auto canopy_geometry_from_area(double area, double chord) -> CanopyGeometry {
    if (chord <= 0.0) {
        throw std::invalid_argument("Canopy chord must be positive");
    }
    return {area / chord, chord, area};
}

auto compute_apparent_mass(const CanopyGeometry& geom, double rho) -> ApparentMass {
    const double b = geom.span;
    const double c = geom.chord;
    const double t = THICKNESS_RATIO * c;

    ApparentMass m;
    m.x = PI_4 * rho * t * t * b;
    m.y = PI_4 * rho * b * b * c;
    m.z = PI_4 * rho * c * c * b;
    return m;
}

auto compute_apparent_inertia(const CanopyGeometry& geom, double rho) -> ApparentInertia {
    const double b = geom.span;
    const double c = geom.chord;
    const double t = THICKNESS_RATIO * c;

    ApparentInertia I;
    // Roll: normal added mass distributed along the span
    I.Ixx = PI_4 * rho * c * c * b * b * b / 12.0;
    // Pitch: normal added mass distributed along the chord
    I.Iyy = PI_4 * rho * b * c * c * c / 12.0;
    // Yaw: in-plane rotation, thickness-based
    I.Izz = PI_4 * rho * t * t * b * b * b / 12.0;
    return I;
}

auto compute_apparent_mass_result(const CanopyGeometry& geom, double rho) -> ApparentMassResult {
    return {compute_apparent_mass(geom, rho), compute_apparent_inertia(geom, rho)};
}

auto apparent_mass_at_deploy(
    const CanopyGeometry& full_geometry,
    double deploy,
    double rho
) -> ApparentMassResult {
    const double d = std::clamp(deploy, 0.0, 1.0);
    const double span_scale = 0.1 + 0.9 * d;
    const double chord_scale = 0.2 + 0.8 * d;

    CanopyGeometry deployed;
    deployed.span = full_geometry.span * span_scale;
    deployed.chord = full_geometry.chord * chord_scale;
    deployed.area = deployed.span * deployed.chord;

    return compute_apparent_mass_result(deployed, rho);
}

auto effective_mass(double physical_mass, const ApparentMass& apparent) -> Eigen::Vector3d {
    return {
        physical_mass + apparent.x,
        physical_mass + apparent.y,
        physical_mass + apparent.z
    };
}

auto effective_inertia(
    const common::InertiaComponents& physical,
    const ApparentInertia& apparent
) -> common::InertiaComponents {
    common::InertiaComponents I = physical;
    I.Ixx += apparent.Ixx;
    I.Iyy += apparent.Iyy;
    I.Izz += apparent.Izz;
    return I;
}

} // namespace mass
