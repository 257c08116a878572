#include "mass/mass_properties.hpp"

namespace mass {

auto compute_center_of_mass(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> Eigen::Vector3d {
    double mass_sum = 0.0;
    Eigen::Vector3d moment = Eigen::Vector3d::Zero();

    for (const auto& segment : segments) {
        const double m = segment.mass_ratio * total_mass;
        mass_sum += m;
        moment += m * segment.normalized_position * reference_length;
    }

    if (mass_sum == 0.0) {
        return Eigen::Vector3d::Zero();
    }
    return moment / mass_sum;
}

auto compute_inertia(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> common::InertiaComponents {
    return compute_inertia_about(segments, reference_length, total_mass, Eigen::Vector3d::Zero());
}

auto compute_inertia_about(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass,
    const Eigen::Vector3d& origin
) -> common::InertiaComponents {
    common::InertiaComponents I = common::InertiaComponents::zero();

    for (const auto& segment : segments) {
        const double m = segment.mass_ratio * total_mass;
        const Eigen::Vector3d r = segment.normalized_position * reference_length - origin;
        const double x = r.x(), y = r.y(), z = r.z();

        I.Ixx += m * (y * y + z * z);
        I.Iyy += m * (x * x + z * z);
        I.Izz += m * (x * x + y * y);
        I.Ixy -= m * x * y;
        I.Ixz -= m * x * z;
        I.Iyz -= m * y * z;
    }

    return I;
}

auto segment_mass_sum(const common::MassSegments& segments, double total_mass) -> double {
    double sum = 0.0;
    for (const auto& segment : segments) {
        sum += segment.mass_ratio * total_mass;
    }
    return sum;
}

auto physical_mass_positions(
    const common::MassSegments& segments,
    double reference_length,
    double total_mass
) -> std::vector<PhysicalMass> {
    std::vector<PhysicalMass> masses;
    masses.reserve(segments.size());
    for (const auto& segment : segments) {
        masses.push_back({
            segment.name,
            segment.mass_ratio * total_mass,
            segment.normalized_position * reference_length
        });
    }
    return masses;
}

} // namespace mass
