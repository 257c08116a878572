#include "aero/aero_segment.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace aero {

LinearPolarSegment::LinearPolarSegment(
    std::string name,
    const Eigen::Vector3d& position,
    double area,
    double chord,
    const Polar& polar,
    double pitch_offset
) : name_(std::move(name)),
    position_(position),
    area_(area),
    chord_(chord),
    polar_(polar),
    pitch_offset_(pitch_offset)
{
    if (area_ < 0.0) {
        throw std::invalid_argument("Segment area cannot be negative: " + name_);
    }
    if (chord_ < 0.0) {
        throw std::invalid_argument("Segment chord cannot be negative: " + name_);
    }
}

auto LinearPolarSegment::compute_coefficients(double alpha, double beta) const -> common::AeroCoefficients {
    // Freestream α into the segment's chord frame
    const double local_alpha = alpha - pitch_offset_;

    common::AeroCoefficients c;
    c.cl = polar_.cl_alpha * (local_alpha - polar_.alpha_0);
    c.cd = polar_.cd_0 + polar_.k * c.cl * c.cl;
    c.cy = polar_.cy_beta * beta;
    c.cm = polar_.cm_0 + polar_.cm_alpha * local_alpha;
    c.cp = polar_.cp;
    return c;
}

SwungSegment::SwungSegment(AeroSegmentPtr neutral, const Eigen::Vector2d& pivot, double swing_angle)
    : neutral_(std::move(neutral)),
      position_(Eigen::Vector3d::Zero()),
      swing_angle_(swing_angle)
{
    if (!neutral_) {
        throw std::invalid_argument("Swung segment needs a neutral segment");
    }

    const Eigen::Vector3d& p = neutral_->position();
    const double dx = p.x() - pivot.x();
    const double dz = p.z() - pivot.y();
    const double c = std::cos(swing_angle_);
    const double s = std::sin(swing_angle_);

    position_ = Eigen::Vector3d(dx * c - dz * s + pivot.x(), p.y(), dx * s + dz * c + pivot.y());
}

auto SwungSegment::compute_coefficients(double alpha, double beta) const -> common::AeroCoefficients {
    return neutral_->compute_coefficients(alpha - swing_angle_, beta);
}

} // namespace aero
