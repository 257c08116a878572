#include "common/types.hpp"

namespace common {

auto InertiaComponents::to_matrix() const -> Eigen::Matrix3d {
    Eigen::Matrix3d I;
    I << Ixx, Ixy, Ixz,
         Ixy, Iyy, Iyz,
         Ixz, Iyz, Izz;
    return I;
}

auto InertiaComponents::from_matrix(const Eigen::Matrix3d& I) -> InertiaComponents {
    InertiaComponents c;
    c.Ixx = I(0, 0);
    c.Iyy = I(1, 1);
    c.Izz = I(2, 2);
    c.Ixy = I(0, 1);
    c.Ixz = I(0, 2);
    c.Iyz = I(1, 2);
    return c;
}

} // namespace common
