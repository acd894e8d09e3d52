#ifndef CSGIR_MATH_ANGLE_HPP
#define CSGIR_MATH_ANGLE_HPP

#include <cmath>
#include <numbers>

namespace csgir {

constexpr double radians_to_degrees(double radians) {
    return (radians * 180) / std::numbers::pi;
}

constexpr double degrees_to_radians(double degrees) {
    return (degrees * std::numbers::pi) / 180;
}

// Snap values within rounding noise of a whole degree, so that a quarter turn
// stored as pi/2 comes back as exactly 90.
inline double snap_degrees(double degrees, double epsilon = 1e-9) {
    double nearest = std::round(degrees);
    if (std::abs(degrees - nearest) < epsilon) {
        return nearest;
    }
    return degrees;
}

}  // namespace csgir

#endif // CSGIR_MATH_ANGLE_HPP
