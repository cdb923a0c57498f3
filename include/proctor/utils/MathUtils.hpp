#pragma once

#include <algorithm>
#include <cmath>

namespace proctor {
namespace utils {

class MathUtils {
public:
    static double degToRad(double degrees) {
        return degrees * PI / 180.0;
    }

    static double radToDeg(double radians) {
        return radians * 180.0 / PI;
    }

    static double clamp(double value, double min, double max) {
        return std::max(min, std::min(max, value));
    }

    /**
     * Round to the given number of decimals, ties to even (12.5 -> 12, 0.25 -> 0.2)
     *
     * Relies on the default FE_TONEAREST rounding mode.
     */
    static double roundTo(double value, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::nearbyint(value * scale) / scale;
    }

private:
    static constexpr double PI = 3.14159265358979323846;
};

} // namespace utils
} // namespace proctor
