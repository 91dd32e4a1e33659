#include "easel/canvas/angles.h"
#include "easel/errors.h"
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace easel {
namespace canvas {

int toNativeAngle(double radians) {
    double units = std::round(radians * kNativeAngleUnitsPerTurn / (2.0 * M_PI));
    // Symmetric range so the sweep can be negated
    if (!std::isfinite(units) || std::fabs(units) > std::numeric_limits<int>::max()) {
        throw ArgumentError("Angle must be a finite number in range");
    }
    return static_cast<int>(units);
}

NativeArc toNativeArc(double startRadians, double endRadians) {
    NativeArc arc;
    arc.start = toNativeAngle(startRadians);
    arc.sweep = -toNativeAngle(endRadians - startRadians);
    return arc;
}

} // namespace canvas
} // namespace easel
