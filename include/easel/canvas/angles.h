#pragma once

/**
 * Angle conversion for arcs
 *
 * Sketches pass radians. The painter works in sixteenths of a degree, the
 * unit the recorded primitives store, so that recorded arcs compare exactly.
 */

namespace easel {
namespace canvas {

constexpr int kNativeAngleUnitsPerTurn = 360 * 16;

/**
 * round(radians * 360 * 16 / 2pi)
 * Throws ArgumentError when the angle is not finite or overflows int.
 */
int toNativeAngle(double radians);

struct NativeArc {
    int start = 0;
    int sweep = 0;   // negated, so arcs run clockwise on screen
};

NativeArc toNativeArc(double startRadians, double endRadians);

} // namespace canvas
} // namespace easel
