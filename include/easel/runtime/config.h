#pragma once

#include <cstdint>

namespace easel {

/**
 * Runtime configuration
 */
struct RuntimeConfig {
    bool headless = false;          // Create windows hidden
    bool debug = false;             // Verbose per-event logging
    bool quiet = false;             // Suppress informational output
    uint64_t drawIntervalMs = 17;   // Render surface tick period
    uint64_t quiescenceDelayMs = 0; // Delay of the deferred exit check
    long httpTimeout = 30;          // seconds
    bool verifySSL = true;
    bool audioEnabled = true;       // false: sounds load but never play
};

/**
 * Apply EASEL_HEADLESS / EASEL_DEBUG overrides from the environment.
 */
RuntimeConfig applyEnvironment(RuntimeConfig config);

} // namespace easel
