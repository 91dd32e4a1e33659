#include "easel/runtime/config.h"
#include <cstdlib>

namespace easel {

static bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && (value[0] == '1' || value[0] == 't' || value[0] == 'T');
}

RuntimeConfig applyEnvironment(RuntimeConfig config) {
    if (envFlag("EASEL_HEADLESS")) {
        config.headless = true;
    }
    if (envFlag("EASEL_DEBUG")) {
        config.debug = true;
    }
    return config;
}

} // namespace easel
