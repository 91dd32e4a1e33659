#pragma once

#include <stdexcept>
#include <string>

namespace easel {

/**
 * Raised synchronously when a call receives a malformed argument
 * (bad colour, empty point list, non-positive size, unknown key name...).
 */
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace easel
