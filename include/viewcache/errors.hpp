#pragma once

#include <stdexcept>
#include <string>

namespace viewcache {

// Raised for host mis-configuration: bad capacities, unreadable or malformed
// config files. Record data never raises.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace viewcache
