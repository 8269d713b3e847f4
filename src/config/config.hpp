#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/model.hpp"

namespace mpng {
class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct MonitorConfig {
    MonitorSettings settings;
    std::vector<Host> hosts;

    std::size_t test_count() const;
};

// Parses YAML text. Throws ConfigError with the offending host or key in the
// message. Per-test timeouts and policies are resolved against `settings`,
// and ranges with policy `each` are expanded into single-port tests.
MonitorConfig parse_config(const std::string& yaml_text);

// Reads and parses `path`, then drops hosts bound to this machine when
// `ignore_self` is set. Throws ConfigError, also when no host is left.
MonitorConfig load_config_file(const std::string& path);

// Removes hosts whose address is in `local`; returns how many were removed.
std::size_t drop_self_hosts(MonitorConfig& cfg, const std::vector<std::string>& local);

// Parses "443" or "8000-8002". Throws ConfigError.
void parse_port_spec(const std::string& text, uint16_t& low, uint16_t& high);
}  // namespace mpng
