#include "model.hpp"

#include <cctype>

namespace mpng {
const char* protocol_name(Protocol p) {
    switch (p) {
        case Protocol::ICMP: return "ICMP";
        case Protocol::TCP: return "TCP";
    }
    return "?";
}

const char* policy_name(PortRangePolicy p) {
    switch (p) {
        case PortRangePolicy::Any: return "any";
        case PortRangePolicy::All: return "all";
        case PortRangePolicy::Each: return "each";
    }
    return "?";
}

bool parse_policy(const std::string& name, PortRangePolicy& out) {
    std::string n;
    for (char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "any") out = PortRangePolicy::Any;
    else if (n == "all") out = PortRangePolicy::All;
    else if (n == "each") out = PortRangePolicy::Each;
    else return false;
    return true;
}

std::string TestSpec::label() const {
    if (protocol == Protocol::ICMP) return "ICMP";
    if (!is_range()) return "TCP port " + std::to_string(port_low);
    std::string out = "TCP ports " + std::to_string(port_low) + "-" + std::to_string(port_high);
    if (policy == PortRangePolicy::All) out += " (all)";
    return out;
}
}  // namespace mpng
