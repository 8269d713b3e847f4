#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "../core/logger.hpp"
#include "local_addrs.hpp"

namespace mpng {
namespace {
std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

template <typename T>
T scalar_as(const YAML::Node& node, const std::string& where) {
    if (!node.IsScalar()) throw ConfigError(where + ": expected a scalar value");
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(where + ": invalid value '" + node.Scalar() + "'");
    }
}

std::string key_text(const YAML::Node& key, const std::string& where) {
    if (!key.IsScalar()) throw ConfigError(where + ": keys must be scalars");
    return key.Scalar();
}

int positive_int(const YAML::Node& node, const std::string& where) {
    int v = scalar_as<int>(node, where);
    if (v <= 0) throw ConfigError(where + " must be positive");
    return v;
}

uint16_t parse_port_number(const std::string& text, const std::string& whole) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw ConfigError("invalid port '" + whole + "'");
    unsigned long v = std::stoul(text);
    if (v < 1 || v > 65535) throw ConfigError("port out of range in '" + whole + "'");
    return static_cast<uint16_t>(v);
}

void parse_settings(const YAML::Node& node, MonitorSettings& s) {
    if (!node.IsMap()) throw ConfigError("'settings' must be a mapping");
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = key_text(it->first, "settings");
        const YAML::Node& v = it->second;
        const std::string where = "settings." + key;
        if (key == "interval_ms") {
            s.interval_ms = positive_int(v, where);
        } else if (key == "history_length") {
            s.history_length = static_cast<std::size_t>(positive_int(v, where));
        } else if (key == "slow_threshold_ms") {
            s.slow_threshold_ms = scalar_as<double>(v, where);
            if (s.slow_threshold_ms <= 0) throw ConfigError(where + " must be positive");
        } else if (key == "workers") {
            s.workers = static_cast<std::size_t>(positive_int(v, where));
        } else if (key == "cycle_grace_ms") {
            s.cycle_grace_ms = scalar_as<int>(v, where);
            if (s.cycle_grace_ms < 0) throw ConfigError(where + " must not be negative");
        } else if (key == "icmp_timeout_ms") {
            s.icmp_timeout_ms = positive_int(v, where);
        } else if (key == "tcp_timeout_ms") {
            s.tcp_timeout_ms = positive_int(v, where);
        } else if (key == "port_range_policy") {
            if (!parse_policy(scalar_as<std::string>(v, where), s.port_range_policy))
                throw ConfigError(where + ": expected any, all or each");
        } else if (key == "log_level") {
            if (!parse_log_level(scalar_as<std::string>(v, where), s.log_level))
                throw ConfigError(where + ": expected debug, info, warn or error");
        } else {
            log(LogLevel::WARN, "ignoring unknown setting '" + key + "'");
        }
    }
}

void parse_test(const YAML::Node& node, const std::string& where, const MonitorSettings& s,
                std::vector<TestSpec>& out) {
    if (!node.IsMap()) throw ConfigError(where + ": test must be a mapping");
    std::string proto = "ICMP";
    if (node["protocol"]) proto = upper(scalar_as<std::string>(node["protocol"], where + ".protocol"));

    TestSpec t;
    if (proto == "ICMP") {
        t.protocol = Protocol::ICMP;
        t.timeout_ms = s.icmp_timeout_ms;
    } else if (proto == "TCP") {
        t.protocol = Protocol::TCP;
        t.timeout_ms = s.tcp_timeout_ms;
        t.policy = s.port_range_policy;
        if (!node["port"] || node["port"].IsNull())
            throw ConfigError(where + ": TCP test must specify a port");
        parse_port_spec(scalar_as<std::string>(node["port"], where + ".port"), t.port_low,
                        t.port_high);
        if (node["policy"] &&
            !parse_policy(scalar_as<std::string>(node["policy"], where + ".policy"), t.policy))
            throw ConfigError(where + ".policy: expected any, all or each");
    } else {
        throw ConfigError(where + ": unknown protocol '" + proto + "'");
    }
    if (node["timeout_ms"]) t.timeout_ms = positive_int(node["timeout_ms"], where + ".timeout_ms");

    if (t.protocol == Protocol::TCP && t.policy == PortRangePolicy::Each) {
        for (uint32_t p = t.port_low; p <= t.port_high; ++p) {
            TestSpec one = t;
            one.port_low = one.port_high = static_cast<uint16_t>(p);
            one.policy = PortRangePolicy::Any;
            out.push_back(one);
        }
        return;
    }
    out.push_back(t);
}

Host parse_host(const std::string& ip, const YAML::Node& details, const MonitorSettings& s) {
    auto addr = IpAddress::parse(ip);
    if (!addr) throw ConfigError("invalid IP address: " + ip);
    Host h{*addr, ip, {}};
    if (details && !details.IsNull()) {
        if (!details.IsMap()) throw ConfigError(ip + ": host details must be a mapping");
        if (details["description"])
            h.description = scalar_as<std::string>(details["description"], ip + ".description");
        const YAML::Node tests = details["tests"];
        if (tests && !tests.IsNull()) {
            if (!tests.IsSequence()) throw ConfigError(ip + ".tests must be a list");
            for (std::size_t i = 0; i < tests.size(); ++i)
                parse_test(tests[i], ip + ".tests[" + std::to_string(i) + "]", s, h.tests);
        }
    }
    if (h.tests.empty()) {
        TestSpec icmp;
        icmp.protocol = Protocol::ICMP;
        icmp.timeout_ms = s.icmp_timeout_ms;
        h.tests.push_back(icmp);
    }
    return h;
}

MonitorConfig parse_document(const YAML::Node& root) {
    if (!root.IsMap()) throw ConfigError("config must be a mapping with a 'hosts' key");

    MonitorConfig cfg;
    if (root["settings"]) parse_settings(root["settings"], cfg.settings);
    if (root["ignore_self"]) {
        const YAML::Node v = root["ignore_self"];
        cfg.settings.ignore_self = v.IsNull() || scalar_as<bool>(v, "ignore_self");
    }

    const YAML::Node hosts = root["hosts"];
    if (!hosts) throw ConfigError("config must contain a 'hosts' key");
    if (!hosts.IsSequence() || hosts.size() == 0)
        throw ConfigError("'hosts' must be a non-empty list");
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        const YAML::Node item = hosts[i];
        if (item.IsScalar()) {
            cfg.hosts.push_back(parse_host(item.Scalar(), YAML::Node(), cfg.settings));
            continue;
        }
        if (!item.IsMap() || item.size() != 1)
            throw ConfigError("hosts[" + std::to_string(i) + "] must map one IP address to its details");
        auto entry = item.begin();
        const std::string ip = key_text(entry->first, "hosts[" + std::to_string(i) + "]");
        cfg.hosts.push_back(parse_host(ip, entry->second, cfg.settings));
    }
    return cfg;
}
}  // namespace

std::size_t MonitorConfig::test_count() const {
    std::size_t n = 0;
    for (const auto& h : hosts) n += h.tests.size();
    return n;
}

void parse_port_spec(const std::string& text, uint16_t& low, uint16_t& high) {
    std::string t = text;
    t.erase(std::remove_if(t.begin(), t.end(), [](unsigned char c) { return std::isspace(c); }),
            t.end());
    auto dash = t.find('-');
    if (dash == std::string::npos) {
        low = high = parse_port_number(t, text);
        return;
    }
    low = parse_port_number(t.substr(0, dash), text);
    high = parse_port_number(t.substr(dash + 1), text);
    if (low > high) throw ConfigError("port range '" + text + "' has low > high");
}

MonitorConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("error parsing YAML: ") + ex.what());
    }
    try {
        return parse_document(root);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("invalid config: ") + ex.what());
    }
}

MonitorConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("config file not found: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    MonitorConfig cfg = parse_config(ss.str());
    if (cfg.settings.ignore_self) {
        std::size_t dropped = drop_self_hosts(cfg, local_addresses());
        if (dropped > 0)
            log(LogLevel::INFO, "ignore_self: skipped " + std::to_string(dropped) + " local hosts");
        if (cfg.hosts.empty()) throw ConfigError("no hosts left after ignore_self");
    }
    return cfg;
}

std::size_t drop_self_hosts(MonitorConfig& cfg, const std::vector<std::string>& local) {
    auto before = cfg.hosts.size();
    cfg.hosts.erase(std::remove_if(cfg.hosts.begin(), cfg.hosts.end(),
                                   [&](const Host& h) {
                                       return std::find(local.begin(), local.end(),
                                                        h.address.str()) != local.end();
                                   }),
                    cfg.hosts.end());
    return before - cfg.hosts.size();
}
}  // namespace mpng
