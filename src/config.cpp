#include "netheal/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "netheal/common.hpp"

namespace netheal {

namespace {

constexpr const char* kDefaultConfigPath = "/etc/netheal/netheal.toml";

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none" || stripped.empty()) {
        return std::nullopt;
    }
    return stripped;
}

// ["a", "b"] on a single line.
std::vector<std::string> parse_string_list(const std::string& value) {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw std::runtime_error("invalid list: " + value);
    }
    std::vector<std::string> items;
    for (const auto& part : split(value.substr(1, value.size() - 2), ',')) {
        auto item = strip_quotes(trim(part));
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<ApTemplate> parse_templates(const std::string& value) {
    std::vector<ApTemplate> templates;
    for (const auto& item : parse_string_list(value)) {
        auto colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == item.size()) {
            throw std::runtime_error("template entry must be source:destination: " + item);
        }
        templates.push_back(ApTemplate{item.substr(0, colon), item.substr(colon + 1)});
    }
    return templates;
}

}  // namespace

NetHealSettings NetHealSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    NetHealSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = std::stoi(value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = std::stoi(value);
            }
        } else if (current_section == "prober") {
            if (key == "ping_count") {
                settings.prober.ping_count = std::stoi(value);
            } else if (key == "step_timeout_s") {
                settings.prober.step_timeout_s = std::stod(value);
            } else if (key == "public_ip") {
                settings.prober.public_ip = strip_quotes(value);
            } else if (key == "http_enabled") {
                settings.prober.http_enabled = parse_bool(value);
            } else if (key == "http_host") {
                settings.prober.http_host = strip_quotes(value);
            } else if (key == "http_port") {
                settings.prober.http_port = std::stoi(value);
            } else if (key == "http_path") {
                settings.prober.http_path = strip_quotes(value);
            } else if (key == "route_table") {
                settings.prober.route_table = strip_quotes(value);
            }
        } else if (current_section == "hotspot") {
            if (key == "default_interface") {
                settings.hotspot.default_interface = strip_quotes(value);
            } else if (key == "interface_attempts") {
                settings.hotspot.interface_attempts = std::stoi(value);
            } else if (key == "interface_retry_s") {
                settings.hotspot.interface_retry_s = std::stod(value);
            } else if (key == "recheck_attempts") {
                settings.hotspot.recheck_attempts = std::stoi(value);
            } else if (key == "recheck_interval_s") {
                settings.hotspot.recheck_interval_s = std::stod(value);
            } else if (key == "ap_services") {
                settings.hotspot.ap_services = parse_string_list(value);
            } else if (key == "templates") {
                settings.hotspot.templates = parse_templates(value);
            } else if (key == "ap_address") {
                settings.hotspot.ap_address = strip_quotes(value);
            } else if (key == "captive_command") {
                settings.hotspot.captive_command = strip_quotes(value);
            } else if (key == "captive_timeout_s") {
                settings.hotspot.captive_timeout_s = std::stod(value);
            } else if (key == "sentinel_path") {
                settings.hotspot.sentinel_path = strip_quotes(value);
            } else if (key == "ownership_flag") {
                settings.hotspot.ownership_flag = strip_quotes(value);
            } else if (key == "sys_class_net") {
                settings.hotspot.sys_class_net = strip_quotes(value);
            }
        } else if (current_section == "watchdog") {
            if (key == "interval_s") {
                settings.watchdog.interval_s = std::stod(value);
            } else if (key == "restart_threshold") {
                settings.watchdog.restart_threshold = std::stoi(value);
            } else if (key == "reboot_threshold") {
                settings.watchdog.reboot_threshold = std::stoi(value);
            } else if (key == "hotspot_unit") {
                settings.watchdog.hotspot_unit = strip_quotes(value);
            } else if (key == "network_services") {
                settings.watchdog.network_services = parse_string_list(value);
            }
        } else if (current_section == "aliases") {
            if (key == "unit_prefix") {
                settings.aliases.unit_prefix = strip_quotes(value);
            } else if (key == "domain") {
                settings.aliases.domain = strip_quotes(value);
            } else if (key == "fallback_alias") {
                settings.aliases.fallback_alias = strip_quotes(value);
            } else if (key == "hosts_path") {
                settings.aliases.hosts_path = strip_quotes(value);
            } else if (key == "hosts_address") {
                settings.aliases.hosts_address = strip_quotes(value);
            } else if (key == "image_flag_file") {
                settings.aliases.image_flag_file = parse_optional_string(value);
            }
        } else if (current_section == "supervisor") {
            if (key == "systemctl") {
                settings.supervisor.systemctl = strip_quotes(value);
            } else if (key == "command_timeout_s") {
                settings.supervisor.command_timeout_s = std::stod(value);
            } else if (key == "reboot_dropin_dir") {
                settings.supervisor.reboot_dropin_dir = strip_quotes(value);
            }
        }
    }

    return settings;
}

NetHealSettings NetHealSettings::load() {
    const char* env_path = std::getenv("NETHEAL_CONFIG");
    if (env_path != nullptr && *env_path != '\0') {
        return from_toml(env_path);
    }
    std::error_code ec;
    if (!std::filesystem::exists(kDefaultConfigPath, ec)) {
        return NetHealSettings{};
    }
    return from_toml(kDefaultConfigPath);
}

}  // namespace netheal
