#include "netheal/aliases.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "netheal/common.hpp"

namespace netheal {

namespace {

constexpr size_t kMaxLabelLength = 63;
constexpr const char* kUnitSuffix = ".service";

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string sanitize_hostname(const std::string& name) {
    std::string output;
    for (char ch : name) {
        const auto uch = static_cast<unsigned char>(ch);
        if (uch < 0x80 && (std::isalnum(uch) != 0 || ch == '-')) {
            output.push_back(ch);
        }
    }
    const auto first = output.find_first_not_of('-');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = output.find_last_not_of('-');
    output = output.substr(first, last - first + 1);
    if (output.size() > kMaxLabelLength) {
        output.resize(kMaxLabelLength);
    }
    return output;
}

AliasSet desired_aliases(const std::string& hostname, const AliasConfig& config) {
    AliasSet aliases;
    if (!hostname.empty()) {
        aliases.insert(hostname + config.domain);
        std::string compact;
        for (char ch : hostname) {
            if (ch != '-' && ch != '_' && ch != '.') {
                compact.push_back(ch);
            }
        }
        if (!compact.empty()) {
            aliases.insert(compact + config.domain);
        }
    }
    if (!config.fallback_alias.empty()) {
        aliases.insert(config.fallback_alias + config.domain);
    }
    return aliases;
}

HostsFile::HostsFile(std::string path) : path_(std::move(path)) {}

bool HostsFile::contains(const std::string& hostname) const {
    std::ifstream file(path_);
    if (!file) {
        return false;
    }
    std::string line;
    while (std::getline(file, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        const auto fields = split_whitespace(line);
        for (size_t i = 1; i < fields.size(); ++i) {
            if (fields[i] == hostname) {
                return true;
            }
        }
    }
    return false;
}

bool HostsFile::ensure_entry(const std::string& address, const std::string& hostname) {
    if (contains(hostname)) {
        return false;
    }
    bool needs_newline = false;
    {
        std::ifstream existing(path_, std::ios::binary | std::ios::ate);
        if (existing && existing.tellg() > 0) {
            existing.seekg(-1, std::ios::end);
            char last = '\n';
            existing.get(last);
            needs_newline = last != '\n';
        }
    }
    std::ofstream file(path_, std::ios::app);
    if (!file) {
        throw std::runtime_error("unable to append to hosts file: " + path_);
    }
    if (needs_newline) {
        file << '\n';
    }
    file << address << ' ' << hostname << '\n';
    if (!file.flush()) {
        throw std::runtime_error("unable to append to hosts file: " + path_);
    }
    return true;
}

AliasReconciler::AliasReconciler(std::shared_ptr<ServiceSupervisor> supervisor, AliasConfig config,
                                 Logger logger)
    : supervisor_(std::move(supervisor)), config_(std::move(config)), logger_(std::move(logger)) {
    if (!supervisor_) {
        throw std::runtime_error("AliasReconciler requires a supervisor");
    }
}

std::string AliasReconciler::unit_for(const std::string& alias) const {
    return config_.unit_prefix + alias + kUnitSuffix;
}

std::string AliasReconciler::alias_from_unit(const std::string& unit) const {
    if (unit.compare(0, config_.unit_prefix.size(), config_.unit_prefix) != 0 || !ends_with(unit, kUnitSuffix)) {
        return "";
    }
    const size_t suffix = std::string(kUnitSuffix).size();
    if (unit.size() <= config_.unit_prefix.size() + suffix) {
        return "";
    }
    return unit.substr(config_.unit_prefix.size(), unit.size() - config_.unit_prefix.size() - suffix);
}

AliasReconciler::Inventory AliasReconciler::inventory() {
    Inventory output;
    for (const auto& unit : supervisor_->list_units(config_.unit_prefix + "*" + kUnitSuffix)) {
        const auto alias = alias_from_unit(unit);
        if (alias.empty()) {
            continue;
        }
        const bool enabled = supervisor_->is_enabled(unit);
        const auto state = supervisor_->unit_state(unit);
        const bool running = state == UnitState::kActive || state == UnitState::kActivating;
        if (enabled && running) {
            output.active.insert(alias);
        }
        if (enabled || running) {
            output.present.insert(alias);
        }
    }
    return output;
}

AliasSet AliasReconciler::active_aliases() {
    return inventory().active;
}

ReconcileReport AliasReconciler::reconcile(const std::string& hostname) {
    if (hostname.empty()) {
        throw std::runtime_error("hostname must not be empty");
    }
    const auto& flag = config_.image_flag_file;
    std::error_code ec;
    if (flag.has_value() && !std::filesystem::exists(*flag, ec)) {
        logger_.error("not_a_feeder_image", {{"flag_file", *flag}});
        throw std::runtime_error("image flag file missing: " + *flag);
    }
    ReconcileReport report;

    try {
        report.hosts_updated = HostsFile(config_.hosts_path).ensure_entry(config_.hosts_address, hostname);
        if (report.hosts_updated) {
            logger_.info("hosts_entry_added", {{"hostname", hostname}, {"address", config_.hosts_address}});
        }
    } catch (const std::exception& exc) {
        logger_.error("hosts_entry_failed", {{"error", exc.what()}});
    }

    const auto desired = desired_aliases(hostname, config_);
    const auto current = inventory();

    for (const auto& alias : desired) {
        if (current.active.count(alias) != 0) {
            continue;
        }
        const auto unit = unit_for(alias);
        try {
            supervisor_->enable_now(unit);
            report.enabled.push_back(alias);
            logger_.info("alias_enabled", {{"alias", alias}});
        } catch (const std::exception& exc) {
            report.failed.push_back(alias);
            logger_.error("alias_enable_failed", {{"alias", alias}, {"error", exc.what()}});
        }
    }

    for (const auto& alias : current.present) {
        if (desired.count(alias) != 0) {
            continue;
        }
        const auto unit = unit_for(alias);
        try {
            supervisor_->disable_now(unit);
            report.disabled.push_back(alias);
            logger_.info("alias_disabled", {{"alias", alias}});
        } catch (const std::exception& exc) {
            report.failed.push_back(alias);
            logger_.error("alias_disable_failed", {{"alias", alias}, {"error", exc.what()}});
        }
    }

    if (report.transitions() == 0 && report.failed.empty()) {
        logger_.debug("aliases_unchanged", {{"hostname", hostname}});
    }
    return report;
}

}  // namespace netheal
