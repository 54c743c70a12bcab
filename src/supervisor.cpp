#include "netheal/supervisor.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "netheal/common.hpp"

namespace netheal {

namespace {

constexpr const char* kFastRebootDropin =
    "[Unit]\n"
    "JobTimeoutSec=60\n"
    "JobTimeoutAction=reboot-force\n";

std::vector<std::string> concat(std::vector<std::string> head, const std::vector<std::string>& tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

}  // namespace

UnitState parse_unit_state(const std::string& text) {
    const auto value = trim(text);
    if (value == "active") {
        return UnitState::kActive;
    }
    if (value == "activating") {
        return UnitState::kActivating;
    }
    if (value == "deactivating") {
        return UnitState::kDeactivating;
    }
    if (value == "reloading") {
        return UnitState::kReloading;
    }
    if (value == "inactive") {
        return UnitState::kInactive;
    }
    if (value == "failed") {
        return UnitState::kFailed;
    }
    return UnitState::kUnknown;
}

std::string unit_state_name(UnitState state) {
    switch (state) {
        case UnitState::kActive:
            return "active";
        case UnitState::kActivating:
            return "activating";
        case UnitState::kDeactivating:
            return "deactivating";
        case UnitState::kReloading:
            return "reloading";
        case UnitState::kInactive:
            return "inactive";
        case UnitState::kFailed:
            return "failed";
        case UnitState::kUnknown:
            return "unknown";
    }
    return "unknown";
}

SystemdSupervisor::SystemdSupervisor(std::shared_ptr<CommandRunner> runner, SupervisorConfig config,
                                     Logger logger)
    : runner_(std::move(runner)), config_(std::move(config)), logger_(std::move(logger)) {
    if (!runner_) {
        throw std::runtime_error("SystemdSupervisor requires a command runner");
    }
}

CommandResult SystemdSupervisor::query(const std::vector<std::string>& args) {
    return runner_->run(concat({config_.systemctl}, args), config_.command_timeout_s);
}

void SystemdSupervisor::invoke(const std::vector<std::string>& args) {
    const auto argv = concat({config_.systemctl}, args);
    logger_.debug("systemctl", {{"command", describe_command(argv)}});
    auto result = runner_->run(argv, config_.command_timeout_s);
    if (!result.ok()) {
        throw CommandError(argv, std::move(result));
    }
}

// is-active exits non-zero for anything but "active", so only the output counts.
UnitState SystemdSupervisor::unit_state(const std::string& unit) {
    const auto result = query({"is-active", unit});
    if (result.timed_out) {
        return UnitState::kUnknown;
    }
    const auto lines = split(trim(result.output), '\n');
    return parse_unit_state(lines.empty() ? "" : lines.front());
}

bool SystemdSupervisor::is_enabled(const std::string& unit) {
    return query({"is-enabled", "--quiet", unit}).ok();
}

std::vector<std::string> SystemdSupervisor::list_units(const std::string& pattern) {
    const std::vector<std::string> argv = {config_.systemctl, "list-units", "--all", "--plain",
                                           "--no-legend", "--no-pager", pattern};
    auto result = runner_->run(argv, config_.command_timeout_s);
    if (!result.ok()) {
        throw CommandError(argv, std::move(result));
    }
    std::vector<std::string> units;
    for (const auto& line : split(result.output, '\n')) {
        const auto fields = split_whitespace(line);
        if (fields.empty()) {
            continue;
        }
        // Failed units carry a leading marker column on some systemd versions.
        const std::string& name = (fields.front() == "●" || fields.front() == "*") && fields.size() > 1
                                      ? fields[1]
                                      : fields.front();
        units.push_back(name);
    }
    return units;
}

void SystemdSupervisor::start(const std::vector<std::string>& units) {
    invoke(concat({"start"}, units));
}

void SystemdSupervisor::stop(const std::vector<std::string>& units) {
    invoke(concat({"stop"}, units));
}

void SystemdSupervisor::restart(const std::string& unit) {
    invoke({"restart", unit});
}

void SystemdSupervisor::mask(const std::vector<std::string>& units) {
    invoke(concat({"mask"}, units));
}

void SystemdSupervisor::unmask(const std::vector<std::string>& units) {
    invoke(concat({"unmask"}, units));
}

void SystemdSupervisor::enable_now(const std::string& unit) {
    invoke({"enable", "--now", unit});
}

void SystemdSupervisor::disable_now(const std::string& unit) {
    invoke({"disable", "--now", unit});
}

void SystemdSupervisor::install_fast_reboot_dropin() {
    const std::filesystem::path dir(config_.reboot_dropin_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        logger_.warn("reboot_dropin_failed", {{"dir", dir.string()}, {"error", ec.message()}});
        return;
    }
    std::ofstream file(dir / "fastreboot.conf", std::ios::trunc);
    if (!file) {
        logger_.warn("reboot_dropin_failed", {{"dir", dir.string()}});
        return;
    }
    file << kFastRebootDropin;
    file.close();
    const auto reload = query({"daemon-reload"});
    if (!reload.ok()) {
        logger_.warn("daemon_reload_failed", {{"exit_code", std::to_string(reload.exit_code)}});
    }
}

void SystemdSupervisor::reboot() {
    install_fast_reboot_dropin();
    ::sync();
    logger_.warn("rebooting");
    invoke({"reboot"});
}

}  // namespace netheal
