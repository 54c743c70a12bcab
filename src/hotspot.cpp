#include "netheal/hotspot.hpp"

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "netheal/common.hpp"

namespace netheal {

namespace {

bool remove_if_present(const std::string& path, const Logger& logger) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        logger.warn("remove_failed", {{"path", path}, {"error", ec.message()}});
    }
    return removed;
}

}  // namespace

std::string hotspot_state_name(HotspotState state) {
    switch (state) {
        case HotspotState::kChecking:
            return "CHECKING";
        case HotspotState::kApStarting:
            return "AP_STARTING";
        case HotspotState::kApActive:
            return "AP_ACTIVE";
        case HotspotState::kConnected:
            return "CONNECTED";
        case HotspotState::kGaveUp:
            return "GAVE_UP";
    }
    return "CHECKING";
}

int exit_code(HotspotOutcome outcome) {
    return outcome == HotspotOutcome::kConnected ? 0 : 1;
}

CommandCaptivePortal::CommandCaptivePortal(std::shared_ptr<CommandRunner> runner, std::string command,
                                           std::string sentinel_path, double timeout_s, Logger logger)
    : runner_(std::move(runner)),
      command_(std::move(command)),
      sentinel_path_(std::move(sentinel_path)),
      timeout_s_(timeout_s),
      logger_(std::move(logger)) {
    if (!runner_) {
        throw std::runtime_error("CommandCaptivePortal requires a command runner");
    }
    if (split_whitespace(command_).empty()) {
        throw std::runtime_error("captive portal command is empty");
    }
}

int CommandCaptivePortal::run(const std::string& interface) {
    // A sentinel left over from an earlier session would end this one at once.
    remove_if_present(sentinel_path_, logger_);

    auto argv = split_whitespace(command_);
    argv.push_back(interface);
    logger_.info("captive_portal_started", {{"command", describe_command(argv)}});

    const std::string sentinel = sentinel_path_;
    std::function<bool()> stop_when;
    if (!sentinel.empty()) {
        stop_when = [sentinel]() {
            std::error_code ec;
            return std::filesystem::exists(sentinel, ec);
        };
    }

    const auto result = runner_->run(argv, timeout_s_, stop_when);
    if (result.interrupted) {
        logger_.info("captive_portal_configured", {{"sentinel", sentinel}});
        remove_if_present(sentinel_path_, logger_);
        return 0;
    }
    if (result.timed_out) {
        logger_.warn("captive_portal_timed_out", {{"timeout_s", std::to_string(timeout_s_)}});
    } else if (result.exit_code != 0) {
        logger_.warn("captive_portal_exited", {{"exit_code", std::to_string(result.exit_code)}});
    } else {
        logger_.info("captive_portal_exited", {{"exit_code", "0"}});
    }
    return result.exit_code;
}

TemplateApConfigInstaller::TemplateApConfigInstaller(std::vector<ApTemplate> templates,
                                                     std::string default_interface)
    : templates_(std::move(templates)), default_interface_(std::move(default_interface)) {}

void TemplateApConfigInstaller::install(const std::string& interface) {
    for (const auto& entry : templates_) {
        std::ifstream source(entry.source);
        if (!source) {
            throw std::runtime_error("unable to read AP template: " + entry.source);
        }
        std::ostringstream contents;
        contents << source.rdbuf();

        std::string text = contents.str();
        if (!default_interface_.empty() && interface != default_interface_) {
            text = substitute_interface(std::move(text), default_interface_, interface);
        }

        const std::filesystem::path destination(entry.destination);
        std::error_code ec;
        if (destination.has_parent_path()) {
            std::filesystem::create_directories(destination.parent_path(), ec);
        }
        std::filesystem::path staging = destination;
        staging += ".netheal-tmp";
        {
            std::ofstream output(staging, std::ios::trunc);
            if (!output) {
                throw std::runtime_error("unable to write AP config: " + staging.string());
            }
            output << text;
            if (!output.flush()) {
                throw std::runtime_error("unable to write AP config: " + staging.string());
            }
        }
        std::filesystem::rename(staging, destination, ec);
        if (ec) {
            std::filesystem::remove(staging, ec);
            throw std::runtime_error("unable to install AP config: " + entry.destination);
        }
    }
}

std::string substitute_interface(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

ApOwnership::ApOwnership(std::string path) : path_(std::move(path)) {}

void ApOwnership::acquire() {
    if (path_.empty()) {
        return;
    }
    const std::filesystem::path path(path_);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("unable to write ownership flag: " + path_);
    }
    file << ::getpid() << '\n';
}

void ApOwnership::release() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool ApOwnership::held() const {
    if (path_.empty()) {
        return false;
    }
    std::ifstream file(path_);
    if (!file) {
        return false;
    }
    long pid = 0;
    if (!(file >> pid) || pid <= 0) {
        return false;
    }
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

HotspotController::HotspotController(std::shared_ptr<Prober> prober, std::shared_ptr<NetworkHost> network,
                                     std::shared_ptr<ServiceSupervisor> supervisor,
                                     std::shared_ptr<CaptivePortal> portal,
                                     std::shared_ptr<ApConfigInstaller> installer, HotspotConfig config,
                                     std::optional<std::string> preferred_interface, Logger logger,
                                     Sleeper sleeper)
    : prober_(std::move(prober)),
      network_(std::move(network)),
      supervisor_(std::move(supervisor)),
      portal_(std::move(portal)),
      installer_(std::move(installer)),
      config_(std::move(config)),
      preferred_interface_(std::move(preferred_interface)),
      logger_(std::move(logger)),
      sleeper_(std::move(sleeper)),
      ownership_(config_.ownership_flag) {
    if (!prober_ || !network_ || !supervisor_ || !portal_ || !installer_) {
        throw std::runtime_error("HotspotController requires all collaborators");
    }
}

void HotspotController::transition(HotspotState next) {
    logger_.debug("state", {{"from", hotspot_state_name(state_)}, {"to", hotspot_state_name(next)}});
    state_ = next;
}

void HotspotController::sleep(double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    if (sleeper_) {
        sleeper_(seconds);
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

HotspotOutcome HotspotController::ensure_connectivity() {
    transition(HotspotState::kChecking);
    const auto initial = prober_->probe();
    if (initial.reachable) {
        logger_.info("network_reachable", {{"method", probe_method_name(initial.method)}});
        transition(HotspotState::kConnected);
        return HotspotOutcome::kConnected;
    }

    logger_.info("no_connectivity_starting_access_point");
    const auto interface = discover_interface();
    if (!interface.has_value()) {
        logger_.error("no_wireless_interface");
        transition(HotspotState::kGaveUp);
        return HotspotOutcome::kGaveUp;
    }

    session_ = HotspotSession{*interface, false, seconds_since_epoch()};
    start_access_point();
    session_->active = true;

    while (true) {
        transition(HotspotState::kApActive);
        ensure_services_running();
        run_portal();
        transition(HotspotState::kChecking);
        if (await_connectivity()) {
            break;
        }
    }

    stop_access_point();
    transition(HotspotState::kConnected);
    logger_.info("connected");
    return HotspotOutcome::kConnected;
}

std::optional<std::string> HotspotController::discover_interface() {
    const int attempts = std::max(1, config_.interface_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::vector<std::string> interfaces;
        try {
            interfaces = network_->wireless_interfaces();
        } catch (const std::exception& exc) {
            logger_.warn("interface_enumeration_failed", {{"error", exc.what()}});
        }
        if (preferred_interface_.has_value()) {
            if (std::find(interfaces.begin(), interfaces.end(), *preferred_interface_) != interfaces.end()) {
                return preferred_interface_;
            }
            // A missing preferred radio must not leave the device without an AP.
            if (attempt == attempts && !interfaces.empty()) {
                logger_.warn("preferred_interface_missing",
                             {{"requested", *preferred_interface_}, {"using", interfaces.front()}});
                return interfaces.front();
            }
        } else if (!interfaces.empty()) {
            return interfaces.front();
        }
        if (attempt < attempts) {
            sleep(config_.interface_retry_s);
        }
    }
    return std::nullopt;
}

void HotspotController::start_access_point() {
    transition(HotspotState::kApStarting);
    const std::string& interface = session_->interface;
    logger_.info("access_point_starting", {{"interface", interface}});

    try {
        ownership_.acquire();
    } catch (const std::exception& exc) {
        logger_.warn("ownership_flag_failed", {{"error", exc.what()}});
    }
    try {
        installer_->install(interface);
    } catch (const std::exception& exc) {
        logger_.warn("ap_config_install_failed", {{"error", exc.what()}});
    }
    try {
        supervisor_->unmask(config_.ap_services);
    } catch (const std::exception& exc) {
        logger_.warn("ap_unmask_failed", {{"error", exc.what()}});
    }
    if (!config_.ap_address.empty()) {
        try {
            network_->assign_address(interface, config_.ap_address);
        } catch (const std::exception& exc) {
            logger_.warn("ap_address_failed", {{"address", config_.ap_address}, {"error", exc.what()}});
        }
    }
    for (const auto& service : config_.ap_services) {
        try {
            supervisor_->start({service});
        } catch (const std::exception& exc) {
            logger_.warn("ap_service_start_failed", {{"unit", service}, {"error", exc.what()}});
        }
    }
}

// Units that failed to come up earlier get another start on each pass.
void HotspotController::ensure_services_running() {
    for (const auto& service : config_.ap_services) {
        try {
            const auto state = supervisor_->unit_state(service);
            if (state == UnitState::kActive || state == UnitState::kActivating) {
                continue;
            }
            logger_.info("ap_service_restart", {{"unit", service}, {"state", unit_state_name(state)}});
            supervisor_->start({service});
        } catch (const std::exception& exc) {
            logger_.warn("ap_service_start_failed", {{"unit", service}, {"error", exc.what()}});
        }
    }
}

void HotspotController::run_portal() {
    portal_runs_ += 1;
    try {
        portal_->run(session_->interface);
    } catch (const std::exception& exc) {
        logger_.warn("captive_portal_failed", {{"error", exc.what()}});
    }
}

bool HotspotController::await_connectivity() {
    const int attempts = std::max(1, config_.recheck_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        const auto result = prober_->probe();
        if (result.reachable) {
            logger_.info("network_reachable", {{"method", probe_method_name(result.method)},
                                               {"portal_runs", std::to_string(portal_runs_)}});
            return true;
        }
        if (attempt < attempts) {
            sleep(config_.recheck_interval_s);
        }
    }
    return false;
}

// Masking keeps other units from pulling hostapd / dhcpd back in.
void HotspotController::stop_access_point() {
    const std::string interface = session_->interface;
    try {
        supervisor_->stop(config_.ap_services);
    } catch (const std::exception& exc) {
        logger_.warn("ap_stop_failed", {{"error", exc.what()}});
    }
    try {
        supervisor_->mask(config_.ap_services);
    } catch (const std::exception& exc) {
        logger_.warn("ap_mask_failed", {{"error", exc.what()}});
    }
    if (!config_.ap_address.empty()) {
        try {
            network_->remove_address(interface, config_.ap_address);
        } catch (const std::exception& exc) {
            logger_.warn("ap_address_remove_failed", {{"interface", interface}, {"error", exc.what()}});
        }
    }
    ownership_.release();
    session_.reset();
    logger_.info("access_point_stopped", {{"interface", interface}});
}

}  // namespace netheal
