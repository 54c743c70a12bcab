#include "netheal/watchdog.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace netheal {

std::string remediation_action_name(RemediationAction action) {
    switch (action) {
        case RemediationAction::kNone:
            return "none";
        case RemediationAction::kRestartNetworkService:
            return "restart_network_service";
        case RemediationAction::kReboot:
            return "reboot";
    }
    return "none";
}

RemediationPolicy::RemediationPolicy(std::vector<RemediationStep> steps) : steps_(std::move(steps)) {
    for (size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i].threshold == 0) {
            throw std::runtime_error("remediation threshold must be positive");
        }
        if (steps_[i].action == RemediationAction::kNone) {
            throw std::runtime_error("remediation step needs an action");
        }
        if (i == 0) {
            continue;
        }
        if (steps_[i].threshold <= steps_[i - 1].threshold) {
            throw std::runtime_error("remediation thresholds must be strictly increasing");
        }
        if (static_cast<int>(steps_[i].action) <= static_cast<int>(steps_[i - 1].action)) {
            throw std::runtime_error("remediation actions must escalate");
        }
    }
}

RemediationPolicy RemediationPolicy::from_config(const WatchdogConfig& config) {
    if (config.restart_threshold <= 0 || config.reboot_threshold <= 0) {
        throw std::runtime_error("watchdog thresholds must be positive");
    }
    return RemediationPolicy({
        {static_cast<unsigned>(config.restart_threshold), RemediationAction::kRestartNetworkService},
        {static_cast<unsigned>(config.reboot_threshold), RemediationAction::kReboot},
    });
}

RemediationAction RemediationPolicy::action_for(unsigned consecutive_failures) const {
    for (const auto& step : steps_) {
        if (step.threshold == consecutive_failures) {
            return step.action;
        }
    }
    return RemediationAction::kNone;
}

ConnectivityWatchdog::ConnectivityWatchdog(std::shared_ptr<Prober> prober,
                                           std::shared_ptr<ServiceSupervisor> supervisor,
                                           RemediationPolicy policy, WatchdogConfig config,
                                           ApOwnership hotspot_flag, Logger logger)
    : prober_(std::move(prober)),
      supervisor_(std::move(supervisor)),
      policy_(std::move(policy)),
      config_(std::move(config)),
      hotspot_flag_(std::move(hotspot_flag)),
      logger_(std::move(logger)) {
    if (!prober_ || !supervisor_) {
        throw std::runtime_error("ConnectivityWatchdog requires a prober and a supervisor");
    }
}

// Advisory only: the hotspot may start between this check and the probe.
bool ConnectivityWatchdog::hotspot_active() {
    if (!config_.hotspot_unit.empty()) {
        try {
            const auto state = supervisor_->unit_state(config_.hotspot_unit);
            if (state == UnitState::kActive || state == UnitState::kActivating) {
                return true;
            }
        } catch (const std::exception& exc) {
            logger_.warn("hotspot_state_unknown", {{"unit", config_.hotspot_unit}, {"error", exc.what()}});
        }
    }
    return hotspot_flag_.held();
}

WatchdogTick ConnectivityWatchdog::tick() {
    WatchdogTick outcome;
    if (hotspot_active()) {
        logger_.debug("hotspot_active_skipping");
        outcome.skipped = true;
        outcome.consecutive_failures = ladder_.consecutive_failures;
        return outcome;
    }

    const auto result = prober_->probe();
    outcome.reachable = result.reachable;
    if (result.reachable) {
        if (ladder_.consecutive_failures > 0) {
            logger_.info("network_recovered", {{"failures", std::to_string(ladder_.consecutive_failures)}});
        }
        ladder_.consecutive_failures = 0;
        ladder_.last_action = RemediationAction::kNone;
        return outcome;
    }

    ladder_.consecutive_failures += 1;
    outcome.consecutive_failures = ladder_.consecutive_failures;
    logger_.warn("network_down", {{"failures", std::to_string(ladder_.consecutive_failures)}});

    const auto action = policy_.action_for(ladder_.consecutive_failures);
    if (action != RemediationAction::kNone) {
        remediate(action);
        ladder_.last_action = action;
        outcome.action = action;
    }
    return outcome;
}

void ConnectivityWatchdog::remediate(RemediationAction action) {
    switch (action) {
        case RemediationAction::kNone:
            return;
        case RemediationAction::kRestartNetworkService:
            restart_network_service();
            return;
        case RemediationAction::kReboot:
            logger_.warn("rebooting", {{"failures", std::to_string(ladder_.consecutive_failures)}});
            try {
                supervisor_->reboot();
            } catch (const std::exception& exc) {
                logger_.error("reboot_failed", {{"error", exc.what()}});
            }
            return;
    }
}

// The first enabled unit wins; with none enabled the last one is tried anyway.
void ConnectivityWatchdog::restart_network_service() {
    if (config_.network_services.empty()) {
        logger_.error("no_network_service_configured");
        return;
    }
    std::string target = config_.network_services.back();
    for (const auto& unit : config_.network_services) {
        try {
            if (supervisor_->is_enabled(unit)) {
                target = unit;
                break;
            }
        } catch (const std::exception& exc) {
            logger_.warn("unit_enabled_check_failed", {{"unit", unit}, {"error", exc.what()}});
        }
    }
    logger_.warn("restarting_network_service", {{"unit", target}});
    try {
        supervisor_->restart(target);
    } catch (const std::exception& exc) {
        logger_.error("network_service_restart_failed", {{"unit", target}, {"error", exc.what()}});
    }
}

void ConnectivityWatchdog::run() {
    running_ = true;
    logger_.info("watchdog_started", {{"interval_s", std::to_string(config_.interval_s)}});
    const auto slice = std::chrono::milliseconds(200);
    while (running_) {
        const auto wake = std::chrono::steady_clock::now() + std::chrono::duration<double>(config_.interval_s);
        while (running_ && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(slice);
        }
        if (!running_) {
            break;
        }
        try {
            tick();
        } catch (const std::exception& exc) {
            logger_.error("watchdog_tick_failed", {{"error", exc.what()}});
        }
    }
    logger_.info("watchdog_stopped");
}

void ConnectivityWatchdog::stop() {
    running_ = false;
}

}  // namespace netheal
