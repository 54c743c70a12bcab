#ifndef NETHEAL_WATCHDOG_HPP
#define NETHEAL_WATCHDOG_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "netheal/config.hpp"
#include "netheal/hotspot.hpp"
#include "netheal/logging.hpp"
#include "netheal/prober.hpp"
#include "netheal/supervisor.hpp"

namespace netheal {

// Ordered by disruptiveness.
enum class RemediationAction {
    kNone,
    kRestartNetworkService,
    kReboot,
};

std::string remediation_action_name(RemediationAction action);

struct FailureLadder {
    unsigned consecutive_failures = 0;
    RemediationAction last_action = RemediationAction::kNone;
};

struct RemediationStep {
    unsigned threshold = 0;
    RemediationAction action = RemediationAction::kNone;
};

// Maps an exact consecutive-failure count to an action. Thresholds and
// actions must both be strictly increasing.
class RemediationPolicy {
public:
    explicit RemediationPolicy(std::vector<RemediationStep> steps);

    static RemediationPolicy from_config(const WatchdogConfig& config);

    RemediationAction action_for(unsigned consecutive_failures) const;
    const std::vector<RemediationStep>& steps() const { return steps_; }

private:
    std::vector<RemediationStep> steps_;
};

struct WatchdogTick {
    bool skipped = false;
    bool reachable = false;
    unsigned consecutive_failures = 0;
    RemediationAction action = RemediationAction::kNone;
};

class ConnectivityWatchdog {
public:
    ConnectivityWatchdog(std::shared_ptr<Prober> prober, std::shared_ptr<ServiceSupervisor> supervisor,
                         RemediationPolicy policy, WatchdogConfig config, ApOwnership hotspot_flag,
                         Logger logger = get_logger("ConnectivityWatchdog"));

    WatchdogTick tick();
    void run();
    void stop();

    const FailureLadder& ladder() const { return ladder_; }

private:
    bool hotspot_active();
    void remediate(RemediationAction action);
    void restart_network_service();

    std::shared_ptr<Prober> prober_;
    std::shared_ptr<ServiceSupervisor> supervisor_;
    RemediationPolicy policy_;
    WatchdogConfig config_;
    ApOwnership hotspot_flag_;
    Logger logger_;
    FailureLadder ladder_;
    std::atomic<bool> running_{false};
};

}  // namespace netheal

#endif  // NETHEAL_WATCHDOG_HPP
