#ifndef NETHEAL_API_HPP
#define NETHEAL_API_HPP

#include <memory>
#include <optional>
#include <string>

#include "netheal/aliases.hpp"
#include "netheal/config.hpp"
#include "netheal/hotspot.hpp"
#include "netheal/logging.hpp"
#include "netheal/network.hpp"
#include "netheal/process.hpp"
#include "netheal/prober.hpp"
#include "netheal/supervisor.hpp"
#include "netheal/watchdog.hpp"

namespace netheal {

struct NetHealRuntime {
    std::shared_ptr<NetHealSettings> settings;
    std::shared_ptr<CommandRunner> runner;
    std::shared_ptr<ServiceSupervisor> supervisor;
    std::shared_ptr<NetworkHost> network;
    std::shared_ptr<Prober> prober;
};

// Configures logging and wires the system-backed collaborators.
NetHealRuntime build_runtime(std::shared_ptr<NetHealSettings> settings = nullptr,
                             std::shared_ptr<CommandRunner> runner = nullptr);

std::unique_ptr<HotspotController> build_hotspot_controller(const NetHealRuntime& runtime,
                                                            std::optional<std::string> interface = std::nullopt);
std::unique_ptr<ConnectivityWatchdog> build_watchdog(const NetHealRuntime& runtime);
std::unique_ptr<AliasReconciler> build_alias_reconciler(const NetHealRuntime& runtime);

bool running_as_root();
std::string system_hostname();

}  // namespace netheal

#endif  // NETHEAL_API_HPP
