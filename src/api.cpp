#include "netheal/api.hpp"

#include <limits.h>
#include <unistd.h>

#include <stdexcept>

namespace netheal {

NetHealRuntime build_runtime(std::shared_ptr<NetHealSettings> settings, std::shared_ptr<CommandRunner> runner) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<NetHealSettings>();
    configure_logging(effective_settings->logging);

    auto effective_runner = runner ? std::move(runner) : std::make_shared<SystemCommandRunner>();
    auto supervisor = std::make_shared<SystemdSupervisor>(effective_runner, effective_settings->supervisor);
    auto network = std::make_shared<LinuxNetworkHost>(effective_runner, effective_settings->prober.route_table,
                                                      effective_settings->hotspot.sys_class_net);
    auto prober = build_prober(effective_settings->prober, network,
                               std::make_shared<CommandPinger>(effective_runner),
                               std::make_shared<SocketHttpChecker>());

    return NetHealRuntime{effective_settings, effective_runner, supervisor, network, prober};
}

std::unique_ptr<HotspotController> build_hotspot_controller(const NetHealRuntime& runtime,
                                                            std::optional<std::string> interface) {
    const auto& config = runtime.settings->hotspot;
    auto portal = std::make_shared<CommandCaptivePortal>(runtime.runner, config.captive_command,
                                                         config.sentinel_path, config.captive_timeout_s);
    auto installer = std::make_shared<TemplateApConfigInstaller>(config.templates, config.default_interface);
    return std::make_unique<HotspotController>(runtime.prober, runtime.network, runtime.supervisor, portal,
                                               installer, config, std::move(interface));
}

std::unique_ptr<ConnectivityWatchdog> build_watchdog(const NetHealRuntime& runtime) {
    const auto& settings = *runtime.settings;
    return std::make_unique<ConnectivityWatchdog>(runtime.prober, runtime.supervisor,
                                                  RemediationPolicy::from_config(settings.watchdog),
                                                  settings.watchdog, ApOwnership(settings.hotspot.ownership_flag));
}

std::unique_ptr<AliasReconciler> build_alias_reconciler(const NetHealRuntime& runtime) {
    return std::make_unique<AliasReconciler>(runtime.supervisor, runtime.settings->aliases);
}

bool running_as_root() {
    return ::geteuid() == 0;
}

std::string system_hostname() {
    char buffer[HOST_NAME_MAX + 1] = {0};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        throw std::runtime_error("unable to read system hostname");
    }
    return buffer;
}

}  // namespace netheal
