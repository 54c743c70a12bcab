#ifndef NETHEAL_HOTSPOT_HPP
#define NETHEAL_HOTSPOT_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/network.hpp"
#include "netheal/process.hpp"
#include "netheal/prober.hpp"
#include "netheal/supervisor.hpp"

namespace netheal {

enum class HotspotState {
    kChecking,
    kApStarting,
    kApActive,
    kConnected,
    kGaveUp,
};

std::string hotspot_state_name(HotspotState state);

enum class HotspotOutcome {
    kConnected,
    kGaveUp,
};

int exit_code(HotspotOutcome outcome);

struct HotspotSession {
    std::string interface;
    bool active = false;
    double started_at = 0.0;
};

// The captive configuration application. run() blocks until the user has
// supplied credentials or the application decides to hand control back.
class CaptivePortal {
public:
    virtual ~CaptivePortal() = default;
    virtual int run(const std::string& interface) = 0;
};

// Runs an external captive app with the interface name appended to its
// command line. The app signals completed configuration by creating the
// sentinel file; the portal then terminates it and returns.
class CommandCaptivePortal : public CaptivePortal {
public:
    CommandCaptivePortal(std::shared_ptr<CommandRunner> runner, std::string command, std::string sentinel_path,
                         double timeout_s = 0.0, Logger logger = get_logger("CaptivePortal"));

    int run(const std::string& interface) override;

private:
    std::shared_ptr<CommandRunner> runner_;
    std::string command_;
    std::string sentinel_path_;
    double timeout_s_ = 0.0;
    Logger logger_;
};

class ApConfigInstaller {
public:
    virtual ~ApConfigInstaller() = default;
    virtual void install(const std::string& interface) = 0;
};

// Copies hostapd / DHCP server templates into place, rewriting the template's
// default interface name.
class TemplateApConfigInstaller : public ApConfigInstaller {
public:
    TemplateApConfigInstaller(std::vector<ApTemplate> templates, std::string default_interface);

    void install(const std::string& interface) override;

private:
    std::vector<ApTemplate> templates_;
    std::string default_interface_;
};

std::string substitute_interface(std::string text, const std::string& from, const std::string& to);

// Advisory pid file naming the process that owns the AP stack. A flag whose
// pid is gone counts as not held. An empty path disables the flag.
class ApOwnership {
public:
    explicit ApOwnership(std::string path);

    void acquire();
    void release();
    bool held() const;

private:
    std::string path_;
};

class HotspotController {
public:
    using Sleeper = std::function<void(double)>;

    HotspotController(std::shared_ptr<Prober> prober, std::shared_ptr<NetworkHost> network,
                      std::shared_ptr<ServiceSupervisor> supervisor, std::shared_ptr<CaptivePortal> portal,
                      std::shared_ptr<ApConfigInstaller> installer, HotspotConfig config,
                      std::optional<std::string> preferred_interface = std::nullopt,
                      Logger logger = get_logger("HotspotController"), Sleeper sleeper = nullptr);

    HotspotOutcome ensure_connectivity();

    HotspotState state() const { return state_; }
    const std::optional<HotspotSession>& session() const { return session_; }
    int portal_runs() const { return portal_runs_; }

private:
    void transition(HotspotState next);
    void sleep(double seconds);
    std::optional<std::string> discover_interface();
    void start_access_point();
    void ensure_services_running();
    void run_portal();
    bool await_connectivity();
    void stop_access_point();

    std::shared_ptr<Prober> prober_;
    std::shared_ptr<NetworkHost> network_;
    std::shared_ptr<ServiceSupervisor> supervisor_;
    std::shared_ptr<CaptivePortal> portal_;
    std::shared_ptr<ApConfigInstaller> installer_;
    HotspotConfig config_;
    std::optional<std::string> preferred_interface_;
    Logger logger_;
    Sleeper sleeper_;
    ApOwnership ownership_;
    HotspotState state_ = HotspotState::kChecking;
    std::optional<HotspotSession> session_;
    int portal_runs_ = 0;
};

}  // namespace netheal

#endif  // NETHEAL_HOTSPOT_HPP
