#ifndef NETHEAL_SUPERVISOR_HPP
#define NETHEAL_SUPERVISOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/process.hpp"

namespace netheal {

enum class UnitState {
    kActive,
    kActivating,
    kDeactivating,
    kReloading,
    kInactive,
    kFailed,
    kUnknown,
};

UnitState parse_unit_state(const std::string& text);
std::string unit_state_name(UnitState state);

// The operations the control loops need from the service manager. Mutating
// calls throw CommandError when the manager rejects them.
class ServiceSupervisor {
public:
    virtual ~ServiceSupervisor() = default;

    virtual UnitState unit_state(const std::string& unit) = 0;
    virtual bool is_enabled(const std::string& unit) = 0;
    virtual std::vector<std::string> list_units(const std::string& pattern) = 0;

    virtual void start(const std::vector<std::string>& units) = 0;
    virtual void stop(const std::vector<std::string>& units) = 0;
    virtual void restart(const std::string& unit) = 0;
    virtual void mask(const std::vector<std::string>& units) = 0;
    virtual void unmask(const std::vector<std::string>& units) = 0;
    virtual void enable_now(const std::string& unit) = 0;
    virtual void disable_now(const std::string& unit) = 0;
    virtual void reboot() = 0;
};

class SystemdSupervisor : public ServiceSupervisor {
public:
    SystemdSupervisor(std::shared_ptr<CommandRunner> runner, SupervisorConfig config = {},
                      Logger logger = get_logger("SystemdSupervisor"));

    UnitState unit_state(const std::string& unit) override;
    bool is_enabled(const std::string& unit) override;
    std::vector<std::string> list_units(const std::string& pattern) override;

    void start(const std::vector<std::string>& units) override;
    void stop(const std::vector<std::string>& units) override;
    void restart(const std::string& unit) override;
    void mask(const std::vector<std::string>& units) override;
    void unmask(const std::vector<std::string>& units) override;
    void enable_now(const std::string& unit) override;
    void disable_now(const std::string& unit) override;
    void reboot() override;

private:
    CommandResult query(const std::vector<std::string>& args);
    void invoke(const std::vector<std::string>& args);
    void install_fast_reboot_dropin();

    std::shared_ptr<CommandRunner> runner_;
    SupervisorConfig config_;
    Logger logger_;
};

}  // namespace netheal

#endif  // NETHEAL_SUPERVISOR_HPP
