#ifndef NETHEAL_ALIASES_HPP
#define NETHEAL_ALIASES_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/supervisor.hpp"

namespace netheal {

using AliasSet = std::set<std::string>;

// Keeps ASCII alphanumerics and '-', trims leading and trailing '-', caps the
// result at 63 characters. May return an empty string.
std::string sanitize_hostname(const std::string& name);

// {hostname, hostname without separators, fallback}, each with the domain appended.
AliasSet desired_aliases(const std::string& hostname, const AliasConfig& config);

class HostsFile {
public:
    explicit HostsFile(std::string path);

    bool contains(const std::string& hostname) const;
    // Appends "<address> <hostname>" unless the name is already mapped.
    // Returns whether the file changed.
    bool ensure_entry(const std::string& address, const std::string& hostname);

private:
    std::string path_;
};

struct ReconcileReport {
    std::vector<std::string> enabled;
    std::vector<std::string> disabled;
    std::vector<std::string> failed;
    bool hosts_updated = false;

    size_t transitions() const { return enabled.size() + disabled.size(); }
};

class AliasReconciler {
public:
    AliasReconciler(std::shared_ptr<ServiceSupervisor> supervisor, AliasConfig config,
                    Logger logger = get_logger("AliasReconciler"));

    // Throws when the configured image flag file is missing.
    ReconcileReport reconcile(const std::string& hostname);

    // Aliases whose unit is both enabled and running.
    AliasSet active_aliases();

    std::string unit_for(const std::string& alias) const;

private:
    struct Inventory {
        AliasSet active;
        AliasSet present;  // enabled or running
    };

    Inventory inventory();
    std::string alias_from_unit(const std::string& unit) const;

    std::shared_ptr<ServiceSupervisor> supervisor_;
    AliasConfig config_;
    Logger logger_;
};

}  // namespace netheal

#endif  // NETHEAL_ALIASES_HPP
