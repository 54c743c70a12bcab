#ifndef NETHEAL_NETWORK_HPP
#define NETHEAL_NETWORK_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "netheal/process.hpp"

namespace netheal {

struct DefaultRoute {
    std::string interface;
    std::optional<std::string> gateway;
    int metric = 0;
};

// Picks the lowest-metric usable default route out of /proc/net/route text.
std::optional<DefaultRoute> parse_default_route(const std::string& route_table);

// OS network primitives used by the prober and the hotspot controller.
class NetworkHost {
public:
    virtual ~NetworkHost() = default;

    virtual std::optional<DefaultRoute> default_route() = 0;
    virtual std::vector<std::string> wireless_interfaces() = 0;
    virtual void assign_address(const std::string& interface, const std::string& cidr) = 0;
    virtual void remove_address(const std::string& interface, const std::string& cidr) = 0;
};

class LinuxNetworkHost : public NetworkHost {
public:
    LinuxNetworkHost(std::shared_ptr<CommandRunner> runner, std::string route_table = "/proc/net/route",
                     std::string sys_class_net = "/sys/class/net", double command_timeout_s = 10.0);

    std::optional<DefaultRoute> default_route() override;
    std::vector<std::string> wireless_interfaces() override;
    void assign_address(const std::string& interface, const std::string& cidr) override;
    void remove_address(const std::string& interface, const std::string& cidr) override;

private:
    void ip(const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
    std::string route_table_;
    std::string sys_class_net_;
    double command_timeout_s_ = 10.0;
};

}  // namespace netheal

#endif  // NETHEAL_NETWORK_HPP
