#include "netheal/network.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "netheal/common.hpp"

namespace netheal {

namespace {

constexpr unsigned kRouteUp = 0x0001;
constexpr unsigned kRouteGateway = 0x0002;

// The kernel prints the network-order address as a host-order hex word, so
// storing the parsed word back into s_addr restores the original bytes.
std::string hex_to_ipv4(const std::string& hex) {
    const auto value = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    in_addr addr{};
    addr.s_addr = value;
    char buffer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        throw std::runtime_error("invalid route address: " + hex);
    }
    return buffer;
}

}  // namespace

std::optional<DefaultRoute> parse_default_route(const std::string& route_table) {
    std::optional<DefaultRoute> best;
    std::istringstream stream(route_table);
    std::string line;
    bool header = true;
    while (std::getline(stream, line)) {
        if (header) {
            header = false;
            continue;
        }
        const auto fields = split_whitespace(line);
        if (fields.size() < 8) {
            continue;
        }
        if (fields[1] != "00000000" || fields[7] != "00000000") {
            continue;
        }
        const auto flags = static_cast<unsigned>(std::stoul(fields[3], nullptr, 16));
        if ((flags & kRouteUp) == 0) {
            continue;
        }
        DefaultRoute route;
        route.interface = fields[0];
        route.metric = std::stoi(fields[6]);
        if ((flags & kRouteGateway) != 0 && fields[2] != "00000000") {
            route.gateway = hex_to_ipv4(fields[2]);
        }
        if (!best.has_value() || route.metric < best->metric) {
            best = route;
        }
    }
    return best;
}

LinuxNetworkHost::LinuxNetworkHost(std::shared_ptr<CommandRunner> runner, std::string route_table,
                                   std::string sys_class_net, double command_timeout_s)
    : runner_(std::move(runner)),
      route_table_(std::move(route_table)),
      sys_class_net_(std::move(sys_class_net)),
      command_timeout_s_(command_timeout_s) {
    if (!runner_) {
        throw std::runtime_error("LinuxNetworkHost requires a command runner");
    }
}

std::optional<DefaultRoute> LinuxNetworkHost::default_route() {
    std::ifstream file(route_table_);
    if (!file) {
        throw std::runtime_error("unable to read routing table: " + route_table_);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_default_route(contents.str());
}

std::vector<std::string> LinuxNetworkHost::wireless_interfaces() {
    std::vector<std::string> interfaces;
    std::error_code ec;
    std::filesystem::directory_iterator it(sys_class_net_, ec);
    if (ec) {
        return interfaces;
    }
    for (const auto& entry : it) {
        const auto path = entry.path();
        if (std::filesystem::exists(path / "wireless", ec) || std::filesystem::exists(path / "phy80211", ec)) {
            interfaces.push_back(path.filename().string());
        }
    }
    std::sort(interfaces.begin(), interfaces.end());
    return interfaces;
}

void LinuxNetworkHost::ip(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"ip"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runner_->run(argv, command_timeout_s_);
    if (!result.ok()) {
        throw CommandError(argv, std::move(result));
    }
}

void LinuxNetworkHost::assign_address(const std::string& interface, const std::string& cidr) {
    ip({"link", "set", "dev", interface, "up"});
    ip({"addr", "replace", cidr, "dev", interface});
}

void LinuxNetworkHost::remove_address(const std::string& interface, const std::string& cidr) {
    ip({"addr", "del", cidr, "dev", interface});
}

}  // namespace netheal
