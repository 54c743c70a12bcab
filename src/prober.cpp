#include "netheal/prober.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <stdexcept>
#include <thread>

#include "netheal/common.hpp"

namespace netheal {

namespace {

int remaining_ms(double deadline) {
    const double remaining = deadline - seconds_since_epoch();
    if (remaining <= 0.0) {
        return 0;
    }
    return static_cast<int>(remaining * 1000.0) + 1;
}

bool wait_for(int fd, short events, double deadline) {
    while (true) {
        const int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            return false;
        }
        pollfd entry{fd, events, 0};
        const int ready = ::poll(&entry, 1, timeout);
        if (ready > 0) {
            return (entry.revents & (events | POLLHUP | POLLERR)) != 0;
        }
        if (ready == 0 || errno != EINTR) {
            return false;
        }
    }
}

bool http_exchange(const ResolvedAddress& target, const std::string& request, double deadline) {
    const int fd = ::socket(target.family, target.socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, target.protocol);
    if (fd < 0) {
        return false;
    }

    bool ok = false;
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&target.address), target.length) == 0 ||
        errno == EINPROGRESS) {
        int error = 0;
        socklen_t len = sizeof(error);
        if (wait_for(fd, POLLOUT, deadline) && ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 &&
            error == 0) {
            const ssize_t sent = ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);
            if (sent == static_cast<ssize_t>(request.size()) && wait_for(fd, POLLIN, deadline)) {
                char buffer[64] = {0};
                const ssize_t received = ::recv(fd, buffer, sizeof(buffer) - 1, 0);
                ok = received >= 7 && std::strncmp(buffer, "HTTP/1.", 7) == 0;
            }
        }
    }
    ::close(fd);
    return ok;
}

}  // namespace

std::string probe_method_name(ProbeMethod method) {
    switch (method) {
        case ProbeMethod::kGateway:
            return "gateway";
        case ProbeMethod::kPublicDns:
            return "public_dns";
        case ProbeMethod::kHttp:
            return "http";
    }
    return "gateway";
}

CommandPinger::CommandPinger(std::shared_ptr<CommandRunner> runner) : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::runtime_error("CommandPinger requires a command runner");
    }
}

// ping's own -w deadline is whole seconds; the process deadline is the step timeout.
bool CommandPinger::ping(const std::string& host, int count, double timeout_s) {
    const int deadline = std::max(1, static_cast<int>(timeout_s));
    const std::vector<std::string> argv = {"ping", "-n", "-q", "-c", std::to_string(std::max(1, count)),
                                           "-W", "1", "-w", std::to_string(deadline), host};
    return runner_->run(argv, timeout_s).ok();
}

std::vector<ResolvedAddress> resolve_host(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        throw std::runtime_error("unable to resolve " + host + ": " + ::gai_strerror(rc));
    }
    std::vector<ResolvedAddress> addresses;
    for (addrinfo* info = results; info != nullptr; info = info->ai_next) {
        if (info->ai_addrlen > sizeof(sockaddr_storage)) {
            continue;
        }
        ResolvedAddress entry;
        entry.family = info->ai_family;
        entry.socktype = info->ai_socktype;
        entry.protocol = info->ai_protocol;
        std::memcpy(&entry.address, info->ai_addr, info->ai_addrlen);
        entry.length = info->ai_addrlen;
        addresses.push_back(entry);
    }
    ::freeaddrinfo(results);
    return addresses;
}

std::optional<std::vector<ResolvedAddress>> resolve_within(const Resolver& resolver, const std::string& host,
                                                           int port, double timeout_s) {
    if (!resolver || timeout_s <= 0.0) {
        return std::nullopt;
    }
    auto promise = std::make_shared<std::promise<std::vector<ResolvedAddress>>>();
    auto future = promise->get_future();
    std::thread([promise, resolver, host, port]() {
        try {
            promise->set_value(resolver(host, port));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::duration<double>(timeout_s)) != std::future_status::ready) {
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

SocketHttpChecker::SocketHttpChecker(Resolver resolver) : resolver_(std::move(resolver)) {
    if (!resolver_) {
        throw std::runtime_error("SocketHttpChecker requires a resolver");
    }
}

bool SocketHttpChecker::check(const std::string& host, int port, const std::string& path, double timeout_s) {
    const double deadline = seconds_since_epoch() + timeout_s;
    const auto addresses = resolve_within(resolver_, host, port, timeout_s);
    if (!addresses.has_value()) {
        return false;
    }

    const std::string request = "GET " + (path.empty() ? std::string("/") : path) + " HTTP/1.1\r\n" +
                                "Host: " + host + "\r\n" +
                                "User-Agent: netheal\r\n" +
                                "Connection: close\r\n\r\n";

    for (const auto& target : *addresses) {
        if (remaining_ms(deadline) == 0) {
            break;
        }
        if (http_exchange(target, request, deadline)) {
            return true;
        }
    }
    return false;
}

GatewayPingStep::GatewayPingStep(std::shared_ptr<NetworkHost> network, std::shared_ptr<Pinger> pinger, int count,
                                 double timeout_s)
    : network_(std::move(network)), pinger_(std::move(pinger)), count_(count), timeout_s_(timeout_s) {}

StepOutcome GatewayPingStep::run() {
    const auto route = network_->default_route();
    if (!route.has_value()) {
        return StepOutcome::kNoRoute;
    }
    if (!route->gateway.has_value()) {
        return StepOutcome::kUnreachable;
    }
    return pinger_->ping(*route->gateway, count_, timeout_s_) ? StepOutcome::kReachable
                                                               : StepOutcome::kUnreachable;
}

PublicPingStep::PublicPingStep(std::shared_ptr<Pinger> pinger, std::string address, int count, double timeout_s)
    : pinger_(std::move(pinger)), address_(std::move(address)), count_(count), timeout_s_(timeout_s) {}

StepOutcome PublicPingStep::run() {
    return pinger_->ping(address_, count_, timeout_s_) ? StepOutcome::kReachable : StepOutcome::kUnreachable;
}

HttpStep::HttpStep(std::shared_ptr<HttpChecker> checker, std::string host, int port, std::string path,
                   double timeout_s)
    : checker_(std::move(checker)),
      host_(std::move(host)),
      port_(port),
      path_(std::move(path)),
      timeout_s_(timeout_s) {}

StepOutcome HttpStep::run() {
    return checker_->check(host_, port_, path_, timeout_s_) ? StepOutcome::kReachable
                                                            : StepOutcome::kUnreachable;
}

ConnectivityProber::ConnectivityProber(std::vector<std::shared_ptr<ProbeStep>> steps, Logger logger)
    : steps_(std::move(steps)), logger_(std::move(logger)) {
    if (steps_.empty()) {
        throw std::runtime_error("At least one probe step is required");
    }
}

ReachabilityResult ConnectivityProber::probe() {
    ReachabilityResult result;
    for (const auto& step : steps_) {
        result.method = step->method();
        StepOutcome outcome = StepOutcome::kUnreachable;
        try {
            outcome = step->run();
        } catch (const std::exception& exc) {
            logger_.warn("probe_step_failed", {{"method", probe_method_name(step->method())}, {"error", exc.what()}});
        }
        if (outcome == StepOutcome::kReachable) {
            result.reachable = true;
            break;
        }
        if (outcome == StepOutcome::kNoRoute) {
            logger_.debug("no_default_route");
            break;
        }
    }
    result.observed_at = seconds_since_epoch();
    logger_.debug("probe", {{"reachable", result.reachable ? "true" : "false"},
                            {"method", probe_method_name(result.method)}});
    return result;
}

std::shared_ptr<ConnectivityProber> build_prober(const ProberConfig& config, std::shared_ptr<NetworkHost> network,
                                                 std::shared_ptr<Pinger> pinger,
                                                 std::shared_ptr<HttpChecker> http) {
    std::vector<std::shared_ptr<ProbeStep>> steps;
    steps.push_back(std::make_shared<GatewayPingStep>(network, pinger, config.ping_count, config.step_timeout_s));
    if (!config.public_ip.empty()) {
        steps.push_back(std::make_shared<PublicPingStep>(pinger, config.public_ip, config.ping_count,
                                                         config.step_timeout_s));
    }
    if (config.http_enabled && !config.http_host.empty()) {
        steps.push_back(std::make_shared<HttpStep>(http, config.http_host, config.http_port, config.http_path,
                                                   config.step_timeout_s));
    }
    return std::make_shared<ConnectivityProber>(std::move(steps));
}

}  // namespace netheal
