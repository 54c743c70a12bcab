#ifndef NETHEAL_PROBER_HPP
#define NETHEAL_PROBER_HPP

#include <sys/socket.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/network.hpp"
#include "netheal/process.hpp"

namespace netheal {

enum class ProbeMethod {
    kGateway,
    kPublicDns,
    kHttp,
};

std::string probe_method_name(ProbeMethod method);

// For an unreachable result, method names the last step attempted.
struct ReachabilityResult {
    bool reachable = false;
    ProbeMethod method = ProbeMethod::kGateway;
    double observed_at = 0.0;
};

class Prober {
public:
    virtual ~Prober() = default;
    virtual ReachabilityResult probe() = 0;
};

enum class StepOutcome {
    kReachable,
    kUnreachable,
    kNoRoute,  // ends the chain: nothing further down can succeed
};

class ProbeStep {
public:
    virtual ~ProbeStep() = default;
    virtual ProbeMethod method() const = 0;
    virtual StepOutcome run() = 0;
};

class Pinger {
public:
    virtual ~Pinger() = default;
    virtual bool ping(const std::string& host, int count, double timeout_s) = 0;
};

// Shells out to ping(8) with a hard process deadline.
class CommandPinger : public Pinger {
public:
    explicit CommandPinger(std::shared_ptr<CommandRunner> runner);

    bool ping(const std::string& host, int count, double timeout_s) override;

private:
    std::shared_ptr<CommandRunner> runner_;
};

class HttpChecker {
public:
    virtual ~HttpChecker() = default;
    virtual bool check(const std::string& host, int port, const std::string& path, double timeout_s) = 0;
};

struct ResolvedAddress {
    int family = 0;
    int socktype = 0;
    int protocol = 0;
    sockaddr_storage address{};
    socklen_t length = 0;
};

using Resolver = std::function<std::vector<ResolvedAddress>(const std::string& host, int port)>;

// Blocking getaddrinfo lookup for TCP endpoints.
std::vector<ResolvedAddress> resolve_host(const std::string& host, int port);

// Runs the resolver on a detached thread and gives up after timeout_s. A
// lookup that is abandoned keeps running in the background and its result is
// dropped. Returns nullopt on timeout or resolver failure.
std::optional<std::vector<ResolvedAddress>> resolve_within(const Resolver& resolver, const std::string& host,
                                                           int port, double timeout_s);

// Plain HTTP over a non-blocking TCP socket. Any HTTP/1.x status line counts
// as egress. Name resolution, connect and the exchange share one deadline.
class SocketHttpChecker : public HttpChecker {
public:
    explicit SocketHttpChecker(Resolver resolver = resolve_host);

    bool check(const std::string& host, int port, const std::string& path, double timeout_s) override;

private:
    Resolver resolver_;
};

class GatewayPingStep : public ProbeStep {
public:
    GatewayPingStep(std::shared_ptr<NetworkHost> network, std::shared_ptr<Pinger> pinger, int count,
                    double timeout_s);

    ProbeMethod method() const override { return ProbeMethod::kGateway; }
    StepOutcome run() override;

private:
    std::shared_ptr<NetworkHost> network_;
    std::shared_ptr<Pinger> pinger_;
    int count_ = 2;
    double timeout_s_ = 5.0;
};

class PublicPingStep : public ProbeStep {
public:
    PublicPingStep(std::shared_ptr<Pinger> pinger, std::string address, int count, double timeout_s);

    ProbeMethod method() const override { return ProbeMethod::kPublicDns; }
    StepOutcome run() override;

private:
    std::shared_ptr<Pinger> pinger_;
    std::string address_;
    int count_ = 2;
    double timeout_s_ = 5.0;
};

class HttpStep : public ProbeStep {
public:
    HttpStep(std::shared_ptr<HttpChecker> checker, std::string host, int port, std::string path,
             double timeout_s);

    ProbeMethod method() const override { return ProbeMethod::kHttp; }
    StepOutcome run() override;

private:
    std::shared_ptr<HttpChecker> checker_;
    std::string host_;
    int port_ = 80;
    std::string path_;
    double timeout_s_ = 5.0;
};

// Runs the steps in order and stops at the first success.
class ConnectivityProber : public Prober {
public:
    explicit ConnectivityProber(std::vector<std::shared_ptr<ProbeStep>> steps,
                                Logger logger = get_logger("ConnectivityProber"));

    ReachabilityResult probe() override;

private:
    std::vector<std::shared_ptr<ProbeStep>> steps_;
    Logger logger_;
};

std::shared_ptr<ConnectivityProber> build_prober(const ProberConfig& config, std::shared_ptr<NetworkHost> network,
                                                 std::shared_ptr<Pinger> pinger,
                                                 std::shared_ptr<HttpChecker> http);

}  // namespace netheal

#endif  // NETHEAL_PROBER_HPP
