#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "netheal/aliases.hpp"
#include "netheal/config.hpp"
#include "netheal/hotspot.hpp"
#include "netheal/logging.hpp"
#include "netheal/network.hpp"
#include "netheal/process.hpp"
#include "netheal/prober.hpp"
#include "netheal/supervisor.hpp"
#include "netheal/watchdog.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

template <typename T, typename U>
void expect_eq(const T& value, const U& expected, const std::string& message) {
    if (!(value == expected)) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("netheal-test-" + std::to_string(::getpid()) + "-" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::trunc);
    file << contents;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// Records every mutating call as "<verb> <unit>".
class FakeSupervisor : public netheal::ServiceSupervisor {
public:
    std::vector<std::string> actions;
    std::map<std::string, netheal::UnitState> states;
    std::set<std::string> enabled;
    std::set<std::string> failing_starts;

    netheal::UnitState unit_state(const std::string& unit) override {
        auto it = states.find(unit);
        return it == states.end() ? netheal::UnitState::kInactive : it->second;
    }

    bool is_enabled(const std::string& unit) override { return enabled.count(unit) != 0; }

    std::vector<std::string> list_units(const std::string& pattern) override {
        const auto star = pattern.find('*');
        const std::string prefix = pattern.substr(0, star);
        const std::string suffix = star == std::string::npos ? "" : pattern.substr(star + 1);
        std::set<std::string> known(enabled.begin(), enabled.end());
        for (const auto& [unit, state] : states) {
            known.insert(unit);
        }
        std::vector<std::string> output;
        for (const auto& unit : known) {
            if (unit.size() >= prefix.size() + suffix.size() && unit.compare(0, prefix.size(), prefix) == 0 &&
                unit.compare(unit.size() - suffix.size(), suffix.size(), suffix) == 0) {
                output.push_back(unit);
            }
        }
        return output;
    }

    void start(const std::vector<std::string>& units) override {
        for (const auto& unit : units) {
            actions.push_back("start " + unit);
            if (failing_starts.count(unit) != 0) {
                states[unit] = netheal::UnitState::kFailed;
                throw std::runtime_error("start failed: " + unit);
            }
            states[unit] = netheal::UnitState::kActive;
        }
    }

    void stop(const std::vector<std::string>& units) override {
        for (const auto& unit : units) {
            actions.push_back("stop " + unit);
            states[unit] = netheal::UnitState::kInactive;
        }
    }

    void restart(const std::string& unit) override {
        actions.push_back("restart " + unit);
        states[unit] = netheal::UnitState::kActive;
    }

    void mask(const std::vector<std::string>& units) override {
        for (const auto& unit : units) {
            actions.push_back("mask " + unit);
        }
    }

    void unmask(const std::vector<std::string>& units) override {
        for (const auto& unit : units) {
            actions.push_back("unmask " + unit);
        }
    }

    void enable_now(const std::string& unit) override {
        actions.push_back("enable " + unit);
        enabled.insert(unit);
        states[unit] = netheal::UnitState::kActive;
    }

    void disable_now(const std::string& unit) override {
        actions.push_back("disable " + unit);
        enabled.erase(unit);
        states[unit] = netheal::UnitState::kInactive;
    }

    void reboot() override { actions.push_back("reboot"); }

    size_t count(const std::string& action) const {
        size_t total = 0;
        for (const auto& entry : actions) {
            if (entry == action) {
                total += 1;
            }
        }
        return total;
    }

    size_t count_prefix(const std::string& prefix) const {
        size_t total = 0;
        for (const auto& entry : actions) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                total += 1;
            }
        }
        return total;
    }
};

// Unreachable until the reachable_from-th call (1-based); 0 means never.
class ScriptedProber : public netheal::Prober {
public:
    explicit ScriptedProber(int reachable_from) : reachable_from_(reachable_from) {}

    netheal::ReachabilityResult probe() override {
        calls += 1;
        netheal::ReachabilityResult result;
        result.reachable = reachable_from_ > 0 && calls >= reachable_from_;
        return result;
    }

    int calls = 0;

private:
    int reachable_from_ = 0;
};

class SequenceProber : public netheal::Prober {
public:
    explicit SequenceProber(std::vector<bool> script) : script_(std::move(script)) {}

    netheal::ReachabilityResult probe() override {
        netheal::ReachabilityResult result;
        result.reachable = calls < script_.size() ? script_[calls] : script_.back();
        calls += 1;
        return result;
    }

    size_t calls = 0;

private:
    std::vector<bool> script_;
};

class CountingStep : public netheal::ProbeStep {
public:
    CountingStep(netheal::ProbeMethod method, netheal::StepOutcome outcome) : method_(method), outcome_(outcome) {}

    netheal::ProbeMethod method() const override { return method_; }

    netheal::StepOutcome run() override {
        calls += 1;
        if (throws) {
            throw std::runtime_error("step exploded");
        }
        return outcome_;
    }

    int calls = 0;
    bool throws = false;

private:
    netheal::ProbeMethod method_;
    netheal::StepOutcome outcome_;
};

class CountingPinger : public netheal::Pinger {
public:
    explicit CountingPinger(bool answer) : answer_(answer) {}

    bool ping(const std::string& host, int, double) override {
        hosts.push_back(host);
        return answer_;
    }

    std::vector<std::string> hosts;

private:
    bool answer_ = false;
};

class FakeNetwork : public netheal::NetworkHost {
public:
    std::optional<netheal::DefaultRoute> route;
    std::vector<std::vector<std::string>> enumerations = {std::vector<std::string>{}};
    int enumeration_calls = 0;
    std::vector<std::string> assigned;
    std::vector<std::string> removed;

    std::optional<netheal::DefaultRoute> default_route() override { return route; }

    std::vector<std::string> wireless_interfaces() override {
        const size_t index = std::min(static_cast<size_t>(enumeration_calls), enumerations.size() - 1);
        enumeration_calls += 1;
        return enumerations[index];
    }

    void assign_address(const std::string& interface, const std::string& cidr) override {
        assigned.push_back(interface + " " + cidr);
    }

    void remove_address(const std::string& interface, const std::string& cidr) override {
        removed.push_back(interface + " " + cidr);
    }
};

class FakePortal : public netheal::CaptivePortal {
public:
    int run(const std::string& interface) override {
        runs += 1;
        interfaces.push_back(interface);
        if (on_run) {
            on_run();
        }
        if (throw_on_first && runs == 1) {
            throw std::runtime_error("captive app crashed");
        }
        return 0;
    }

    int runs = 0;
    bool throw_on_first = false;
    std::vector<std::string> interfaces;
    std::function<void()> on_run;
};

class FakeInstaller : public netheal::ApConfigInstaller {
public:
    void install(const std::string& interface) override { interfaces.push_back(interface); }

    std::vector<std::string> interfaces;
};

class FakeRunner : public netheal::CommandRunner {
public:
    using Handler = std::function<netheal::CommandResult(const std::vector<std::string>&, std::function<bool()>)>;

    explicit FakeRunner(Handler handler) : handler_(std::move(handler)) {}

    netheal::CommandResult run(const std::vector<std::string>& argv, double timeout_s,
                               std::function<bool()> stop_when) override {
        calls.push_back(argv);
        timeouts.push_back(timeout_s);
        return handler_(argv, std::move(stop_when));
    }

    std::vector<std::vector<std::string>> calls;
    std::vector<double> timeouts;

private:
    Handler handler_;
};

netheal::CommandResult exited(int code, std::string output = "") {
    netheal::CommandResult result;
    result.exit_code = code;
    result.output = std::move(output);
    return result;
}

netheal::HotspotConfig quick_hotspot_config() {
    netheal::HotspotConfig config;
    config.interface_attempts = 3;
    config.recheck_attempts = 1;
    config.ownership_flag = "";
    return config;
}

struct HotspotRig {
    std::shared_ptr<ScriptedProber> prober;
    std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>();
    std::shared_ptr<FakeSupervisor> supervisor = std::make_shared<FakeSupervisor>();
    std::shared_ptr<FakePortal> portal = std::make_shared<FakePortal>();
    std::shared_ptr<FakeInstaller> installer = std::make_shared<FakeInstaller>();
    int sleeps = 0;

    explicit HotspotRig(int reachable_from) : prober(std::make_shared<ScriptedProber>(reachable_from)) {}

    netheal::HotspotController controller(netheal::HotspotConfig config = quick_hotspot_config(),
                                          std::optional<std::string> preferred = std::nullopt) {
        return netheal::HotspotController(prober, network, supervisor, portal, installer, std::move(config),
                                          std::move(preferred), netheal::get_logger("test"),
                                          [this](double) { sleeps += 1; });
    }
};

void test_prober_short_circuits_on_gateway() {
    auto gateway = std::make_shared<CountingStep>(netheal::ProbeMethod::kGateway, netheal::StepOutcome::kReachable);
    auto public_ping =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kPublicDns, netheal::StepOutcome::kReachable);
    auto http = std::make_shared<CountingStep>(netheal::ProbeMethod::kHttp, netheal::StepOutcome::kReachable);
    netheal::ConnectivityProber prober({gateway, public_ping, http});

    const auto result = prober.probe();
    expect_true(result.reachable, "gateway success is reachable");
    expect_true(result.method == netheal::ProbeMethod::kGateway, "gateway method reported");
    expect_eq(gateway->calls, 1, "gateway step called once");
    expect_eq(public_ping->calls, 0, "public ping skipped after gateway success");
    expect_eq(http->calls, 0, "http skipped after gateway success");
    expect_true(result.observed_at > 0.0, "observation timestamp set");
}

void test_prober_falls_back_to_http() {
    auto gateway =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kGateway, netheal::StepOutcome::kUnreachable);
    auto public_ping =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kPublicDns, netheal::StepOutcome::kUnreachable);
    auto http = std::make_shared<CountingStep>(netheal::ProbeMethod::kHttp, netheal::StepOutcome::kReachable);
    netheal::ConnectivityProber prober({gateway, public_ping, http});

    const auto result = prober.probe();
    expect_true(result.reachable, "http fallback is reachable");
    expect_true(result.method == netheal::ProbeMethod::kHttp, "http method reported");
    expect_eq(public_ping->calls, 1, "public ping attempted before http");
}

void test_prober_stops_without_route() {
    auto gateway = std::make_shared<CountingStep>(netheal::ProbeMethod::kGateway, netheal::StepOutcome::kNoRoute);
    auto public_ping =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kPublicDns, netheal::StepOutcome::kReachable);
    netheal::ConnectivityProber prober({gateway, public_ping});

    const auto result = prober.probe();
    expect_true(!result.reachable, "no route is unreachable");
    expect_eq(public_ping->calls, 0, "chain ends without a route");
}

void test_prober_treats_exceptions_as_failure() {
    auto gateway =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kGateway, netheal::StepOutcome::kReachable);
    gateway->throws = true;
    auto public_ping =
        std::make_shared<CountingStep>(netheal::ProbeMethod::kPublicDns, netheal::StepOutcome::kUnreachable);
    auto http = std::make_shared<CountingStep>(netheal::ProbeMethod::kHttp, netheal::StepOutcome::kUnreachable);
    netheal::ConnectivityProber prober({gateway, public_ping, http});

    const auto result = prober.probe();
    expect_true(!result.reachable, "all failing steps are unreachable");
    expect_true(result.method == netheal::ProbeMethod::kHttp, "last attempted method reported");
    expect_eq(http->calls, 1, "throwing step does not end the chain");
}

void test_gateway_step_pings_route_gateway() {
    auto network = std::make_shared<FakeNetwork>();
    auto pinger = std::make_shared<CountingPinger>(true);
    netheal::GatewayPingStep step(network, pinger, 2, 1.0);

    expect_true(step.run() == netheal::StepOutcome::kNoRoute, "missing route reported");
    expect_true(pinger->hosts.empty(), "nothing pinged without a route");

    network->route = netheal::DefaultRoute{"wg0", std::nullopt, 0};
    expect_true(step.run() == netheal::StepOutcome::kUnreachable, "gatewayless route falls through");

    network->route = netheal::DefaultRoute{"eth0", std::string("10.0.0.1"), 100};
    expect_true(step.run() == netheal::StepOutcome::kReachable, "gateway ping succeeds");
    expect_eq(pinger->hosts.size(), static_cast<size_t>(1), "one ping issued");
    expect_eq(pinger->hosts.front(), std::string("10.0.0.1"), "gateway address pinged");
}

void test_build_prober_skips_public_steps_without_route() {
    netheal::ProberConfig config;
    auto network = std::make_shared<FakeNetwork>();
    auto pinger = std::make_shared<CountingPinger>(true);
    class NeverHttp : public netheal::HttpChecker {
    public:
        bool check(const std::string&, int, const std::string&, double) override {
            calls += 1;
            return true;
        }
        int calls = 0;
    };
    auto http = std::make_shared<NeverHttp>();
    auto prober = netheal::build_prober(config, network, pinger, http);

    expect_true(!prober->probe().reachable, "no gateway configured is unreachable");
    expect_true(pinger->hosts.empty(), "no ping without route");
    expect_eq(http->calls, 0, "no http without route");

    network->route = netheal::DefaultRoute{"ppp0", std::nullopt, 0};
    const auto result = prober->probe();
    expect_true(result.reachable, "public ping reachable");
    expect_eq(pinger->hosts.front(), config.public_ip, "public address pinged");
}

void test_pinger_stays_within_step_timeout() {
    auto runner = std::make_shared<FakeRunner>(
        [](const std::vector<std::string>&, std::function<bool()>) { return exited(0); });
    netheal::CommandPinger pinger(runner);

    expect_true(pinger.ping("192.168.1.1", 2, 2.5), "ping success");
    const std::vector<std::string> expected = {"ping", "-n", "-q", "-c", "2", "-W", "1", "-w", "2", "192.168.1.1"};
    expect_true(runner->calls.front() == expected, "ping command line");
    expect_true(runner->timeouts.front() <= 2.5, "process deadline within step timeout");

    pinger.ping("192.168.1.1", 1, 0.4);
    expect_true(runner->timeouts.back() <= 0.4, "sub-second step timeout honoured");
}

void test_http_check_bounded_by_deadline() {
    netheal::SocketHttpChecker stalled([](const std::string&, int) {
        std::this_thread::sleep_for(std::chrono::seconds(2));
        return std::vector<netheal::ResolvedAddress>{};
    });
    const auto started = std::chrono::steady_clock::now();
    const bool ok = stalled.check("akamai.com", 80, "/", 0.3);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    expect_true(!ok, "stalled resolver fails the check");
    expect_true(elapsed < 1.0, "stalled resolver does not outlast the step timeout");

    netheal::SocketHttpChecker failing([](const std::string& host, int) -> std::vector<netheal::ResolvedAddress> {
        throw std::runtime_error("unable to resolve " + host);
    });
    expect_true(!failing.check("akamai.com", 80, "/", 1.0), "resolver error fails the check");
}

void test_http_check_against_local_server() {
    const int server = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    expect_true(server >= 0, "listening socket created");
    if (server < 0) {
        return;
    }
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    socklen_t length = sizeof(address);
    const bool listening = ::bind(server, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0 &&
                           ::listen(server, 1) == 0 &&
                           ::getsockname(server, reinterpret_cast<sockaddr*>(&address), &length) == 0;
    expect_true(listening, "listening socket bound");
    if (!listening) {
        ::close(server);
        return;
    }

    std::thread responder([server]() {
        const int client = ::accept(server, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        char buffer[512];
        if (::recv(client, buffer, sizeof(buffer), 0) > 0) {
            const std::string reply = "HTTP/1.1 204 No Content\r\nConnection: close\r\n\r\n";
            ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
        }
        ::close(client);
    });

    netheal::ResolvedAddress loopback;
    loopback.family = AF_INET;
    loopback.socktype = SOCK_STREAM;
    std::memcpy(&loopback.address, &address, sizeof(address));
    loopback.length = sizeof(address);
    netheal::SocketHttpChecker checker(
        [loopback](const std::string&, int) { return std::vector<netheal::ResolvedAddress>{loopback}; });

    expect_true(checker.check("feeder.test", ntohs(address.sin_port), "/", 2.0), "local HTTP server answers");
    responder.join();
    ::close(server);
}

void test_parse_default_route() {
    const std::string table =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "wlan0\t00000000\t0102A8C0\t0003\t0\t0\t600\t00000000\t0\t0\t0\n"
        "eth0\t00000000\t0101A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n"
        "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n";
    const auto route = netheal::parse_default_route(table);
    expect_true(route.has_value(), "default route found");
    if (route.has_value()) {
        expect_eq(route->interface, std::string("eth0"), "lowest metric route wins");
        expect_true(route->gateway.has_value(), "gateway decoded");
        expect_eq(route->gateway.value_or(""), std::string("192.168.1.1"), "gateway address");
    }

    const std::string no_default =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "eth0\t0001A8C0\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n";
    expect_true(!netheal::parse_default_route(no_default).has_value(), "no default route");

    const std::string link_only =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "wg0\t00000000\t00000000\t0001\t0\t0\t0\t00000000\t0\t0\t0\n";
    const auto link = netheal::parse_default_route(link_only);
    expect_true(link.has_value() && !link->gateway.has_value(), "device route without gateway");
}

void test_hotspot_noop_when_connected() {
    HotspotRig rig(1);
    auto controller = rig.controller();
    const auto outcome = controller.ensure_connectivity();

    expect_true(outcome == netheal::HotspotOutcome::kConnected, "connected outcome");
    expect_true(controller.state() == netheal::HotspotState::kConnected, "connected state");
    expect_true(rig.supervisor->actions.empty(), "no AP services touched");
    expect_eq(rig.portal->runs, 0, "captive app never run");
    expect_eq(rig.network->enumeration_calls, 0, "interfaces never enumerated");
    expect_true(rig.installer->interfaces.empty(), "no AP config installed");
}

void test_hotspot_converges() {
    const int reachable_from = 4;
    HotspotRig rig(reachable_from);
    rig.network->enumerations = {{"wlan0"}};
    auto controller = rig.controller();
    const auto outcome = controller.ensure_connectivity();

    expect_true(outcome == netheal::HotspotOutcome::kConnected, "converges to connected");
    expect_true(controller.portal_runs() <= reachable_from, "portal loop bounded by prober calls");
    expect_eq(controller.portal_runs(), 3, "one portal run per failed re-check");
    expect_eq(rig.prober->calls, reachable_from, "prober stops once reachable");
    expect_eq(rig.supervisor->count("unmask hostapd.service"), static_cast<size_t>(1), "hostapd unmasked");
    expect_eq(rig.supervisor->count("start hostapd.service"), static_cast<size_t>(1), "hostapd started once");
    expect_eq(rig.supervisor->count("stop hostapd.service"), static_cast<size_t>(1), "hostapd stopped");
    expect_eq(rig.supervisor->count("mask isc-dhcp-server.service"), static_cast<size_t>(1), "dhcpd masked");
    expect_eq(rig.supervisor->actions.back(), std::string("mask isc-dhcp-server.service"), "masking is last");
    expect_true(!controller.session().has_value(), "session destroyed after teardown");
    expect_eq(rig.network->assigned.size(), static_cast<size_t>(1), "AP address assigned");
    expect_eq(rig.network->removed.size(), static_cast<size_t>(1), "AP address removed");
}

void test_hotspot_gives_up_without_wireless() {
    HotspotRig rig(0);
    auto controller = rig.controller();
    const auto outcome = controller.ensure_connectivity();

    expect_true(outcome == netheal::HotspotOutcome::kGaveUp, "gave up");
    expect_eq(netheal::exit_code(outcome), 1, "gave up exits 1");
    expect_true(controller.state() == netheal::HotspotState::kGaveUp, "gave up state");
    expect_true(rig.supervisor->actions.empty(), "no AP services started");
    expect_eq(rig.network->enumeration_calls, 3, "enumeration retried");
    expect_eq(rig.sleeps, 2, "backoff between attempts");
    expect_eq(rig.portal->runs, 0, "captive app never run");
}

void test_hotspot_waits_for_late_interface() {
    HotspotRig rig(2);
    rig.network->enumerations = {{}, {}, {"wlx00c0ca"}};
    auto controller = rig.controller();
    const auto outcome = controller.ensure_connectivity();

    expect_true(outcome == netheal::HotspotOutcome::kConnected, "late interface still used");
    expect_eq(rig.installer->interfaces.size(), static_cast<size_t>(1), "config installed once");
    expect_eq(rig.installer->interfaces.front(), std::string("wlx00c0ca"), "late interface configured");
    expect_eq(rig.portal->interfaces.front(), std::string("wlx00c0ca"), "portal given interface");
}

void test_hotspot_prefers_requested_interface() {
    HotspotRig rig(2);
    rig.network->enumerations = {{"wlan0", "wlan1"}};
    auto controller = rig.controller(quick_hotspot_config(), std::string("wlan1"));
    controller.ensure_connectivity();
    expect_eq(rig.installer->interfaces.front(), std::string("wlan1"), "requested interface used");

    HotspotRig late(2);
    late.network->enumerations = {{"wlan0"}, {"wlan0", "wlan1"}};
    auto waiting = late.controller(quick_hotspot_config(), std::string("wlan1"));
    waiting.ensure_connectivity();
    expect_eq(late.installer->interfaces.front(), std::string("wlan1"), "requested interface awaited");

    HotspotRig missing(2);
    missing.network->enumerations = {{"wlan0"}};
    auto fallback = missing.controller(quick_hotspot_config(), std::string("wlan1"));
    const auto outcome = fallback.ensure_connectivity();
    expect_true(outcome == netheal::HotspotOutcome::kConnected, "missing requested interface is not fatal");
    expect_eq(missing.network->enumeration_calls, 3, "requested interface retried");
    expect_eq(missing.installer->interfaces.size(), static_cast<size_t>(1), "fallback interface configured");
    expect_eq(missing.installer->interfaces.front(), std::string("wlan0"), "first radio used as fallback");
    expect_eq(missing.portal->interfaces.front(), std::string("wlan0"), "portal runs on fallback radio");
}

void test_hotspot_soft_failures_are_retried() {
    HotspotRig rig(3);
    rig.network->enumerations = {{"wlan0"}};
    rig.supervisor->failing_starts.insert("hostapd.service");
    rig.portal->throw_on_first = true;
    auto controller = rig.controller();
    const auto outcome = controller.ensure_connectivity();

    expect_true(outcome == netheal::HotspotOutcome::kConnected, "soft failures do not abort");
    expect_eq(rig.portal->runs, 2, "crashed portal re-run");
    expect_true(rig.supervisor->count("start hostapd.service") >= 2, "failed AP service restarted");
    expect_eq(rig.supervisor->count("mask hostapd.service"), static_cast<size_t>(1), "cleanup still masks");
}

void test_hotspot_ownership_flag() {
    const auto dir = scratch_dir("ownership");
    auto config = quick_hotspot_config();
    config.ownership_flag = (dir / "hotspot.owner").string();
    HotspotRig rig(2);
    rig.network->enumerations = {{"wlan0"}};
    bool held_during_portal = false;
    netheal::ApOwnership observer(config.ownership_flag);
    rig.portal->on_run = [&]() { held_during_portal = observer.held(); };
    auto controller = rig.controller(config);
    controller.ensure_connectivity();

    expect_true(held_during_portal, "flag held while AP active");
    expect_true(!observer.held(), "flag released after teardown");
    expect_true(!std::filesystem::exists(config.ownership_flag), "flag file removed");

    write_file(config.ownership_flag, "99999999\n");
    expect_true(!observer.held(), "dead owner is stale");
    observer.release();
    observer.release();
    expect_true(!std::filesystem::exists(config.ownership_flag), "release tolerates absence");
    std::filesystem::remove_all(dir);
}

void test_template_installer_substitutes_interface() {
    const auto dir = scratch_dir("templates");
    write_file(dir / "hostapd.conf", "interface=wlan0\nssid=feeder\n");
    write_file(dir / "dhcp", "INTERFACESv4=\"wlan0\"\n");
    netheal::TemplateApConfigInstaller installer(
        {{(dir / "hostapd.conf").string(), (dir / "live" / "hostapd.conf").string()},
         {(dir / "dhcp").string(), (dir / "live" / "dhcp").string()}},
        "wlan0");

    installer.install("wlx00c0ca");
    expect_eq(read_file(dir / "live" / "hostapd.conf"), std::string("interface=wlx00c0ca\nssid=feeder\n"),
              "hostapd interface substituted");
    expect_eq(read_file(dir / "live" / "dhcp"), std::string("INTERFACESv4=\"wlx00c0ca\"\n"),
              "dhcp interface substituted");

    installer.install("wlan0");
    expect_eq(read_file(dir / "live" / "hostapd.conf"), std::string("interface=wlan0\nssid=feeder\n"),
              "default interface copied verbatim");

    netheal::TemplateApConfigInstaller missing({{(dir / "absent").string(), (dir / "out").string()}}, "wlan0");
    bool threw = false;
    try {
        missing.install("wlan0");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "missing template reported");
    std::filesystem::remove_all(dir);
}

void test_captive_portal_sentinel() {
    const auto dir = scratch_dir("sentinel");
    const auto sentinel = dir / "configured";
    write_file(sentinel, "stale");

    bool stale_seen = false;
    bool stop_seen = false;
    auto runner = std::make_shared<FakeRunner>(
        [&](const std::vector<std::string>&, std::function<bool()> stop_when) {
            stale_seen = std::filesystem::exists(sentinel);
            write_file(sentinel, "done");
            stop_seen = stop_when && stop_when();
            netheal::CommandResult result;
            result.exit_code = 143;
            result.interrupted = true;
            return result;
        });
    netheal::CommandCaptivePortal portal(runner, "/usr/lib/netheal/captive-portal --quiet", sentinel.string());

    expect_eq(portal.run("wlan0"), 0, "sentinel completion counts as success");
    expect_true(!stale_seen, "stale sentinel removed before the run");
    expect_true(stop_seen, "sentinel stops the app");
    expect_true(!std::filesystem::exists(sentinel), "sentinel consumed");
    expect_eq(runner->calls.front().size(), static_cast<size_t>(3), "command plus interface");
    expect_eq(runner->calls.front().back(), std::string("wlan0"), "interface appended");
    std::filesystem::remove_all(dir);
}

void test_remediation_thresholds_are_exact() {
    auto prober = std::make_shared<ScriptedProber>(0);
    auto supervisor = std::make_shared<FakeSupervisor>();
    supervisor->enabled.insert("NetworkManager.service");
    netheal::WatchdogConfig config;
    netheal::ConnectivityWatchdog watchdog(prober, supervisor, netheal::RemediationPolicy::from_config(config),
                                           config, netheal::ApOwnership(""));

    std::vector<unsigned> restart_ticks;
    std::vector<unsigned> reboot_ticks;
    for (unsigned tick = 1; tick <= 12; ++tick) {
        const auto outcome = watchdog.tick();
        if (outcome.action == netheal::RemediationAction::kRestartNetworkService) {
            restart_ticks.push_back(tick);
        } else if (outcome.action == netheal::RemediationAction::kReboot) {
            reboot_ticks.push_back(tick);
        }
    }

    expect_eq(restart_ticks.size(), static_cast<size_t>(1), "exactly one restart");
    expect_eq(reboot_ticks.size(), static_cast<size_t>(1), "exactly one reboot");
    expect_true(!restart_ticks.empty() && restart_ticks.front() == 3, "restart at threshold");
    expect_true(!reboot_ticks.empty() && reboot_ticks.front() == 6, "reboot at threshold");
    expect_eq(supervisor->count("restart NetworkManager.service"), static_cast<size_t>(1), "NetworkManager restarted");
    expect_eq(supervisor->count("reboot"), static_cast<size_t>(1), "one reboot issued");
    expect_eq(watchdog.ladder().consecutive_failures, 12u, "failures keep counting");
    expect_true(watchdog.ladder().last_action == netheal::RemediationAction::kReboot, "last action recorded");
}

void test_watchdog_resets_on_success() {
    auto prober = std::make_shared<SequenceProber>(std::vector<bool>{false, false, true, false, false, false});
    auto supervisor = std::make_shared<FakeSupervisor>();
    netheal::WatchdogConfig config;
    netheal::ConnectivityWatchdog watchdog(prober, supervisor, netheal::RemediationPolicy::from_config(config),
                                           config, netheal::ApOwnership(""));

    watchdog.tick();
    watchdog.tick();
    const auto recovered = watchdog.tick();
    expect_true(recovered.reachable, "third probe reachable");
    expect_eq(watchdog.ladder().consecutive_failures, 0u, "ladder reset");
    watchdog.tick();
    watchdog.tick();
    expect_true(supervisor->actions.empty(), "no restart before a fresh threshold");
    const auto third_failure = watchdog.tick();
    expect_true(third_failure.action == netheal::RemediationAction::kRestartNetworkService,
                "restart after three new failures");
    expect_eq(supervisor->count("restart networking.service"), static_cast<size_t>(1),
              "falls back to the last network service");
}

void test_watchdog_skips_while_hotspot_active() {
    auto prober = std::make_shared<ScriptedProber>(0);
    auto supervisor = std::make_shared<FakeSupervisor>();
    netheal::WatchdogConfig config;
    supervisor->states[config.hotspot_unit] = netheal::UnitState::kActivating;
    netheal::ConnectivityWatchdog watchdog(prober, supervisor, netheal::RemediationPolicy::from_config(config),
                                           config, netheal::ApOwnership(""));

    for (int i = 0; i < 10; ++i) {
        expect_true(watchdog.tick().skipped, "tick skipped while hotspot activating");
    }
    expect_eq(prober->calls, 0, "prober not run while hotspot active");
    expect_true(supervisor->actions.empty(), "no remediation while hotspot active");

    supervisor->states[config.hotspot_unit] = netheal::UnitState::kInactive;
    const auto dir = scratch_dir("watchdog-flag");
    netheal::ApOwnership flag((dir / "owner").string());
    flag.acquire();
    netheal::ConnectivityWatchdog flagged(prober, supervisor, netheal::RemediationPolicy::from_config(config),
                                          config, netheal::ApOwnership((dir / "owner").string()));
    expect_true(flagged.tick().skipped, "ownership flag suppresses polling");
    flag.release();
    expect_true(!flagged.tick().skipped, "polling resumes after release");
    expect_eq(prober->calls, 1, "one probe after release");
    std::filesystem::remove_all(dir);
}

void test_remediation_policy_validation() {
    using netheal::RemediationAction;
    bool threw = false;
    try {
        netheal::RemediationPolicy({{6, RemediationAction::kRestartNetworkService}, {3, RemediationAction::kReboot}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "decreasing thresholds rejected");

    threw = false;
    try {
        netheal::RemediationPolicy({{3, RemediationAction::kReboot}, {6, RemediationAction::kRestartNetworkService}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "de-escalation rejected");

    const netheal::RemediationPolicy policy({{2, RemediationAction::kRestartNetworkService},
                                             {5, RemediationAction::kReboot}});
    expect_true(policy.action_for(1) == RemediationAction::kNone, "below threshold");
    expect_true(policy.action_for(2) == RemediationAction::kRestartNetworkService, "restart threshold");
    expect_true(policy.action_for(3) == RemediationAction::kNone, "past restart threshold");
    expect_true(policy.action_for(5) == RemediationAction::kReboot, "reboot threshold");
    expect_true(policy.action_for(9) == RemediationAction::kNone, "past reboot threshold");
}

void test_desired_aliases() {
    netheal::AliasConfig config;
    const auto aliases = netheal::desired_aliases("feeder-1", config);
    expect_eq(aliases.size(), static_cast<size_t>(3), "three aliases");
    expect_true(aliases.count("feeder-1.local") == 1, "primary alias");
    expect_true(aliases.count("feeder1.local") == 1, "compact alias");
    expect_true(aliases.count("adsb-feeder.local") == 1, "fallback alias");
    expect_eq(netheal::desired_aliases("feeder", config).size(), static_cast<size_t>(2), "duplicates collapse");
}

void test_sanitize_hostname() {
    expect_eq(netheal::sanitize_hostname("My Feeder_#1!"), std::string("MyFeeder1"), "invalid characters dropped");
    expect_eq(netheal::sanitize_hostname("--edge-case--"), std::string("edge-case"), "dashes trimmed");
    expect_eq(netheal::sanitize_hostname(std::string(100, 'a')).size(), static_cast<size_t>(63), "label capped");
    expect_eq(netheal::sanitize_hostname("\xc3\xbcn"), std::string("n"), "non-ascii dropped");
    expect_true(netheal::sanitize_hostname("!!!").empty(), "nothing left");
}

void test_alias_reconcile_is_idempotent() {
    const auto dir = scratch_dir("aliases-idempotent");
    write_file(dir / "hosts", "127.0.0.1 localhost\n");
    netheal::AliasConfig config;
    config.hosts_path = (dir / "hosts").string();
    auto supervisor = std::make_shared<FakeSupervisor>();
    netheal::AliasReconciler reconciler(supervisor, config);

    const auto first = reconciler.reconcile("feeder-1");
    expect_eq(first.enabled.size(), static_cast<size_t>(3), "all aliases enabled on first run");
    expect_true(first.hosts_updated, "hosts entry added");
    const auto actions_after_first = supervisor->actions.size();

    const auto second = reconciler.reconcile("feeder-1");
    expect_eq(second.transitions(), static_cast<size_t>(0), "second run has no transitions");
    expect_true(!second.hosts_updated, "hosts entry not duplicated");
    expect_true(second.failed.empty(), "second run has no errors");
    expect_eq(supervisor->actions.size(), actions_after_first, "no service actions on second run");
    expect_eq(read_file(dir / "hosts"), std::string("127.0.0.1 localhost\n127.0.2.1 feeder-1\n"), "hosts content");
    std::filesystem::remove_all(dir);
}

void test_alias_reconcile_hostname_change() {
    const auto dir = scratch_dir("aliases-change");
    netheal::AliasConfig config;
    config.hosts_path = (dir / "hosts").string();
    auto supervisor = std::make_shared<FakeSupervisor>();
    netheal::AliasReconciler reconciler(supervisor, config);

    reconciler.reconcile("feeder-1");
    const auto fallback_unit = reconciler.unit_for("adsb-feeder.local");
    const auto fallback_actions = supervisor->count_prefix("enable " + fallback_unit);
    const auto report = reconciler.reconcile("feeder-2");

    const std::set<std::string> disabled(report.disabled.begin(), report.disabled.end());
    const std::set<std::string> enabled(report.enabled.begin(), report.enabled.end());
    expect_true(disabled == std::set<std::string>{"feeder-1.local", "feeder1.local"}, "old aliases disabled");
    expect_true(enabled == std::set<std::string>{"feeder-2.local", "feeder2.local"}, "new aliases enabled");
    expect_eq(supervisor->count("disable " + reconciler.unit_for("feeder-1.local")), static_cast<size_t>(1),
              "feeder-1 unit disabled");
    expect_eq(supervisor->count("enable " + reconciler.unit_for("feeder-2.local")), static_cast<size_t>(1),
              "feeder-2 unit enabled");
    expect_eq(supervisor->count_prefix("enable " + fallback_unit), fallback_actions, "fallback not re-enabled");
    expect_eq(supervisor->count("disable " + fallback_unit), static_cast<size_t>(0), "fallback untouched");
    expect_true(reconciler.active_aliases().count("adsb-feeder.local") == 1, "fallback still active");
    std::filesystem::remove_all(dir);
}

void test_alias_reconcile_stops_stray_units() {
    const auto dir = scratch_dir("aliases-stray");
    netheal::AliasConfig config;
    config.hosts_path = (dir / "hosts").string();
    auto supervisor = std::make_shared<FakeSupervisor>();
    const std::string stray = config.unit_prefix + "old.local.service";
    supervisor->states[stray] = netheal::UnitState::kActive;
    const std::string half = config.unit_prefix + "feeder.local.service";
    supervisor->enabled.insert(half);
    netheal::AliasReconciler reconciler(supervisor, config);

    const auto report = reconciler.reconcile("feeder");
    expect_eq(supervisor->count("disable " + stray), static_cast<size_t>(1), "running but disabled alias stopped");
    expect_eq(supervisor->count("enable " + half), static_cast<size_t>(1), "enabled but stopped alias started");
    expect_eq(report.enabled.size(), static_cast<size_t>(2), "primary and fallback enabled");
    std::filesystem::remove_all(dir);
}

void test_alias_reconcile_requires_image_flag() {
    const auto dir = scratch_dir("aliases-image");
    netheal::AliasConfig config;
    config.hosts_path = (dir / "hosts").string();
    config.image_flag_file = (dir / "feeder.image").string();
    auto supervisor = std::make_shared<FakeSupervisor>();
    netheal::AliasReconciler reconciler(supervisor, config);

    bool threw = false;
    try {
        reconciler.reconcile("feeder");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "missing image flag refuses to reconcile");
    expect_true(supervisor->actions.empty(), "no units touched without image flag");
    expect_true(!std::filesystem::exists(dir / "hosts"), "hosts file untouched without image flag");

    write_file(dir / "feeder.image", "");
    const auto report = reconciler.reconcile("feeder");
    expect_eq(report.enabled.size(), static_cast<size_t>(2), "image flag present allows reconcile");
    std::filesystem::remove_all(dir);
}

void test_log_rotation_failure_reported_once() {
    const auto dir = scratch_dir("logging");
    const auto log_path = dir / "netheal.log";
    std::filesystem::create_directories(dir / "netheal.log.1" / "occupied");

    netheal::LoggingConfig config;
    config.level = "INFO";
    config.log_file = log_path.string();
    config.max_bytes = 1;
    config.backup_count = 1;

    std::ostringstream captured;
    auto* previous = std::cerr.rdbuf(captured.rdbuf());
    netheal::configure_logging(config);
    const auto logger = netheal::get_logger("rotation");
    logger.info("first");
    logger.info("second");
    logger.info("third");
    std::cerr.rdbuf(previous);

    netheal::LoggingConfig quiet;
    quiet.level = "ERROR";
    netheal::configure_logging(quiet);

    const std::string text = captured.str();
    size_t reports = 0;
    for (size_t pos = text.find("log_rotation_failed"); pos != std::string::npos;
         pos = text.find("log_rotation_failed", pos + 1)) {
        reports += 1;
    }
    expect_eq(reports, static_cast<size_t>(1), "rotation failure reported once");
    expect_true(read_file(log_path).find("third") != std::string::npos, "logging continues after failed rotation");
    std::filesystem::remove_all(dir);
}

void test_hosts_file_entry() {
    const auto dir = scratch_dir("hosts");
    const auto path = dir / "hosts";
    write_file(path, "127.0.0.1 localhost feeder-10\n# 127.0.2.1 feeder-1\n::1 localhost");
    netheal::HostsFile hosts(path.string());

    expect_true(!hosts.contains("feeder-1"), "substring and comments do not match");
    expect_true(hosts.ensure_entry("127.0.2.1", "feeder-1"), "entry appended");
    expect_true(hosts.contains("feeder-1"), "entry present");
    expect_true(!hosts.ensure_entry("127.0.2.1", "feeder-1"), "append is idempotent");
    expect_eq(read_file(path),
              std::string("127.0.0.1 localhost feeder-10\n# 127.0.2.1 feeder-1\n::1 localhost\n127.0.2.1 feeder-1\n"),
              "missing newline repaired before append");
    std::filesystem::remove_all(dir);
}

void test_config_parsing() {
    const auto dir = scratch_dir("config");
    const auto path = dir / "netheal.toml";
    write_file(path,
               "# netheal\n"
               "[logging]\n"
               "level = \"DEBUG\"\n"
               "json = true\n"
               "log_file = none\n"
               "[prober]\n"
               "public_ip = \"1.1.1.1\"\n"
               "step_timeout_s = 2.5\n"
               "http_enabled = false\n"
               "[hotspot]\n"
               "ap_services = [\"hostapd.service\", \"dnsmasq.service\"]\n"
               "templates = [\"/src/hostapd.conf:/etc/hostapd/hostapd.conf\"]\n"
               "recheck_attempts = 5  # seconds\n"
               "[watchdog]\n"
               "restart_threshold = 2\n"
               "reboot_threshold = 4\n"
               "network_services = [\"systemd-networkd.service\"]\n"
               "[aliases]\n"
               "fallback_alias = \"feeder\"\n"
               "image_flag_file = \"/opt/adsb/os.adsb.feeder.image\"\n");

    const auto settings = netheal::NetHealSettings::from_toml(path.string());
    expect_eq(settings.logging.level, std::string("DEBUG"), "logging level");
    expect_true(settings.logging.json, "json logging");
    expect_true(!settings.logging.log_file.has_value(), "log file none");
    expect_eq(settings.prober.public_ip, std::string("1.1.1.1"), "public ip");
    expect_eq(settings.prober.step_timeout_s, 2.5, "step timeout");
    expect_true(!settings.prober.http_enabled, "http disabled");
    expect_eq(settings.hotspot.ap_services.size(), static_cast<size_t>(2), "service list");
    expect_eq(settings.hotspot.ap_services.back(), std::string("dnsmasq.service"), "service list entry");
    expect_eq(settings.hotspot.templates.size(), static_cast<size_t>(1), "template list");
    expect_eq(settings.hotspot.templates.front().destination, std::string("/etc/hostapd/hostapd.conf"),
              "template destination");
    expect_eq(settings.hotspot.recheck_attempts, 5, "trailing comment ignored");
    expect_eq(settings.watchdog.restart_threshold, 2, "restart threshold");
    expect_eq(settings.watchdog.network_services.front(), std::string("systemd-networkd.service"), "network service");
    expect_eq(settings.aliases.fallback_alias, std::string("feeder"), "fallback alias");
    expect_true(settings.aliases.image_flag_file.has_value(), "image flag file");

    write_file(path, "[logging]\njson = maybe\n");
    bool threw = false;
    try {
        netheal::NetHealSettings::from_toml(path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "invalid boolean rejected");
    std::filesystem::remove_all(dir);
}

void test_systemd_supervisor_commands() {
    auto runner = std::make_shared<FakeRunner>([](const std::vector<std::string>& argv, std::function<bool()>) {
        const std::string verb = argv.size() > 1 ? argv[1] : "";
        if (verb == "is-active") {
            return exited(3, "activating\n");
        }
        if (verb == "is-enabled") {
            return exited(argv.back() == "NetworkManager.service" ? 0 : 1);
        }
        if (verb == "list-units") {
            return exited(0,
                          "netheal-avahi-alias@feeder.local.service loaded active running Avahi alias\n"
                          "\xe2\x97\x8f netheal-avahi-alias@old.local.service loaded failed failed Avahi alias\n");
        }
        if (verb == "start" && argv.back() == "hostapd.service") {
            return exited(1, "Unit hostapd.service is masked.\n");
        }
        return exited(0);
    });
    netheal::SystemdSupervisor supervisor(runner);

    expect_true(supervisor.unit_state("netheal-hotspot.service") == netheal::UnitState::kActivating,
                "is-active output parsed despite exit code");
    expect_true(supervisor.is_enabled("NetworkManager.service"), "enabled unit");
    expect_true(!supervisor.is_enabled("networking.service"), "disabled unit");

    const auto units = supervisor.list_units("netheal-avahi-alias@*.service");
    expect_eq(units.size(), static_cast<size_t>(2), "two units listed");
    expect_eq(units.back(), std::string("netheal-avahi-alias@old.local.service"), "failure marker skipped");

    supervisor.mask({"hostapd.service", "isc-dhcp-server.service"});
    const std::vector<std::string> expected = {"systemctl", "mask", "hostapd.service", "isc-dhcp-server.service"};
    expect_true(runner->calls.back() == expected, "mask command line");

    bool threw = false;
    try {
        supervisor.start({"hostapd.service"});
    } catch (const netheal::CommandError& exc) {
        threw = exc.result().exit_code == 1;
    }
    expect_true(threw, "failed start raises CommandError");
}

void test_system_command_runner() {
    netheal::SystemCommandRunner runner(0.05);

    const auto done = runner.run({"/bin/sh", "-c", "echo hello; exit 3"}, 5.0);
    expect_eq(done.exit_code, 3, "exit code captured");
    expect_eq(done.output, std::string("hello\n"), "output captured");
    expect_true(!done.ok(), "non-zero exit is not ok");

    const auto slow = runner.run({"/bin/sh", "-c", "sleep 5"}, 0.3);
    expect_true(slow.timed_out, "timeout enforced");

    const auto stopped = runner.run({"/bin/sh", "-c", "sleep 5"}, 5.0, []() { return true; });
    expect_true(stopped.interrupted, "stop predicate terminates the child");

    const auto missing = runner.run({"/nonexistent/netheal-binary"}, 5.0);
    expect_eq(missing.exit_code, 127, "exec failure reported as 127");
}

}  // namespace

int main() {
    netheal::LoggingConfig quiet;
    quiet.level = "ERROR";
    netheal::configure_logging(quiet);

    try {
        test_prober_short_circuits_on_gateway();
        test_prober_falls_back_to_http();
        test_prober_stops_without_route();
        test_prober_treats_exceptions_as_failure();
        test_gateway_step_pings_route_gateway();
        test_build_prober_skips_public_steps_without_route();
        test_pinger_stays_within_step_timeout();
        test_http_check_bounded_by_deadline();
        test_http_check_against_local_server();
        test_parse_default_route();
        test_hotspot_noop_when_connected();
        test_hotspot_converges();
        test_hotspot_gives_up_without_wireless();
        test_hotspot_waits_for_late_interface();
        test_hotspot_prefers_requested_interface();
        test_hotspot_soft_failures_are_retried();
        test_hotspot_ownership_flag();
        test_template_installer_substitutes_interface();
        test_captive_portal_sentinel();
        test_remediation_thresholds_are_exact();
        test_watchdog_resets_on_success();
        test_watchdog_skips_while_hotspot_active();
        test_remediation_policy_validation();
        test_desired_aliases();
        test_sanitize_hostname();
        test_alias_reconcile_is_idempotent();
        test_alias_reconcile_hostname_change();
        test_alias_reconcile_stops_stray_units();
        test_alias_reconcile_requires_image_flag();
        test_hosts_file_entry();
        test_log_rotation_failure_reported_once();
        test_config_parsing();
        test_systemd_supervisor_commands();
        test_system_command_runner();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
