#include "netheal/api.hpp"
#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/watchdog.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace {

netheal::ConnectivityWatchdog* g_watchdog = nullptr;

void handle_signal(int) {
    if (g_watchdog) {
        g_watchdog->stop();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 1) {
        print_usage(argv[0]);
        return 1;
    }
    if (!netheal::running_as_root()) {
        std::cerr << "this command requires superuser privileges\n";
        return 1;
    }

    try {
        auto settings = std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::load());
        auto runtime = netheal::build_runtime(settings);
        auto watchdog = netheal::build_watchdog(runtime);
        g_watchdog = watchdog.get();
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        watchdog->run();
        g_watchdog = nullptr;
    } catch (const std::exception& exc) {
        netheal::get_logger("netheal-watchdog").error("fatal", {{"error", exc.what()}});
        return 1;
    }

    return 0;
}
