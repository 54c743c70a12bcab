#include "netheal/api.hpp"
#include "netheal/config.hpp"
#include "netheal/hotspot.hpp"
#include "netheal/logging.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [wireless-interface]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::optional<std::string> interface;
    if (argc == 2) {
        interface = argv[1];
    }

    if (!netheal::running_as_root()) {
        std::cerr << "this command requires superuser privileges\n";
        return 1;
    }

    try {
        auto settings = std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::load());
        auto runtime = netheal::build_runtime(settings);
        auto controller = netheal::build_hotspot_controller(runtime, interface);
        const auto outcome = controller->ensure_connectivity();
        return netheal::exit_code(outcome);
    } catch (const std::exception& exc) {
        netheal::get_logger("netheal-hotspot").error("fatal", {{"error", exc.what()}});
        return 1;
    }
}
