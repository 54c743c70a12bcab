#include "netheal/api.hpp"
#include "netheal/config.hpp"
#include "netheal/logging.hpp"
#include "netheal/prober.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << "\n";
}

}  // namespace

// Exit status 0 when the network is reachable, 1 otherwise.
int main(int argc, char** argv) {
    if (argc > 1) {
        print_usage(argv[0]);
        return 1;
    }

    const auto logger = netheal::get_logger("netheal-probe");
    try {
        auto settings = std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::load());
        auto runtime = netheal::build_runtime(settings);
        const auto result = runtime.prober->probe();
        logger.info(result.reachable ? "reachable" : "unreachable",
                    {{"method", netheal::probe_method_name(result.method)}});
        return result.reachable ? 0 : 1;
    } catch (const std::exception& exc) {
        logger.error("fatal", {{"error", exc.what()}});
        return 1;
    }
}
