#include "netheal/aliases.hpp"
#include "netheal/api.hpp"
#include "netheal/config.hpp"
#include "netheal/logging.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [hostname]\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }
    if (!netheal::running_as_root()) {
        std::cerr << "this command requires superuser privileges\n";
        return 1;
    }

    const auto logger = netheal::get_logger("netheal-aliases");
    try {
        auto settings = std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::load());
        auto runtime = netheal::build_runtime(settings);

        const std::string requested = argc == 2 ? std::string(argv[1]) : netheal::system_hostname();
        const std::string hostname = netheal::sanitize_hostname(requested);
        if (hostname.empty()) {
            logger.error("invalid_hostname", {{"hostname", requested}});
            return 1;
        }

        logger.info("reconciling_aliases", {{"hostname", hostname}});
        const auto report = netheal::build_alias_reconciler(runtime)->reconcile(hostname);
        logger.info("aliases_reconciled", {{"enabled", std::to_string(report.enabled.size())},
                                           {"disabled", std::to_string(report.disabled.size())},
                                           {"failed", std::to_string(report.failed.size())}});
        return report.failed.empty() ? 0 : 1;
    } catch (const std::exception& exc) {
        logger.error("fatal", {{"error", exc.what()}});
        return 1;
    }
}
