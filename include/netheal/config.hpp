#ifndef NETHEAL_CONFIG_HPP
#define NETHEAL_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace netheal {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = false;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct ProberConfig {
    int ping_count = 2;
    double step_timeout_s = 5.0;
    std::string public_ip = "8.8.8.8";
    bool http_enabled = true;
    std::string http_host = "akamai.com";
    int http_port = 80;
    std::string http_path = "/";
    std::string route_table = "/proc/net/route";
};

// One "source:destination" entry of the [hotspot] templates list.
struct ApTemplate {
    std::string source;
    std::string destination;
};

struct HotspotConfig {
    std::string default_interface = "wlan0";
    int interface_attempts = 10;
    double interface_retry_s = 1.0;
    int recheck_attempts = 15;
    double recheck_interval_s = 1.0;
    std::vector<std::string> ap_services = {"hostapd.service", "isc-dhcp-server.service"};
    std::vector<ApTemplate> templates = {
        {"/usr/share/netheal/accesspoint/hostapd.conf", "/etc/hostapd/hostapd.conf"},
        {"/usr/share/netheal/accesspoint/dhcpd.conf", "/etc/dhcp/dhcpd.conf"},
        {"/usr/share/netheal/accesspoint/isc-dhcp-server", "/etc/default/isc-dhcp-server"},
    };
    std::string ap_address = "192.168.199.1/24";
    std::string captive_command = "/usr/lib/netheal/captive-portal";
    double captive_timeout_s = 0.0;
    std::string sentinel_path = "/run/netheal/hotspot-configured";
    std::string ownership_flag = "/run/netheal/hotspot.owner";
    std::string sys_class_net = "/sys/class/net";
};

struct WatchdogConfig {
    double interval_s = 120.0;
    int restart_threshold = 3;
    int reboot_threshold = 6;
    std::string hotspot_unit = "netheal-hotspot.service";
    std::vector<std::string> network_services = {"NetworkManager.service", "networking.service"};
};

struct AliasConfig {
    std::string unit_prefix = "netheal-avahi-alias@";
    std::string domain = ".local";
    std::string fallback_alias = "adsb-feeder";
    std::string hosts_path = "/etc/hosts";
    std::string hosts_address = "127.0.2.1";
    std::optional<std::string> image_flag_file = std::nullopt;
};

struct SupervisorConfig {
    std::string systemctl = "systemctl";
    double command_timeout_s = 90.0;
    std::string reboot_dropin_dir = "/run/systemd/system/reboot.target.d";
};

struct NetHealSettings {
    LoggingConfig logging{};
    ProberConfig prober{};
    HotspotConfig hotspot{};
    WatchdogConfig watchdog{};
    AliasConfig aliases{};
    SupervisorConfig supervisor{};

    static NetHealSettings from_toml(const std::string& path);

    // $NETHEAL_CONFIG, else /etc/netheal/netheal.toml. A missing file yields defaults.
    static NetHealSettings load();
};

}  // namespace netheal

#endif  // NETHEAL_CONFIG_HPP
