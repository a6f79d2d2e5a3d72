#ifndef PINET_CONFIG_HPP
#define PINET_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdlib>
#include <charconv>
#include <string_view>

namespace PiNet
{
    namespace Config
    {
        // Shared dnsmasq configuration
        constexpr const char* DEFAULT_DHCP_CONFIG_PATH = "/etc/dnsmasq.conf";
        constexpr const char* DHCP_SERVICE_UNIT = "dnsmasq.service";
        constexpr const char* BIND_DYNAMIC_DIRECTIVE = "bind-dynamic";
        constexpr const char* EXCEPT_INTERFACE_KEY = "except-interface";
        constexpr const char* INTERFACE_KEY = "interface";
        constexpr const char* RESERVATION_KEY = "dhcp-host";
        constexpr const char* RESERVATION_SECTION_MARKER = "# DHCP Reservations";
        // Section header written by earlier releases, joined instead of duplicated
        constexpr const char* LEGACY_RESERVATION_SECTION_MARKER = "# WLED Reservations";

        // Adapter DHCP scopes
        constexpr const char* ADAPTER_SCOPE_PURPOSE = "USB Ethernet Adapter";
        constexpr const char* ADAPTER_PROFILE_SUFFIX = "-static";
        constexpr const char* BUILTIN_WIRED_INTERFACE = "eth0";
        constexpr int ADAPTER_DEFAULT_PREFIX = 24;
        constexpr int DHCP_RANGE_FIRST_HOST = 10;
        constexpr int DHCP_RANGE_LAST_HOST = 50;
        constexpr const char* DHCP_LEASE_TIME = "24h";
        constexpr const char* DHCP_DNS_SERVERS = "8.8.8.8,8.8.4.4";

        // Access point
        constexpr const char* WIRELESS_INTERFACE = "wlan0";
        constexpr const char* AP_CONNECTION_NAME = "pinet-ap";
        constexpr const char* AP_DEFAULT_SSID = "PiNet-AP";
        constexpr int AP_DEFAULT_CHANNEL = 6;
        constexpr const char* AP_DEFAULT_ADDRESS = "10.0.2.1";
        constexpr int AP_PREFIX_LENGTH = 24;
        constexpr std::size_t AP_MIN_PASSPHRASE_LENGTH = 8;
        constexpr int AP_MIN_CHANNEL = 1;
        constexpr int AP_MAX_CHANNEL = 11;

        // systemd
        constexpr const char* SYSTEMD_UNIT_DIR = "/etc/systemd/system";
        constexpr const char* AP_BOOT_UNIT = "pinet-wifi-ap.service";
        constexpr const char* LEGACY_AP_BOOT_UNIT = "wifi-ap-delayed-start.service";
        constexpr const char* NETWORK_MANAGER_UNIT = "NetworkManager.service";
        constexpr const char* WAIT_ONLINE_UNIT = "NetworkManager-wait-online.service";
        constexpr const char* AP_ACTIVATOR_PATH = "/usr/local/bin/pinet-ap-activate";

        // External control planes
        constexpr const char* NMCLI_PATH = "/usr/bin/nmcli";
        constexpr const char* SYSTEMCTL_PATH = "/usr/bin/systemctl";
        constexpr const char* RFKILL_PATH = "/usr/sbin/rfkill";

        // Timing
        constexpr std::chrono::seconds STATUS_CACHE_TTL{5};
        constexpr int ENABLE_READINESS_ATTEMPTS = 10;
        constexpr std::chrono::seconds ENABLE_READINESS_INTERVAL{1};
        constexpr std::chrono::seconds RESTART_SETTLE_DELAY{2};
        constexpr std::chrono::seconds BOOT_READINESS_TIMEOUT{60};
        constexpr std::chrono::seconds BOOT_POLL_INTERVAL{3};
        constexpr std::chrono::seconds BOOT_SETTLE_DELAY{5};
        constexpr std::chrono::seconds BOOT_RETRY_DELAY{5};
        constexpr int BOOT_ACTIVATION_ATTEMPTS = 3;
        // nmcli waits up to 90 s for an activation to complete
        constexpr std::chrono::seconds ACTIVATION_COMMAND_BUDGET{90};

        inline std::string env_or(const char* name, const char* fallback)
        {
            if (const char* value = getenv(name); value && *value)
            {
                return std::string(value);
            }
            return std::string(fallback);
        }

        inline int env_int_or(const char* name, const int fallback)
        {
            const char* value = getenv(name);
            if (!value || !*value)
            {
                return fallback;
            }
            const std::string_view text(value);
            int parsed{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec != std::errc{} || ptr != text.data() + text.size() || parsed < 0)
            {
                return fallback;
            }
            return parsed;
        }

        inline std::chrono::seconds env_seconds_or(const char* name, const std::chrono::seconds fallback)
        {
            return std::chrono::seconds(env_int_or(name, static_cast<int>(fallback.count())));
        }

        // Path of the dnsmasq configuration shared with other consumers
        inline std::string get_dhcp_config_path()
        {
            return env_or("PINET_DHCP_CONFIG", DEFAULT_DHCP_CONFIG_PATH);
        }

        inline std::string get_unit_dir()
        {
            return env_or("PINET_UNIT_DIR", SYSTEMD_UNIT_DIR);
        }

        inline std::string get_wireless_interface()
        {
            return env_or("PINET_AP_INTERFACE", WIRELESS_INTERFACE);
        }

        inline std::string get_ap_connection_name()
        {
            return env_or("PINET_AP_CONNECTION", AP_CONNECTION_NAME);
        }
    }
}

#endif //PINET_CONFIG_HPP
