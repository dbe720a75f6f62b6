#pragma once

#include <string>

namespace ippusb {
namespace runtime {

enum class ListenInterface { LOOPBACK, ALL };

struct NetworkConfig {
    ListenInterface interface = ListenInterface::LOOPBACK;  // Where device HTTP listeners bind
    int http_min_port = 60000;                              // First port tried for a device
    int http_max_port = 65535;                              // Last port tried for a device

    // Bind address for the listen interface ("127.0.0.1" or "0.0.0.0")
    std::string bind_address() const;
};

struct PnpConfig {
    int shutdown_grace_ms = 5000;  // Shared deadline for shutting down all devices (100-60000ms)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    NetworkConfig network;
    PnpConfig pnp;
    LoggingConfig logging;
};

// Loads configuration from a YAML file. Keys that are absent keep their defaults.
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

const char *listen_interface_to_string(ListenInterface interface);

}  // namespace runtime
}  // namespace ippusb
