#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <vector>

#include "logging/logger.hpp"

namespace ippusb {
namespace runtime {

namespace {

std::optional<ListenInterface> parse_listen_interface(const std::string &value) {
    if (value == "loopback") {
        return ListenInterface::LOOPBACK;
    }
    if (value == "all") {
        return ListenInterface::ALL;
    }
    return std::nullopt;
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }

    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown key: '" << (section.empty() ? key : section + "." + key)
                                               << "' (will be ignored)");
        }
    }
}

}  // namespace

std::string NetworkConfig::bind_address() const {
    return interface == ListenInterface::ALL ? "0.0.0.0" : "127.0.0.1";
}

const char *listen_interface_to_string(ListenInterface interface) {
    switch (interface) {
        case ListenInterface::LOOPBACK:
            return "loopback";
        case ListenInterface::ALL:
            return "all";
        default:
            return "unknown";
    }
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate Network settings
    if (config.network.http_min_port < 1 || config.network.http_min_port > 65535) {
        error = "network.http_min_port must be between 1 and 65535";
        return false;
    }
    if (config.network.http_max_port < 1 || config.network.http_max_port > 65535) {
        error = "network.http_max_port must be between 1 and 65535";
        return false;
    }
    if (config.network.http_min_port > config.network.http_max_port) {
        error = "network.http_min_port (" + std::to_string(config.network.http_min_port) +
                ") must not exceed network.http_max_port (" + std::to_string(config.network.http_max_port) + ")";
        return false;
    }

    // Validate PnP settings
    if (config.pnp.shutdown_grace_ms < 100 || config.pnp.shutdown_grace_ms > 60000) {
        error = "pnp.shutdown_grace_ms must be between 100 and 60000";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // An empty file is a valid config made of defaults
        if (!yaml.IsNull()) {
            if (!yaml.IsMap()) {
                error = "Config root must be a mapping";
                return false;
            }
            warn_unknown_keys(yaml, "", {"network", "pnp", "logging"});
        }

        // Load network config
        if (yaml["network"]) {
            const auto &network = yaml["network"];
            warn_unknown_keys(network, "network", {"interface", "http_min_port", "http_max_port"});

            if (network["interface"]) {
                auto interface_str = network["interface"].as<std::string>();
                auto interface = parse_listen_interface(interface_str);
                if (!interface) {
                    error = "Invalid network.interface '" + interface_str + "': must be loopback or all";
                    return false;
                }
                config.network.interface = *interface;
            }
            if (network["http_min_port"]) {
                config.network.http_min_port = network["http_min_port"].as<int>();
            }
            if (network["http_max_port"]) {
                config.network.http_max_port = network["http_max_port"].as<int>();
            }
        }

        // Load PnP config
        if (yaml["pnp"]) {
            warn_unknown_keys(yaml["pnp"], "pnp", {"shutdown_grace_ms"});

            if (yaml["pnp"]["shutdown_grace_ms"]) {
                config.pnp.shutdown_grace_ms = yaml["pnp"]["shutdown_grace_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            warn_unknown_keys(yaml["logging"], "logging", {"level"});

            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Network: " << listen_interface_to_string(config.network.interface) << ", ports "
                                      << config.network.http_min_port << "-" << config.network.http_max_port);
        LOG_INFO("[Config] Shutdown grace period: " << config.pnp.shutdown_grace_ms << "ms");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace ippusb
