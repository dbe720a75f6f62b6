// ippusb
// IPP-over-USB daemon: one HTTP endpoint per attached IPP-over-USB device

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"

namespace
{
    void print_usage()
    {
        std::cerr << "Usage: ippusb [OPTIONS] MODE\n\n";
        std::cerr << "Modes:\n";
        std::cerr << "  standalone       Serve devices until terminated\n";
        std::cerr << "  udev             Serve devices, exit when none are left\n";
        std::cerr << "  check            List IPP-over-USB devices and exit\n\n";
        std::cerr << "Options:\n";
        std::cerr << "  --config=PATH    Path to config file (default: ippusb.yaml)\n";
        std::cerr << "  --debug          Force debug logging\n";
        std::cerr << "  --help, -h       Show this help\n";
    }
}

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "ippusb.yaml"; // Default
    bool config_explicit = false;
    bool debug = false;
    std::string mode;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            config_explicit = true;
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
            config_explicit = true;
        }
        else if (arg == "--debug")
        {
            debug = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (arg == "standalone" || arg == "udev" || arg == "check")
        {
            if (!mode.empty())
            {
                std::cerr << "Only one mode may be given\n";
                return 1;
            }
            mode = arg;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (mode.empty())
    {
        print_usage();
        return 1;
    }

    if (debug)
    {
        ippusb::logging::Logger::set_level(ippusb::logging::Level::LVL_DEBUG);
    }

    // Load configuration
    ippusb::runtime::RuntimeConfig config;
    std::string error;

    if (std::filesystem::exists(config_path))
    {
        LOG_INFO("Loading config: " + config_path);
        if (!ippusb::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " + error);
            return 1;
        }
    }
    else if (config_explicit)
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }
    else
    {
        LOG_INFO("No " << config_path << " found, using defaults");
    }

    // --debug wins over the config file
    if (debug)
    {
        config.logging.level = "debug";
    }
    ippusb::logging::Logger::init(ippusb::logging::string_to_level(config.logging.level));

    ippusb::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    if (mode == "check")
    {
        std::vector<ippusb::usb::UsbDeviceDesc> descs;
        if (!runtime.check(descs, error))
        {
            LOG_ERROR("Device enumeration failed: " + error);
            return 1;
        }

        for (const auto &desc : descs)
        {
            std::cout << desc.addr.to_string() << ": " << ippusb::usb::format_usb_id(desc.vendor_id) << ":"
                      << ippusb::usb::format_usb_id(desc.product_id) << ", " << desc.interfaces.size()
                      << " IPP-over-USB interfaces\n";
        }
        if (descs.empty())
        {
            std::cout << "No IPP-over-USB devices found\n";
            return 1;
        }
        return 0;
    }

    LOG_INFO("ippusb starting in " << mode << " mode");

    ippusb::pnp::ExitReason reason = ippusb::pnp::ExitReason::TERMINATED;
    if (!runtime.run(mode == "udev", reason, error))
    {
        LOG_ERROR("Runtime failed: " + error);
        return 1;
    }

    LOG_INFO("Shutdown complete");
    return 0;
}
