/**
 * @file check_url.cpp
 * @brief Run the URL Safety Gate against URLs from the command line
 */

#include <config/settings.hpp>
#include <gate/resolver.hpp>
#include <gate/url.hpp>
#include <gate/url_safety_gate.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace MineSpec;

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config settings.yaml] <url>...\n";
        std::cerr << "\nExamples:\n";
        std::cerr << "  " << argv[0] << " https://www.cat.com/en_US/products/new/equipment/off-highway-trucks.html\n";
        std::cerr << "  " << argv[0] << " http://169.254.169.254/latest/meta-data/\n";
        return 1;
    }

    try {
        Settings settings = config_path.empty() ? Settings::defaults() : Settings::load_file(config_path);
        Logger::set_level(Logger::parse_level(settings.log_level));

        // robots.txt needs an HTTP client; this tool checks address policy only.
        UrlSafetyGate gate(settings.gate, std::make_shared<SystemResolver>());

        int denied = 0;
        for (const auto& input : urls) {
            auto url = sanitize_url(input);
            GateVerdict verdict = url ? gate.is_safe(*url)
                                      : GateVerdict::deny(DenyReason::InvalidUrl, "empty input");
            if (verdict.allowed) {
                std::cout << "ALLOW " << *url << "\n";
            } else {
                ++denied;
                std::cout << "DENY  " << (url ? *url : input) << "  " << to_string(*verdict.reason)
                          << " (" << verdict.detail << ")\n";
            }
        }
        return denied == 0 ? 0 : 2;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
