#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "registry/open_registry.hpp"
#include "registry/reverse_lookup.hpp"
#include "security/env_key_manager.hpp"

#include <format>
#include <iostream>
#include <optional>
#include <string>

using namespace docanon;

namespace {

void print_usage(std::ostream& out) {
    out << "usage: docanon-deanon [--config FILE] <token>\n"
           "\n"
           "De-anonymize a token to find its original text. Requires the secret key.\n"
           "\n"
           "  token            the redaction token, e.g. '[EMAIL_ADDRESS_1a2b3c4d]'\n"
           "  --config FILE    TOML configuration file (registry location)\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> token;
    std::optional<std::string> config_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        } else if (!token && !(arg.starts_with("--") && arg.size() > 2)) {
            token = arg;
        } else {
            print_usage(std::cerr);
            std::cerr << std::format("docanon-deanon: error: unrecognized arguments: {}\n", arg);
            return 2;
        }
    }
    if (!token) {
        print_usage(std::cerr);
        std::cerr << "docanon-deanon: error: the following arguments are required: token\n";
        return 2;
    }

    AnonymizerConfig config;
    if (config_path) {
        auto loaded = ConfigLoader::load_from_file(*config_path);
        if (!loaded.success) {
            std::cerr << std::format("[!] Error: {}\n", loaded.error_message);
            return 1;
        }
        config = std::move(loaded.config);
    }
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    const EnvKeyManager keys(config.secret.env_var);
    if (!keys.get_active_key()) {
        std::cerr << std::format("[!] Error: {} environment variable must be set to run this tool.\n",
            keys.env_var_name());
        return 1;
    }

    std::unique_ptr<EntityRegistry> registry;
    try {
        registry = open_registry(config.registry, false);
    } catch (const std::exception& e) {
        std::cout << std::format("Database error: {}\n", e.what());
        return 0;
    }

    const ReverseLookup lookup(registry.get());
    std::cout << ReverseLookup::format_result(lookup.lookup(*token)) << "\n";
    return 0;
}
