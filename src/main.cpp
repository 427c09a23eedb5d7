#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "engine/dispatcher.hpp"
#include "engine/envelope.hpp"
#include "engine/operation_registry.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace textshield;

namespace {

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--list] [REQUEST_FILE]\n"
        "  Reads a JSON request {{\"operation\": ..., ...parameters}} from REQUEST_FILE\n"
        "  (or stdin) and prints the result envelope as JSON.\n", argv0);
}

void print_operations() {
    for (const auto& d : kOperations) {
        std::string params;
        if (d.content == ContentKind::TEXT) {
            params = d.content_alias.empty() ? "content" : std::format("{}|content", d.content_alias);
        }
        for (const auto& p : d.params) {
            if (p.name.empty()) continue;
            if (!params.empty()) params += ", ";
            params += p.required ? std::string(p.name) : std::format("[{}]", p.name);
        }
        std::cout << std::format("{:<24} {}\n", d.name, params);
    }
}

bool read_request(const std::string& path, std::string& out) {
    if (path.empty() || path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/textshield.toml";
    std::string request_file;
    bool list_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--list") {
            list_only = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (arg.starts_with("--")) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        } else {
            request_file = arg;
        }
    }

    if (list_only) {
        print_operations();
        return EXIT_SUCCESS;
    }

    try {
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return EXIT_FAILURE;
        }
        utils::log::set_level(config_result.config.logging.level);
        utils::log::info(std::format("Loaded configuration from {} ({} named policies)",
            config_file, config_result.config.policies.size()));

        std::string request;
        if (!read_request(request_file, request)) {
            utils::log::error(std::format("Cannot read request file {}", request_file));
            return EXIT_FAILURE;
        }

        const Dispatcher dispatcher(std::move(config_result.config));
        const Envelope envelope = dispatcher.execute_json(request);
        std::cout << to_json(envelope) << '\n';
        return envelope.success ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
