/// @file main.cpp
/// @brief network_rag command-line tool - reports package identity and checks requirements
///
/// Commands run in the order: load config, apply overrides, then the single
/// requested action. Exit status is 0 on success, 1 on any error or unmet
/// requirement.

#include <network_rag/network_rag.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

enum class Action {
    Version,
    About,
    Exports,
    BuildInfo,
    Check,
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [COMMAND]\n"
              << "\n"
              << "Commands:\n"
              << "  --version, -v          Show version (default)\n"
              << "  --about                Show package description\n"
              << "  --exports              List the public export table and validate it\n"
              << "  --build-info           Show build information\n"
              << "  --check CONSTRAINT     Exit 0 if the package version satisfies CONSTRAINT\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h             Show this help message\n"
              << "  --config PATH          Load JSON configuration from PATH\n"
              << "  --log-level LEVEL      trace, debug, info, warn, error, critical, off\n"
              << "\n"
              << "Environment:\n"
              << "  " << network_rag::ENV_LOG_LEVEL << "  Log level override\n"
              << "  " << network_rag::ENV_LOG_DIR << "    Enable file logging into this directory\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --check \">=0.0.1,<1.0.0\"\n"
              << "  " << program_name << " --config network_rag.json --exports\n";
}

int report(const network_rag::Error& error) {
    network_rag::cli_logger()->error("{}", network_rag::build_error_chain(error));
    network_rag::flush_all_loggers();
    return 1;
}

int run_exports() {
    for (const auto& entry : network_rag::exports()) {
        auto value = network_rag::export_value(entry.name);
        if (!value) {
            return report(value.error());
        }
        std::cout << entry.name << " = " << *value
                  << "  (" << network_rag::export_kind_name(entry.kind) << ": " << entry.summary << ")\n";
    }

    auto valid = network_rag::validate_exports();
    if (!valid) {
        return report(valid.error());
    }
    return 0;
}

int run_check(const std::string& constraint) {
    auto result = network_rag::check_version_requirement(constraint);
    if (!result) {
        return report(result.error());
    }
    network_rag::cli_logger()->info("{} satisfies {}", network_rag::version_banner(), constraint);
    std::cout << "ok\n";
    return 0;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Action action = Action::Version;
    std::string check_constraint;
    fs::path config_path;
    std::optional<std::string> log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Option " << option << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            action = Action::Version;
        } else if (arg == "--about") {
            action = Action::About;
        } else if (arg == "--exports") {
            action = Action::Exports;
        } else if (arg == "--build-info") {
            action = Action::BuildInfo;
        } else if (arg == "--check") {
            auto value = next_value("--check");
            if (!value) {
                print_usage(argv[0]);
                return 1;
            }
            action = Action::Check;
            check_constraint = *value;
        } else if (arg == "--config") {
            auto value = next_value("--config");
            if (!value) {
                print_usage(argv[0]);
                return 1;
            }
            config_path = *value;
        } else if (arg == "--log-level") {
            log_level = next_value("--log-level");
            if (!log_level) {
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Configuration: file, then environment, then command line
    network_rag::LibraryConfig config;
    if (!config_path.empty()) {
        auto loaded = network_rag::LibraryConfig::load(config_path);
        if (!loaded) {
            return report(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (auto env = network_rag::apply_env_overrides(config); !env) {
        return report(env.error());
    }

    if (log_level) {
        auto level = network_rag::parse_log_level(*log_level);
        if (!level) {
            return report(network_rag::ConfigError::invalid_value("--log-level", "unknown level '" + *log_level + "'"));
        }
        config.log.level = *level;
    }

    if (auto applied = network_rag::apply_config(config); !applied) {
        return report(applied.error());
    }

    if (!config_path.empty()) {
        network_rag::cli_logger()->debug("Loaded configuration from {}", config_path.string());
    }

    int status = 0;
    switch (action) {
        case Action::Version:
            std::cout << network_rag::version_banner() << "\n";
            break;
        case Action::About:
            std::cout << network_rag::format_package_info();
            break;
        case Action::Exports:
            status = run_exports();
            break;
        case Action::BuildInfo:
            std::cout << network_rag::build::format_build_info();
            break;
        case Action::Check:
            status = run_check(check_constraint);
            break;
    }

    network_rag::shutdown_logging();
    return status;
}
