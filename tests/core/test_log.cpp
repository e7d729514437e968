// network_rag logging tests

#include <catch2/catch_test_macros.hpp>
#include <network_rag/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace network_rag;

TEST_CASE("Log level names", "[core][log]") {
    SECTION("parse") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
        REQUIRE_FALSE(parse_log_level("INFO").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names round trip through parse") {
        for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                           spdlog::level::warn, spdlog::level::err, spdlog::level::critical,
                           spdlog::level::off}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Structured log formatting", "[core][log]") {
    REQUIRE(format_structured("loaded", {}) == "loaded");
    REQUIRE(format_structured("loaded", {{"version", "0.0.1"}, {"exports", "1"}}) ==
            "loaded {exports=\"1\", version=\"0.0.1\"}");
}

TEST_CASE("Named loggers", "[core][log]") {
    LogConfig quiet;
    quiet.console_enabled = false;
    quiet.level = spdlog::level::info;
    configure_logging(quiet);

    SECTION("same name returns same logger") {
        auto a = get_logger("network_rag.test");
        auto b = get_logger("network_rag.test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "network_rag.test");
        REQUIRE(has_logger("network_rag.test"));
        REQUIRE(spdlog::get("network_rag.test") == a);
    }

    SECTION("well-known loggers") {
        REQUIRE(library_logger()->name() == "network_rag");
        REQUIRE(cli_logger()->name() == "network_rag.cli");
    }

    SECTION("level management") {
        auto logger = get_logger("network_rag.levels");
        set_logger_level("network_rag.levels", spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);

        set_global_log_level(spdlog::level::debug);
        REQUIRE(get_global_log_level() == spdlog::level::debug);
        REQUIRE(logger->level() == spdlog::level::debug);
        REQUIRE(get_logger("network_rag.after")->level() == spdlog::level::debug);

        set_global_log_level(spdlog::level::info);
    }

    SECTION("log scope and structured logging do not throw") {
        REQUIRE_NOTHROW([] {
            NETWORK_RAG_LOG_SCOPE("scoped");
            log_structured(spdlog::level::info, "network_rag.test", "event", {{"key", "value"}});
            NETWORK_RAG_LOG_DEBUG("debug {}", 1);
        }());
    }
}

TEST_CASE("Reconfiguring existing loggers", "[core][log]") {
    auto dir = std::filesystem::temp_directory_path() / "network_rag_reconfigure_test";
    std::filesystem::remove_all(dir);

    LogConfig quiet;
    quiet.console_enabled = false;
    configure_logging(quiet);

    auto before = get_logger("network_rag.reconfigured");
    REQUIRE(before->sinks().empty());

    LogConfig to_file = quiet;
    to_file.file_enabled = true;
    to_file.log_directory = dir.string();
    to_file.level = spdlog::level::warn;
    configure_logging(to_file);

    auto after = get_logger("network_rag.reconfigured");
    REQUIRE(after != before);
    REQUIRE(after->sinks().size() == 1);
    REQUIRE(after->level() == spdlog::level::warn);
    REQUIRE(spdlog::get("network_rag.reconfigured") == after);

    // The old handle stays valid with its old sinks
    REQUIRE(before->sinks().empty());
    REQUIRE_NOTHROW(before->warn("dropped"));

    after->warn("after reconfigure");
    flush_all_loggers();

    std::ifstream in(dir / "network_rag.reconfigured.log");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("after reconfigure") != std::string::npos);
    REQUIRE(content.find("dropped") == std::string::npos);

    shutdown_logging();
    configure_logging(quiet);
    std::filesystem::remove_all(dir);
}

TEST_CASE("File logging", "[core][log]") {
    auto dir = std::filesystem::temp_directory_path() / "network_rag_log_test";
    std::filesystem::remove_all(dir);

    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.log_directory = dir.string();
    config.level = spdlog::level::info;
    configure_logging(config);

    auto logger = get_logger("network_rag.file");
    logger->info("written to disk");
    flush_all_loggers();

    auto path = dir / "network_rag.file.log";
    REQUIRE(std::filesystem::exists(path));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("written to disk") != std::string::npos);

    shutdown_logging();
    REQUIRE_FALSE(has_logger("network_rag.file"));

    LogConfig quiet;
    quiet.console_enabled = false;
    configure_logging(quiet);
    std::filesystem::remove_all(dir);
}
