// crowd_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <crowd_engine/core/log.hpp>

using namespace crowd_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
}

TEST_CASE("Named loggers", "[core][log]") {
    auto first = get_logger("crowd_test");
    auto second = get_logger("crowd_test");
    REQUIRE(first == second);
    REQUIRE(first->name() == "crowd_test");

    REQUIRE(template_logger()->name() == "crowd_template");
    REQUIRE(spatial_logger()->name() == "crowd_spatial");
}

TEST_CASE("Global log level applies to every logger", "[core][log]") {
    const auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(template_logger()->level() == spdlog::level::err);

    LogConfig config;
    config.level = spdlog::level::debug;
    configure_logging(config);
    REQUIRE(spatial_logger()->level() == spdlog::level::debug);

    set_global_log_level(previous);
}

TEST_CASE("Log scope", "[core][log]") {
    REQUIRE_NOTHROW([] {
        CROWD_LOG_SCOPE("scoped block");
    }());
}
