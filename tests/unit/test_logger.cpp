#include <catch2/catch_test_macros.hpp>
#include <relay/log/logger.hpp>
#include <relay/log/macros.hpp>
#include <relay/error.hpp>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace relay::log;

TEST_CASE("Logger singleton", "[logger]") {
    auto& logger1 = logger::instance();
    auto& logger2 = logger::instance();

    REQUIRE(&logger1 == &logger2);
}

TEST_CASE("Log level filtering", "[logger]") {
    auto& log = logger::instance();

    log.set_level(level::warning);
    REQUIRE(log.get_level() == level::warning);
    REQUIRE_FALSE(log.enabled(level::info));
    REQUIRE(log.enabled(level::error));

    RELAY_LOG_INFO("This should be filtered");
    RELAY_LOG_WARNING("This is a warning");

    log.set_level(level::info);
    REQUIRE(log.get_level() == level::info);
}

TEST_CASE("Filtered log lines do not evaluate their arguments", "[logger]") {
    auto& log = logger::instance();
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);
    log.set_output(sink);
    log.set_level(level::warning);

    int evaluated = 0;
    auto expensive = [&evaluated] { return ++evaluated; };

    RELAY_LOG_INFO("filtered {}", expensive());
    REQUIRE(evaluated == 0);

    RELAY_LOG_WARNING("kept {}", expensive());
    REQUIRE(evaluated == 1);

    // Usable as the body of an unbraced if/else
    if (evaluated == 1)
        RELAY_LOG_ERROR("branch {}", expensive());
    else
        RELAY_LOG_ERROR("other branch");
    REQUIRE(evaluated == 2);

    log.set_output(nullptr);
    log.set_level(level::info);
    std::fclose(sink);
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(std::string(level_to_string(level::debug)) == "DEBUG");
    REQUIRE(std::string(level_to_string(level::info)) == "INFO");
    REQUIRE(std::string(level_to_string(level::warning)) == "WARN");
    REQUIRE(std::string(level_to_string(level::error)) == "ERROR");
}

TEST_CASE("Log level parsing", "[logger]") {
    REQUIRE(level_from_string("debug") == level::debug);
    REQUIRE(level_from_string("info") == level::info);
    REQUIRE(level_from_string("warn") == level::warning);
    REQUIRE(level_from_string("warning") == level::warning);
    REQUIRE(level_from_string("error") == level::error);
    REQUIRE_FALSE(level_from_string("verbose").has_value());
    REQUIRE_FALSE(level_from_string("").has_value());
}

TEST_CASE("Log lines go to the configured output", "[logger]") {
    auto& log = logger::instance();
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    log.set_output(sink);
    RELAY_LOG_WARNING("pool for {} is full", "http://a:80");
    RELAY_LOG_INFO("plain info");
    log.set_output(nullptr);

    std::rewind(sink);
    std::string text;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), sink)) {
        text += buf;
    }
    std::fclose(sink);

    REQUIRE(text.find("WARN  test_logger.cpp:") != std::string::npos);
    REQUIRE(text.find("pool for http://a:80 is full\n") != std::string::npos);
    REQUIRE(text.find("plain info") != std::string::npos);
    // Not a terminal: no color codes
    REQUIRE(text.find("\033[") == std::string::npos);
}

TEST_CASE("Log level from the environment", "[logger]") {
    auto& log = logger::instance();

    ::setenv("RELAY_LOG_LEVEL", "error", 1);
    REQUIRE(log.configure_from_env());
    REQUIRE(log.get_level() == level::error);

    ::setenv("RELAY_LOG_LEVEL", "loud", 1);
    REQUIRE_FALSE(log.configure_from_env());
    REQUIRE(log.get_level() == level::error);

    ::unsetenv("RELAY_LOG_LEVEL");
    REQUIRE(log.configure_from_env());

    log.set_level(level::info);
}

TEST_CASE("base_name strips directories", "[logger]") {
    STATIC_REQUIRE(base_name("include/relay/net/tcp.hpp") == "tcp.hpp");
    STATIC_REQUIRE(base_name("tcp.hpp") == "tcp.hpp");
}

TEST_CASE("Concurrent logging", "[logger]") {
    auto& log = logger::instance();
    log.set_level(level::error);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < 50; ++j) {
                RELAY_LOG_ERROR("thread {} log {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    log.set_level(level::info);
    SUCCEED();
}

TEST_CASE("Errors format through fmt", "[logger][error]") {
    relay::error err(relay::errc::connect, "failed to connect to example.com", ECONNREFUSED);
    REQUIRE(err.kind() == relay::errc::connect);
    REQUIRE(err.code() == ECONNREFUSED);
    REQUIRE_FALSE(err.cause().empty());
    REQUIRE(fmt::format("{}", err) == err.to_string());
    REQUIRE(err.to_string().starts_with("connect error: failed to connect to example.com: "));

    relay::error bare(relay::errc::closed, "");
    REQUIRE(bare.to_string() == "closed");

    relay::exception ex(relay::error(relay::errc::runtime_init, "no threads"));
    REQUIRE(ex.get_error().is(relay::errc::runtime_init));
    REQUIRE(std::string(ex.what()) == "runtime init error: no threads");
}
