#include <catch2/catch_test_macros.hpp>
#include "config/AppConfig.hpp"
#include "util/Logger.hpp"
#include "TestSupport.hpp"
#include <cstdlib>
#include <sstream>

using namespace sysflow::config;
using sysflow::testing::TempDirectory;
using sysflow::util::LogLevel;
using sysflow::util::Logger;

// =============================================================================
// AppConfig
// =============================================================================

TEST_CASE("AppConfig defaults", "[AppConfig]") {
    AppConfig config;
    REQUIRE(config.workflowsDir == "~/.sysflow/workflows");
    REQUIRE(config.defaultShell == "bash");
    REQUIRE(config.logLevel == LogLevel::WARN);
    REQUIRE(config.logFile.empty());
}

TEST_CASE("AppConfig parse key=value text", "[AppConfig]") {
    auto values = AppConfig::parse(
        "# comment\n"
        "\n"
        "workflows_dir = /srv/flows\n"
        "default_shell=\"zsh\"\n"
        "not a setting\n"
        "  log_level =  debug  \r\n");

    REQUIRE(values.size() == 3);
    REQUIRE(values.at("workflows_dir") == "/srv/flows");
    REQUIRE(values.at("default_shell") == "zsh");
    REQUIRE(values.at("log_level") == "debug");
}

TEST_CASE("AppConfig apply values", "[AppConfig]") {
    AppConfig config;
    config.apply({{"workflows_dir", "/srv/flows"},
                  {"default_shell", "sh"},
                  {"log_level", "error"},
                  {"log_file", "/tmp/sysflow.log"},
                  {"unknown_key", "ignored"}});

    REQUIRE(config.workflowsDir == "/srv/flows");
    REQUIRE(config.defaultShell == "sh");
    REQUIRE(config.logLevel == LogLevel::ERROR);
    REQUIRE(config.logFile == "/tmp/sysflow.log");
}

TEST_CASE("AppConfig rejects invalid values", "[AppConfig]") {
    AppConfig config;
    REQUIRE_THROWS_AS(config.apply({{"log_level", "loud"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(config.apply({{"default_shell", ""}}), std::invalid_argument);
}

TEST_CASE("AppConfig reads file with @ prefix", "[AppConfig]") {
    TempDirectory dir;
    auto path = dir.write("sysflow.conf", "default_shell = fish\n");

    REQUIRE(AppConfig::readFile(path).at("default_shell") == "fish");
    REQUIRE(AppConfig::readFile("@" + path).at("default_shell") == "fish");
    REQUIRE_THROWS_AS(AppConfig::readFile(dir.path() + "/missing.conf"), std::runtime_error);
}

TEST_CASE("AppConfig environment overrides file", "[AppConfig]") {
    AppConfig config;
    config.apply({{"default_shell", "sh"}, {"workflows_dir", "/from/file"}});

    ::setenv("SYSFLOW_DEFAULT_SHELL", "zsh", 1);
    ::unsetenv("SYSFLOW_WORKFLOWS_DIR");
    ::unsetenv("SYSFLOW_LOG_LEVEL");
    config.applyEnvironment();
    ::unsetenv("SYSFLOW_DEFAULT_SHELL");

    REQUIRE(config.defaultShell == "zsh");
    REQUIRE(config.workflowsDir == "/from/file");
}

// =============================================================================
// Logger
// =============================================================================

TEST_CASE("Logger level parsing", "[Logger]") {
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("INFO") == LogLevel::INFO);
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("Error") == LogLevel::ERROR);
    REQUIRE_THROWS_AS(Logger::parseLevel("verbose"), std::invalid_argument);
    REQUIRE(Logger::levelToString(LogLevel::ERROR) == "ERROR");
}

TEST_CASE("Logger filters by level", "[Logger]") {
    auto& logger = Logger::instance();
    auto previous = logger.getLevel();
    std::ostringstream out;
    logger.setOutputStream(&out);
    logger.setLevel(LogLevel::WARN);

    LOG_INFO("hidden message");
    LOG_WARN("visible message");

    logger.setOutputStream(nullptr);
    logger.setLevel(previous);

    REQUIRE(out.str().find("hidden message") == std::string::npos);
    REQUIRE(out.str().find("[WARN ] visible message") != std::string::npos);
}

TEST_CASE("Logger file logging fails loudly", "[Logger]") {
    TempDirectory dir;
    REQUIRE_THROWS_AS(Logger::instance().enableFileLogging(dir.path() + "/no/such/dir/log.txt"),
                      std::runtime_error);
}
