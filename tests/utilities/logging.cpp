#include <splice/utilities/logging.h>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <splice/core/testing.h>
#include <splice/utilities/errors.h>

using namespace splicer;

TEST_CASE("log level parsing", "[utilities][logging]")
{
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);

    try
    {
        parse_log_level("loud");
        FAIL("no exception thrown");
    }
    catch (invalid_enum_string& e)
    {
        REQUIRE(get_required_error_info<enum_string_info>(e) == "loud");
    }
}

TEST_CASE("logger registration", "[utilities][logging]")
{
    auto logger = get_logger();
    REQUIRE(logger);
    REQUIRE(logger->name() == "splice");
    REQUIRE(spdlog::get("splice") == logger);

    // The test runner turns logging off.
    REQUIRE(!logger->should_log(spdlog::level::critical));
}

// Check that none of :logger's sinks write to stdout and that its first sink
// is the stderr console.
static void
check_console_sinks(spdlog::logger& logger)
{
    auto const& sinks = logger.sinks();
    REQUIRE(!sinks.empty());
    REQUIRE(std::dynamic_pointer_cast<spdlog::sinks::ansicolor_stderr_sink_mt>(
        sinks.front()));
    for (auto const& sink : sinks)
    {
        REQUIRE(!std::dynamic_pointer_cast<
                 spdlog::sinks::ansicolor_stdout_sink_mt>(sink));
    }
}

TEST_CASE("logs stay off stdout", "[utilities][logging]")
{
    auto dir = std::filesystem::temp_directory_path() / "splice_logging_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    logging_config config;
    config.log_file = dir / "splice.log";
    initialize_logging(config);
    auto logger = get_logger();
    check_console_sinks(*logger);
    REQUIRE(logger->sinks().size() == 2);
    REQUIRE(std::dynamic_pointer_cast<spdlog::sinks::rotating_file_sink_mt>(
        logger->sinks().back()));

    // The fallback logger behaves the same way.
    spdlog::drop("splice");
    check_console_sinks(*get_logger());

    // Restore the quiet logger that the test runner installed.
    logging_config quiet;
    quiet.level = spdlog::level::off;
    initialize_logging(quiet);
    std::filesystem::remove_all(dir);
}
