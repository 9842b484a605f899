#include <splice/utilities/logging.h>

#include <mutex>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <splice/utilities/errors.h>

namespace splicer {

static std::mutex the_logger_mutex;

void
initialize_logging(logging_config const& config)
{
    std::lock_guard<std::mutex> guard(the_logger_mutex);

    // Console output goes to stderr. stdout carries the patched documents.
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
    if (config.log_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file->string(), 262144, 2));
    }
    auto combined_logger = std::make_shared<spdlog::logger>(
        "splice", begin(sinks), end(sinks));
    combined_logger->set_level(config.level);

    spdlog::drop("splice");
    spdlog::register_logger(combined_logger);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    std::lock_guard<std::mutex> guard(the_logger_mutex);

    auto logger = spdlog::get("splice");
    if (!logger)
    {
        logger = std::make_shared<spdlog::logger>(
            "splice",
            std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
        spdlog::register_logger(logger);
    }
    return logger;
}

spdlog::level::level_enum
parse_log_level(string const& name)
{
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "off")
        return spdlog::level::off;
    SPLICE_THROW(
        invalid_enum_string() << enum_id_info("log_level")
                              << enum_string_info(name));
}

} // namespace splicer
