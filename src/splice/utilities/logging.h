#ifndef SPLICE_UTILITIES_LOGGING_H
#define SPLICE_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <splice/core/dynamic.h>
#include <splice/fs/types.h>

namespace splicer {

struct logging_config
{
    spdlog::level::level_enum level = spdlog::level::info;
    // If this is set, log messages are also written to a rotating log file
    // at this location.
    optional<file_path> log_file;
};

// Create (or recreate) the "splice" logger according to :config. Console
// output always goes to stderr.
void
initialize_logging(logging_config const& config);

// Get the "splice" logger. If initialize_logging() hasn't been called, this
// creates a plain stderr logger.
std::shared_ptr<spdlog::logger>
get_logger();

// Parse a log level name (trace, debug, info, warn, error, off).
spdlog::level::level_enum
parse_log_level(string const& name);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Log a function call (at debug level).
#define SPLICE_LOG_CALL(args)                                                 \
    {                                                                         \
        auto logger = splicer::get_logger();                                  \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define SPLICE_LOG_ARG(arg)                                                   \
    splicer::detail::arg_logger<                                              \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace splicer

#endif
