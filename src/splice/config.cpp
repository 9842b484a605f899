#include <splice/config.h>

#include <splice/encodings/json.h>
#include <splice/encodings/yaml.h>
#include <splice/fs/app_dirs.h>
#include <splice/fs/file_io.h>
#include <splice/utilities/environment.h>
#include <splice/utilities/errors.h>
#include <splice/utilities/text.h>

namespace splicer {

output_format
parse_output_format(string const& name)
{
    if (iequals(name, "yaml"))
        return output_format::YAML;
    if (iequals(name, "json"))
        return output_format::JSON;
    SPLICE_THROW(
        invalid_enum_string() << enum_id_info("output_format")
                              << enum_string_info(name));
}

[[noreturn]] static void
throw_invalid_field(string const& field, string const& message)
{
    SPLICE_THROW(
        invalid_config_field()
        << field_name_info(field) << internal_error_message_info(message));
}

template<class T>
static T const&
read_field(string const& field, dynamic const& v)
{
    try
    {
        return cast<T>(v);
    }
    catch (type_mismatch& e)
    {
        e << field_name_info(field);
        throw;
    }
}

void
from_dynamic(splice_config* config, dynamic const& v)
{
    *config = splice_config();
    if (v.type() == value_type::NIL)
        return;
    for (auto const& field : read_field<dynamic_map>("<root>", v))
    {
        auto const& name = field.first;
        auto const& value = field.second;
        if (name == "log_level")
        {
            config->log_level = read_field<string>(name, value);
            // Check it now so that a bad level is reported as a config error.
            parse_log_level(*config->log_level);
        }
        else if (name == "log_file")
        {
            config->log_file = read_field<string>(name, value);
        }
        else if (name == "graceful")
        {
            config->graceful = read_field<bool>(name, value);
        }
        else if (name == "output_format")
        {
            config->output_format = read_field<string>(name, value);
            parse_output_format(*config->output_format);
        }
        else if (name == "values")
        {
            config->values = read_field<dynamic_map>(name, value);
        }
        else if (name == "features")
        {
            for (auto const& flag : read_field<dynamic_map>(name, value))
            {
                config->features[flag.first]
                    = read_field<bool>(name + "." + flag.first, flag.second);
            }
        }
        else
        {
            throw_invalid_field(name, "unknown configuration field");
        }
    }
}

splice_config
read_config_file(file_path const& path)
{
    auto contents = read_file_contents(path);
    splice_config config;
    if (path.extension() == ".json")
        from_dynamic(&config, parse_json_value(contents));
    else
        from_dynamic(&config, parse_yaml_value(contents));
    return config;
}

optional<file_path>
find_config_file()
{
    return search_in_path(get_config_search_path("splice"), "config.yaml");
}

logging_config
get_logging_config(splice_config const& config)
{
    logging_config logging;
    if (config.log_level)
        logging.level = parse_log_level(*config.log_level);
    if (config.log_file)
        logging.log_file = file_path(*config.log_file);
    if (get_optional_environment_variable("SPLICE_DEBUG") == some(string("1")))
        logging.level = spdlog::level::debug;
    return logging;
}

variable_context
get_variable_context(splice_config const& config)
{
    variable_context variables;
    variables.values = config.values;
    variables.features = config.features;
    return variables;
}

} // namespace splicer
