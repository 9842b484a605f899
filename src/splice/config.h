#ifndef SPLICE_CONFIG_H
#define SPLICE_CONFIG_H

#include <map>

#include <splice/core.h>
#include <splice/fs/types.h>
#include <splice/patch/source.h>
#include <splice/utilities/logging.h>

namespace splicer {

enum class output_format
{
    YAML,
    JSON,
};

output_format
parse_output_format(string const& name);

struct splice_config
{
    // trace, debug, info, warn, error or off (defaults to info)
    optional<string> log_level;
    // If this is given, logs are also written to this file.
    optional<string> log_file;
    // whether patch failures should be reported rather than aborting
    // (defaults to false)
    optional<bool> graceful;
    // yaml or json (defaults to yaml)
    optional<string> output_format;
    // variables for ${values.<key>} references
    dynamic_map values;
    // flags for ${features.<flag>} references
    std::map<string, bool> features;
};

// Read a configuration from a dynamic value (a map of the fields above).
void
from_dynamic(splice_config* config, dynamic const& v);

// If a configuration has an unrecognized or malformed field, this is thrown.
SPLICE_DEFINE_EXCEPTION(invalid_config_field)
// (This also uses field_name_info.)

// Read a configuration file. Files ending in .json are read as JSON. All
// others are read as YAML.
splice_config
read_config_file(file_path const& path);

// Find the user's configuration file on the XDG configuration search path.
optional<file_path>
find_config_file();

// Get the logging configuration implied by :config. Setting SPLICE_DEBUG=1 in
// the environment forces debug logging.
logging_config
get_logging_config(splice_config const& config);

// Get the variables that :config provides to patch sources.
variable_context
get_variable_context(splice_config const& config);

} // namespace splicer

#endif
