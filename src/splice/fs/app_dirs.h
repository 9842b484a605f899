#ifndef SPLICE_FS_APP_DIRS_H
#define SPLICE_FS_APP_DIRS_H

#include <vector>

#include <splice/fs/types.h>

// This file provides utilities for resolving directory locations according to
// the XDG Base Directory conventions.

namespace splicer {

// Get the full path of directories that should be searched for configuration
// files, in precedence order. This includes system-wide directories that are
// read-only to the user.
//
// Since this is for read-only purposes, directories are only returned if they
// already exist (specifically for this app).
std::vector<file_path>
get_config_search_path(string const& app_name);

// Given a search path and a relative path to a configuration file (or
// directory) that the application wants to read, this will scan the search
// path and return the full path to the first place it's found.
optional<file_path>
search_in_path(
    std::vector<file_path> const& search_path, file_path const& item);

} // namespace splicer

#endif
