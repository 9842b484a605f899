#ifndef SPLICE_FS_TYPES_H
#define SPLICE_FS_TYPES_H

#include <filesystem>

#include <splice/core.h>

namespace splicer {

// (Note that file_path is slightly incorrect because the path could refer to a
// directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace splicer

#endif
