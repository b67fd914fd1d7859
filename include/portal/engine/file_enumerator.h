/**
 * @file file_enumerator.h
 * @brief Expansion of files and directory trees into transfer entries
 */

#ifndef PORTAL_ENGINE_FILE_ENUMERATOR_H
#define PORTAL_ENGINE_FILE_ENUMERATOR_H

#include <filesystem>
#include <string>
#include <vector>

#include <portal/core/types.h>

namespace portal {

struct transfer_entry {
    std::filesystem::path source;
    std::string name;     ///< '/'-separated destination name
};

/**
 * @brief Collect the regular files named by the inputs
 *
 * A file contributes its own file name. A directory contributes every
 * regular file below it, named relative to the directory's parent so the
 * directory itself is recreated on the receiving side
 * ("photos/2024/a.jpg"). Entries of one directory are sorted by name.
 */
[[nodiscard]] auto collect_transfer_entries(const std::vector<std::filesystem::path>& inputs)
    -> result<std::vector<transfer_entry>>;

}  // namespace portal

#endif  // PORTAL_ENGINE_FILE_ENUMERATOR_H
