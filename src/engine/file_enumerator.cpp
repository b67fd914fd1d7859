/**
 * @file file_enumerator.cpp
 * @brief File enumeration implementation
 */

#include <portal/engine/file_enumerator.h>
#include <portal/core/logging.h>

#include <algorithm>

namespace portal {

namespace fs = std::filesystem;

auto collect_transfer_entries(const std::vector<fs::path>& inputs)
    -> result<std::vector<transfer_entry>> {
    std::vector<transfer_entry> entries;

    for (const auto& input : inputs) {
        std::error_code ec;
        auto status = fs::status(input, ec);
        if (ec || !fs::exists(status)) {
            return unexpected{error{error_code::io_error,
                "no such file or directory: " + input.string()}};
        }

        if (fs::is_regular_file(status)) {
            entries.push_back({input, input.filename().string()});
            continue;
        }

        if (!fs::is_directory(status)) {
            PORTAL_LOG_WARN(log_category::sender, "Skipping special file " + input.string());
            continue;
        }

        // "." and ".." have to be resolved to find the directory's own name
        auto directory = fs::absolute(input, ec).lexically_normal();
        if (ec) {
            return unexpected{error{error_code::io_error,
                "cannot resolve " + input.string() + ": " + ec.message()}};
        }
        if (!directory.has_filename()) {
            directory = directory.parent_path();
        }
        auto base = directory.parent_path();

        std::vector<transfer_entry> found;
        for (auto it = fs::recursive_directory_iterator(directory, ec);
             !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            auto relative = base.empty() ? it->path().lexically_normal()
                                         : it->path().lexically_relative(base);
            found.push_back({it->path(), relative.generic_string()});
        }
        if (ec) {
            return unexpected{error{error_code::io_error,
                "cannot list " + directory.string() + ": " + ec.message()}};
        }

        std::sort(found.begin(), found.end(),
            [](const transfer_entry& a, const transfer_entry& b) { return a.name < b.name; });
        PORTAL_LOG_DEBUG(log_category::sender,
            "Found " + std::to_string(found.size()) + " files under " + directory.string());
        entries.insert(entries.end(), found.begin(), found.end());
    }

    return entries;
}

}  // namespace portal
