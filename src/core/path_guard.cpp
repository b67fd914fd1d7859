/**
 * @file path_guard.cpp
 * @brief Path containment guard implementation
 */

#include <portal/core/path_guard.h>
#include <portal/core/logging.h>

#include <system_error>

namespace portal {

namespace fs = std::filesystem;

auto path_guard::create(const fs::path& root) -> result<path_guard> {
    if (root.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "root directory is required"}};
    }

    std::error_code ec;
    auto canonical_root = fs::canonical(root, ec);
    if (ec) {
        return unexpected{error{error_code::invalid_configuration,
            "cannot resolve root directory " + root.string() + ": " + ec.message()}};
    }

    if (!fs::is_directory(canonical_root, ec)) {
        return unexpected{error{error_code::invalid_configuration,
            "root is not a directory: " + canonical_root.string()}};
    }

    return path_guard{std::move(canonical_root)};
}

auto path_guard::resolve(std::string_view name) const -> result<fs::path> {
    auto reject = [&](const std::string& reason) -> result<fs::path> {
        PORTAL_LOG_WARN(log_category::guard,
            "Rejected destination '" + std::string(name) + "': " + reason);
        return unexpected{error{error_code::path_violation,
            "path violation: " + std::string(name) + " (" + reason + ")"}};
    };

    if (name.empty()) {
        return reject("empty name");
    }
    if (name.find('\0') != std::string_view::npos) {
        return reject("name contains NUL");
    }

    fs::path relative;
    std::size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find('/', start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        auto segment = name.substr(start, end - start);
        if (!segment.empty() && segment != ".") {
            relative /= fs::path(std::string(segment));
        }
        start = end + 1;
    }

    auto target = (root_ / relative).lexically_normal();
    if (!is_contained(target)) {
        return reject("outside of root");
    }

    // Existing symbolic links below the root may point elsewhere.
    std::error_code ec;
    auto resolved = fs::weakly_canonical(target, ec);
    if (ec) {
        return reject("cannot resolve: " + ec.message());
    }
    if (!is_contained(resolved)) {
        return reject("resolves outside of root");
    }

    PORTAL_LOG_TRACE(log_category::guard,
        "Resolved '" + std::string(name) + "' -> " + resolved.string());
    return resolved;
}

auto path_guard::is_contained(const fs::path& target) const -> bool {
    auto rel = target.lexically_relative(root_);
    if (rel.empty() || rel == ".") {
        return false;
    }
    auto first = *rel.begin();
    return first != "..";
}

}  // namespace portal
