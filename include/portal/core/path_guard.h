/**
 * @file path_guard.h
 * @brief Containment of client-supplied destination names under a root
 */

#ifndef PORTAL_CORE_PATH_GUARD_H
#define PORTAL_CORE_PATH_GUARD_H

#include <filesystem>
#include <string_view>

#include <portal/core/types.h>

namespace portal {

/**
 * @brief Resolves destination names against a fixed root directory
 *
 * The guard is an immutable value: create() canonicalizes the root once and
 * every session receives a copy. resolve() performs no filesystem mutation,
 * so a rejected name never leaves a directory or file behind.
 *
 * @code
 * auto guard = path_guard::create("/srv/drop");
 * auto target = guard.value().resolve("/photos/a.jpg");  // /srv/drop/photos/a.jpg
 * auto bad = guard.value().resolve("../escape.txt");      // path_violation
 * @endcode
 */
class path_guard {
public:
    /**
     * @brief Create a guard for an existing directory
     * @param root Directory that must exist; stored in canonical form
     * @return Guard or invalid_configuration
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root) -> result<path_guard>;

    /**
     * @brief Map a '/'-separated name to an absolute path inside the root
     *
     * A leading '/' is treated as relative to the root. Empty and "."
     * segments are dropped. The result is rejected with path_violation when
     * it is the root itself, lies outside it, or escapes through a symbolic
     * link that already exists under the root.
     */
    [[nodiscard]] auto resolve(std::string_view name) const -> result<std::filesystem::path>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    explicit path_guard(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] auto is_contained(const std::filesystem::path& target) const -> bool;

    std::filesystem::path root_;
};

}  // namespace portal

#endif  // PORTAL_CORE_PATH_GUARD_H
