#pragma once

#include <string>
#include <vector>

#include "error.hpp"

namespace toolhost {

/**
 * Checks user-supplied file paths before a tool opens them.
 *
 * Rejects traversal sequences (also when URL-encoded), embedded NUL bytes and,
 * when prefixes are configured, anything resolving outside of them. Symlinks
 * are resolved before the prefix check so a link cannot escape the root.
 */
class PathValidator {
public:
    struct Config {
        // Allowed directory prefixes (empty = all allowed)
        std::vector<std::string> allowed_prefixes;
        // Relative paths are resolved against the first allowed prefix
        bool allow_relative_paths = true;
    };

    PathValidator() = default;
    explicit PathValidator(Config config);

    // Canonical absolute path, or a Validation error naming the problem
    Result<std::string> ValidatePath(const std::string& user_path) const;

    bool IsPathAllowed(const std::string& canonical_path) const;

    const Config& GetConfig() const { return _config; }

    // True when any path component is ".." after URL decoding
    static bool ContainsTraversal(const std::string& path);

    // %XX decoding; malformed escapes are kept verbatim
    static std::string UrlDecode(const std::string& encoded);

private:
    Config _config;
};

} // namespace toolhost
