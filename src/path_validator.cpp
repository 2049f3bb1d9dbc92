#include "path_validator.hpp"
#include <cctype>
#include <filesystem>

namespace toolhost {

PathValidator::PathValidator(Config config) : _config(std::move(config)) {}

Result<std::string> PathValidator::ValidatePath(const std::string& user_path) const {
    if (user_path.empty()) {
        return Error::Validation("Path cannot be empty", {{"path", "must not be empty"}});
    }
    if (user_path.find('\0') != std::string::npos) {
        return Error::Validation("Path contains null bytes", {{"path", "contains null bytes"}});
    }

    // URL decode first to catch encoded traversal attempts
    std::string decoded_path = UrlDecode(user_path);
    if (ContainsTraversal(decoded_path)) {
        return Error::Validation("Path traversal not allowed", {{"path", "must not contain '..'"}}, user_path);
    }

    std::filesystem::path path(decoded_path);
    if (path.is_relative()) {
        if (!_config.allow_relative_paths) {
            return Error::Validation("Relative paths not allowed", {{"path", "must be absolute"}}, user_path);
        }
        if (!_config.allowed_prefixes.empty()) {
            path = std::filesystem::path(_config.allowed_prefixes.front()) / path;
        } else {
            path = std::filesystem::absolute(path);
        }
    }

    // weakly_canonical resolves symlinks for the existing part and normalizes the rest
    std::error_code ec;
    std::filesystem::path real_path = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return Error::Validation("Failed to resolve path", {{"path", ec.message()}}, user_path);
    }

    std::string canonical = real_path.string();
    if (!IsPathAllowed(canonical)) {
        return Error::Validation("Path not within allowed directory", {{"path", "outside allowed directory"}},
                                 user_path);
    }
    return canonical;
}

bool PathValidator::IsPathAllowed(const std::string& canonical_path) const {
    if (_config.allowed_prefixes.empty()) {
        return true;
    }

    for (const auto& prefix : _config.allowed_prefixes) {
        std::error_code ec;
        std::string normalized_prefix = std::filesystem::weakly_canonical(prefix, ec).string();
        if (ec) {
            normalized_prefix = std::filesystem::path(prefix).lexically_normal().string();
        }
        while (normalized_prefix.size() > 1 && normalized_prefix.back() == '/') {
            normalized_prefix.pop_back();
        }

        if (canonical_path == normalized_prefix) {
            return true;
        }
        if (canonical_path.compare(0, normalized_prefix.size() + 1, normalized_prefix + "/") == 0) {
            return true;
        }
    }
    return false;
}

bool PathValidator::ContainsTraversal(const std::string& path) {
    std::string decoded = UrlDecode(path);
    for (const auto& component : std::filesystem::path(decoded)) {
        if (component == "..") {
            return true;
        }
    }
    // Backslash separated input is not split by std::filesystem on POSIX
    return decoded.find("..\\") != std::string::npos || decoded.find("\\..") != std::string::npos;
}

std::string PathValidator::UrlDecode(const std::string& encoded) {
    std::string result;
    result.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            result += static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += encoded[i];
        }
    }
    return result;
}

} // namespace toolhost
