#include "config_loader.hpp"
#include <crow/logging.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace toolhost {

ConfigLoader::ConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(std::filesystem::absolute(config_file_path)),
      base_path_(config_file_path_.parent_path()) {
    CROW_LOG_DEBUG << "ConfigLoader initialized with config file: " << config_file_path_.string();
}

YAML::Node ConfigLoader::loadYamlFile(const std::filesystem::path& file_path) const {
    std::filesystem::path full_path = resolvePath(file_path);
    if (!fileExists(full_path)) {
        throw std::runtime_error("Configuration file not found: " + full_path.string());
    }

    try {
        CROW_LOG_DEBUG << "Loading YAML file: " << full_path.string();
        return YAML::Load(readFile(full_path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + full_path.string() + "': " + e.what());
    }
}

std::filesystem::path ConfigLoader::resolvePath(const std::filesystem::path& relative_path) const {
    if (relative_path.empty()) {
        return base_path_;
    }
    if (relative_path.is_absolute()) {
        return relative_path;
    }

    std::filesystem::path resolved = base_path_ / relative_path;
    std::error_code ec;
    auto canonical = std::filesystem::canonical(resolved, ec);
    if (ec) {
        // Not existing yet; normalize lexically instead
        return resolved.lexically_normal();
    }
    return canonical;
}

bool ConfigLoader::fileExists(const std::filesystem::path& file_path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(resolvePath(file_path), ec);
}

bool ConfigLoader::directoryExists(const std::filesystem::path& dir_path) const {
    std::error_code ec;
    return std::filesystem::is_directory(resolvePath(dir_path), ec);
}

std::string ConfigLoader::readFile(const std::filesystem::path& file_path) const {
    std::filesystem::path resolved = resolvePath(file_path);
    std::ifstream input(resolved, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Cannot open file: " + resolved.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

} // namespace toolhost
