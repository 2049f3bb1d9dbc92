#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace toolhost {

/**
 * Loads YAML documents from disk and resolves paths relative to the main
 * configuration file. Interpretation of the loaded nodes happens in
 * ConfigManager.
 */
class ConfigLoader {
public:
    /**
     * @param config_file_path Path to the main toolhost.yaml; made absolute on construction
     */
    explicit ConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * Load and parse a YAML file.
     *
     * @param file_path Absolute path, or a path relative to the config directory
     * @return Parsed YAML::Node representing the file contents
     * @throws std::runtime_error if the file is missing or cannot be parsed
     */
    YAML::Node loadYamlFile(const std::filesystem::path& file_path) const;

    // Directory containing the main configuration file
    std::filesystem::path getBasePath() const { return base_path_; }

    // Absolute paths are returned unchanged, relative ones are anchored at getBasePath()
    std::filesystem::path resolvePath(const std::filesystem::path& relative_path) const;

    bool fileExists(const std::filesystem::path& file_path) const;
    bool directoryExists(const std::filesystem::path& dir_path) const;

    std::filesystem::path getConfigFilePath() const { return config_file_path_; }

    // Raw file contents
    // @throws std::runtime_error if the file cannot be read
    std::string readFile(const std::filesystem::path& file_path) const;

private:
    std::filesystem::path config_file_path_;
    std::filesystem::path base_path_;
};

} // namespace toolhost
