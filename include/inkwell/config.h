#pragma once

#include <inkwell/result.hpp>
#include <yaml-cpp/yaml.h>
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace inkwell {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Layering, lowest to highest: built-in defaults, config file,
    // INKWELL_* environment variables, cmdOverrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "pen.batch-segments")
    // Returns nullopt if key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Check if a key exists
    bool has(const std::string& path) const;

    // Get the raw YAML node for advanced queries
    const YAML::Node& root() const { return _config; }

    // Helper to get XDG config path ($XDG_CONFIG_HOME/inkwell/config.yaml)
    static std::filesystem::path getXDGConfigPath();

    // Environment variable prefix
    static constexpr const char* ENV_PREFIX = "INKWELL_";

    static constexpr const char* KEY_PEN_BATCH_SEGMENTS = "pen.batch-segments";
    static constexpr const char* KEY_PEN_PARTIAL_UPLOAD_FLOATS = "pen.partial-upload-floats";
    static constexpr const char* KEY_PEN_DEFAULT_DIAMETER = "pen.default-diameter";
    static constexpr const char* KEY_PEN_DEFAULT_COLOR = "pen.default-color";
    static constexpr const char* KEY_PEN_RENDER_QUALITY = "pen.render-quality";

    uint32_t penBatchSegments() const;
    uint32_t penPartialUploadFloats() const;
    float penDefaultDiameter() const;
    std::array<float, 4> penDefaultColor() const;
    float penRenderQuality() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();

    // Load config from file
    Result<void> loadFile(const std::string& path);

    // Apply environment variable overrides to every scalar already present
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    // Apply command line overrides
    void applyOverrides(const YAML::Node& overrides);

    // Get YAML node by dotted path
    YAML::Node getNode(const std::string& path) const;

    // Convert dotted path to env var name (e.g., "pen.batch-segments" -> "INKWELL_PEN_BATCH_SEGMENTS")
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
    bool _initialized = false;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace inkwell
