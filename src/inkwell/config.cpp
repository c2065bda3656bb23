#include <inkwell/config.h>
#include <inkwell/pen-attributes.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace inkwell {

// Split a dotted path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map)
    , _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {
}

Result<void> Config::init() noexcept {
    loadDefaults();

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        if (!xdgPath.empty() && std::filesystem::exists(xdgPath)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load; the XDG fallback may be broken
            if (!_configPath.empty()) {
                return Err<void>("Failed to load config file " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && !_cmdOverrides.IsNull()) {
        applyOverrides(_cmdOverrides);
    }

    _initialized = true;
    return Ok();
}

void Config::loadDefaults() {
    YAML::Node pen(YAML::NodeType::Map);
    pen["batch-segments"] = DEFAULT_BATCH_SEGMENTS;
    pen["partial-upload-floats"] = DEFAULT_PARTIAL_UPLOAD_FLOATS;
    pen["default-diameter"] = DEFAULT_PEN_DIAMETER;

    YAML::Node color(YAML::NodeType::Sequence);
    for (float c : DEFAULT_PEN_COLOR) {
        color.push_back(c);
    }
    pen["default-color"] = color;
    pen["render-quality"] = 1.0f;

    _config["pen"] = pen;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config file root must be a map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (!val) continue;

        if (it->second.IsSequence()) {
            // Comma separated list, e.g. INKWELL_PEN_DEFAULT_COLOR=1,0,0,1
            YAML::Node seq(YAML::NodeType::Sequence);
            std::istringstream ss(val);
            std::string item;
            while (std::getline(ss, item, ',')) {
                seq.push_back(item);
            }
            node[key] = seq;
        } else {
            node[key] = std::string(val);
        }
        ydebug("Config: {} overridden by {}", fullPath, envVar);
    }
}

void Config::applyOverrides(const YAML::Node& overrides) {
    if (!overrides.IsMap()) {
        ywarn("Config: ignoring non-map command overrides");
        return;
    }
    mergeNodes(_config, overrides);
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node();

    // reset() rebinds the handle; plain assignment would overwrite _config's children
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        YAML::Node next = current[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "inkwell" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "inkwell" / "config.yaml";
    }
    return {};
}

uint32_t Config::penBatchSegments() const {
    return get<uint32_t>(KEY_PEN_BATCH_SEGMENTS, DEFAULT_BATCH_SEGMENTS);
}

uint32_t Config::penPartialUploadFloats() const {
    return get<uint32_t>(KEY_PEN_PARTIAL_UPLOAD_FLOATS, DEFAULT_PARTIAL_UPLOAD_FLOATS);
}

float Config::penDefaultDiameter() const {
    return get<float>(KEY_PEN_DEFAULT_DIAMETER, DEFAULT_PEN_DIAMETER);
}

std::array<float, 4> Config::penDefaultColor() const {
    auto list = get<std::vector<float>>(KEY_PEN_DEFAULT_COLOR);
    if (!list || list->size() != 4) {
        if (list) ywarn("Config: {} needs 4 components, got {}", KEY_PEN_DEFAULT_COLOR, list->size());
        return DEFAULT_PEN_COLOR;
    }
    std::array<float, 4> color;
    std::copy(list->begin(), list->end(), color.begin());
    return color;
}

float Config::penRenderQuality() const {
    return get<float>(KEY_PEN_RENDER_QUALITY, 1.0f);
}

} // namespace inkwell
