#include "tftpkit/config/engine_config_yaml_store.h"
#include "tftpkit/core/logging.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace tftpkit::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static protocol::Mode parse_mode_or(const std::string& s, protocol::Mode def)
{
    protocol::Mode mode{};
    if (protocol::parse_mode(s, mode)) return mode;

    TFTPKIT_LOGW(TAG, "Unknown transfer mode '%s', using %s", s.c_str(), protocol::to_string(def));
    return def;
}

// ---------- mapping ----------

static void from_yaml(const YAML::Node& node, EngineConfig& out)
{
    const EngineConfig defaults{};

    auto modeStr            = get_or<std::string>(node, "mode", std::string(protocol::mode_string(defaults.defaultMode)));
    out.defaultMode         = parse_mode_or(modeStr, defaults.defaultMode);
    out.maxReceiveBytes     = get_or<std::uint64_t>(node, "max_receive_bytes", defaults.maxReceiveBytes);
    out.retainLastPacket    = get_or<bool>(node, "retain_last_packet", defaults.retainLastPacket);
    out.defaultErrorMessage = get_or<std::string>(node, "error_message", defaults.defaultErrorMessage);
}

static void to_yaml(YAML::Emitter& out, const EngineConfig& cfg)
{
    out << YAML::BeginMap;

    // tftp:
    out << YAML::Key << "tftp" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "mode"               << YAML::Value << protocol::to_string(cfg.defaultMode);
    out << YAML::Key << "max_receive_bytes"  << YAML::Value << cfg.maxReceiveBytes;
    out << YAML::Key << "retain_last_packet" << YAML::Value << cfg.retainLastPacket;
    out << YAML::Key << "error_message"      << YAML::Value << cfg.defaultErrorMessage;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

EngineConfig parse_engine_config(const std::string& yamlText)
{
    EngineConfig cfg{};

    YAML::Node root = YAML::Load(yamlText);
    if (auto n = root["tftp"]) {
        from_yaml(n, cfg);
    }
    return cfg;
}

std::string emit_engine_config(const EngineConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    return out.c_str();
}

// ---------- YamlEngineConfigStore methods ----------

YamlEngineConfigStore::YamlEngineConfigStore(std::string path)
    : _path(std::move(path))
{
}

EngineConfig YamlEngineConfigStore::load()
{
    std::ifstream in(_path);
    if (!in) {
        TFTPKIT_LOGW(TAG, "Config '%s' not found; writing defaults", _path.c_str());

        EngineConfig cfg{};
        try {
            save(cfg);
        } catch (const std::exception& ex) {
            TFTPKIT_LOGE(TAG, "Failed to write default config '%s': %s", _path.c_str(), ex.what());
        }
        return cfg;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    const std::string yamlText = ss.str();

    if (yamlText.empty()) {
        TFTPKIT_LOGW(TAG, "Config '%s' is empty; using defaults", _path.c_str());
        return EngineConfig{};
    }

    try {
        EngineConfig cfg = parse_engine_config(yamlText);
        TFTPKIT_LOGI(TAG, "Loaded config from '%s'", _path.c_str());
        return cfg;
    } catch (const std::exception& ex) {
        TFTPKIT_LOGE(TAG, "Failed to load config '%s': %s", _path.c_str(), ex.what());
    }
    return EngineConfig{};
}

void YamlEngineConfigStore::save(const EngineConfig& cfg)
{
    std::ofstream out(_path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("open for write failed: " + _path);
    }

    out << emit_engine_config(cfg) << '\n';
    if (!out) {
        throw std::runtime_error("short write while saving config: " + _path);
    }

    TFTPKIT_LOGI(TAG, "Saved config to '%s'", _path.c_str());
}

} // namespace tftpkit::config
