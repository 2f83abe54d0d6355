#pragma once

#include <string>

#include "tftpkit/config/engine_config.h"

namespace tftpkit::config {

// YAML text <-> EngineConfig. Missing keys keep their defaults.
// parse_engine_config throws YAML::Exception on malformed text.
EngineConfig parse_engine_config(const std::string& yamlText);
std::string  emit_engine_config(const EngineConfig& cfg);

// File-backed YAML implementation of EngineConfigStore.
class YamlEngineConfigStore : public EngineConfigStore {
public:
    explicit YamlEngineConfigStore(std::string path);

    // Never throws: a missing file yields defaults (and writes them),
    // an unreadable or malformed one yields defaults.
    EngineConfig load() override;
    void         save(const EngineConfig& cfg) override;

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

} // namespace tftpkit::config
