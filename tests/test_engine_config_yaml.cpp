#include "doctest.h"

#include "tftpkit/config/engine_config_yaml_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <yaml-cpp/yaml.h>

namespace tftpkit::tests {

using tftpkit::config::EngineConfig;
using tftpkit::config::YamlEngineConfigStore;
using tftpkit::config::emit_engine_config;
using tftpkit::config::parse_engine_config;
using tftpkit::protocol::Mode;

namespace {

std::string temp_config_path(const char* name)
{
    auto p = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(p);
    return p.string();
}

void write_file(const std::string& path, const std::string& text)
{
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("EngineConfig YAML: all keys parsed")
{
    const std::string yaml =
        "tftp:\n"
        "  mode: netascii\n"
        "  max_receive_bytes: 1048576\n"
        "  retain_last_packet: false\n"
        "  error_message: \"Go away\"\n";

    EngineConfig cfg = parse_engine_config(yaml);
    CHECK(cfg.defaultMode == Mode::Text);
    CHECK(cfg.maxReceiveBytes == 1048576);
    CHECK_FALSE(cfg.retainLastPacket);
    CHECK(cfg.defaultErrorMessage == "Go away");
}

TEST_CASE("EngineConfig YAML: missing keys keep defaults")
{
    const EngineConfig defaults{};

    SUBCASE("no tftp section") {
        EngineConfig cfg = parse_engine_config("other: 1\n");
        CHECK(cfg.defaultMode == defaults.defaultMode);
        CHECK(cfg.maxReceiveBytes == defaults.maxReceiveBytes);
        CHECK(cfg.retainLastPacket == defaults.retainLastPacket);
        CHECK(cfg.defaultErrorMessage == defaults.defaultErrorMessage);
    }
    SUBCASE("partial section") {
        EngineConfig cfg = parse_engine_config("tftp:\n  max_receive_bytes: 42\n");
        CHECK(cfg.maxReceiveBytes == 42);
        CHECK(cfg.defaultMode == Mode::Binary);
        CHECK(cfg.defaultErrorMessage == "Unknown error");
    }
    SUBCASE("unknown mode falls back") {
        EngineConfig cfg = parse_engine_config("tftp:\n  mode: mail\n");
        CHECK(cfg.defaultMode == Mode::Binary);
    }
}

TEST_CASE("EngineConfig YAML: mode is case-insensitive")
{
    CHECK(parse_engine_config("tftp:\n  mode: NETASCII\n").defaultMode == Mode::Text);
    CHECK(parse_engine_config("tftp:\n  mode: Octet\n").defaultMode == Mode::Binary);
}

TEST_CASE("EngineConfig YAML: malformed text throws")
{
    CHECK_THROWS_AS(parse_engine_config("tftp: [unclosed\n"), YAML::Exception);
}

TEST_CASE("EngineConfig YAML: emitted text parses back")
{
    EngineConfig cfg;
    cfg.defaultMode         = Mode::Text;
    cfg.maxReceiveBytes     = 9000;
    cfg.retainLastPacket    = false;
    cfg.defaultErrorMessage = "Transfer cancelled";

    const std::string text = emit_engine_config(cfg);
    CHECK(text.find("tftp:") != std::string::npos);
    CHECK(text.find("netascii") != std::string::npos);

    EngineConfig back = parse_engine_config(text);
    CHECK(back.defaultMode == cfg.defaultMode);
    CHECK(back.maxReceiveBytes == cfg.maxReceiveBytes);
    CHECK(back.retainLastPacket == cfg.retainLastPacket);
    CHECK(back.defaultErrorMessage == cfg.defaultErrorMessage);
}

TEST_CASE("YamlEngineConfigStore: missing file is created with defaults")
{
    const std::string path = temp_config_path("tftpkit_missing.yaml");
    YamlEngineConfigStore store(path);

    EngineConfig cfg = store.load();
    CHECK(cfg.defaultMode == Mode::Binary);
    CHECK(cfg.retainLastPacket);

    REQUIRE(std::filesystem::exists(path));
    CHECK(read_file(path).find("retain_last_packet") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("YamlEngineConfigStore: save then load")
{
    const std::string path = temp_config_path("tftpkit_saved.yaml");
    YamlEngineConfigStore store(path);

    EngineConfig cfg;
    cfg.maxReceiveBytes = 123456;
    cfg.defaultMode     = Mode::Text;
    store.save(cfg);

    EngineConfig loaded = store.load();
    CHECK(loaded.maxReceiveBytes == 123456);
    CHECK(loaded.defaultMode == Mode::Text);

    std::filesystem::remove(path);
}

TEST_CASE("YamlEngineConfigStore: unusable files fall back to defaults")
{
    const std::string path = temp_config_path("tftpkit_bad.yaml");
    YamlEngineConfigStore store(path);

    SUBCASE("malformed") {
        write_file(path, "tftp: [unclosed\n");
    }
    SUBCASE("empty") {
        write_file(path, "");
    }
    SUBCASE("wrong value type") {
        write_file(path, "tftp:\n  max_receive_bytes: lots\n");
    }

    EngineConfig cfg = store.load();
    CHECK(cfg.maxReceiveBytes == 0);
    CHECK(cfg.defaultErrorMessage == "Unknown error");

    std::filesystem::remove(path);
}

TEST_CASE("YamlEngineConfigStore: save to an unwritable path throws")
{
    YamlEngineConfigStore store("/nonexistent-dir/tftpkit.yaml");
    CHECK_THROWS_AS(store.save(EngineConfig{}), std::runtime_error);
}

} // namespace tftpkit::tests
