#include <gtest/gtest.h>

#include <sys/stat.h>

#include <map>

#include "config.h"
#include "test_support.h"

namespace cutie {
namespace {

using testing_support::TempDir;

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ParseKeyValues, HandlesQuotingCommentsAndJunk) {
    const KeyValueMap v = parse_key_values(
        "# header\n"
        "\n"
        "A=\"quoted value\"\n"
        "  B = plain  \n"
        "C='single'\n"
        "D=\"esc \\\"q\\\" \\\\ end\"\n"
        "not a pair\n"
        "=nokey\n"
        "E=\n");
    EXPECT_EQ(v.at("A"), "quoted value");
    EXPECT_EQ(v.at("B"), "plain");
    EXPECT_EQ(v.at("C"), "single");
    EXPECT_EQ(v.at("D"), "esc \"q\" \\ end");
    EXPECT_EQ(v.at("E"), "");
    EXPECT_EQ(v.size(), 5u);
}

TEST(SerializeKeyValues, SortsAndQuotes) {
    KeyValueMap v;
    v["ZED"] = "last";
    v["ALPHA"] = "say \"hi\"";
    EXPECT_EQ(serialize_key_values(v),
              "# Cutie-Pi Configuration\n"
              "ALPHA=\"say \\\"hi\\\"\"\n"
              "ZED=\"last\"\n");
    EXPECT_EQ(parse_key_values(serialize_key_values(v)), v);
}

TEST(StoreKeyValueFile, WritesPrivateFileAndNoTempLeftover) {
    TempDir dir;
    const std::string path = dir.file("/config");
    std::string error;
    ASSERT_TRUE(store_key_value_file(path, {{"K", "v"}}, &error)) << error;

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    EXPECT_NE(::stat((path + ".tmp").c_str(), &st), 0);

    const std::optional<KeyValueMap> back = load_key_value_file(path);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->at("K"), "v");
}

TEST(StoreKeyValueFile, MissingDirectoryFails) {
    TempDir dir;
    std::string error;
    EXPECT_FALSE(store_key_value_file(dir.file("/nope/config"), {{"K", "v"}}, &error));
    EXPECT_FALSE(error.empty());
}

TEST(ConfigSource, EnvironmentOverridesFile) {
    const ConfigSource src(fake_env({{"X", "env"}}), {{"X", "file"}, {"Y", "file"}});
    EXPECT_EQ(src.get("X"), "env");
    EXPECT_EQ(src.get("Y"), "file");
    EXPECT_FALSE(src.get("Z"));
}

TEST(ConfigSource, IntegersFallBackAndClamp) {
    const ConfigSource src(fake_env({{"BAD", "abc"}, {"BIG", "9000"}, {"OK", " 42 "}}), {});
    EXPECT_EQ(src.get_int("BAD", 7, 0, 100), 7);
    EXPECT_EQ(src.get_int("BIG", 7, 0, 100), 100);
    EXPECT_EQ(src.get_int("OK", 7, 0, 100), 42);
    EXPECT_EQ(src.get_int("MISSING", 7, 0, 100), 7);
}

TEST(ConfigSource, BooleansAcceptCommonSpellings) {
    const ConfigSource src(fake_env({{"A", "yes"}, {"B", "OFF"}, {"C", "1"}, {"D", "maybe"}}), {});
    EXPECT_TRUE(src.get_bool("A", false));
    EXPECT_FALSE(src.get_bool("B", true));
    EXPECT_TRUE(src.get_bool("C", false));
    EXPECT_TRUE(src.get_bool("D", true));
    EXPECT_FALSE(src.get_bool("D", false));
}

TEST(RuntimeConfig, DefaultsWhenNothingSet) {
    const RuntimeConfig cfg = load_runtime_config(ConfigSource(fake_env({}), {}), kDefaultConfigPath);
    EXPECT_EQ(cfg.api_url, "http://localhost/api");
    EXPECT_EQ(cfg.screen_width, 480);
    EXPECT_EQ(cfg.screen_height, 320);
    EXPECT_EQ(cfg.fps, 30);
    EXPECT_EQ(cfg.system_interval_sec, 2);
    EXPECT_EQ(cfg.swipe_threshold, 50);
    EXPECT_EQ(cfg.config_path, kDefaultConfigPath);
    EXPECT_TRUE(cfg.api_password.empty());
}

TEST(RuntimeConfig, ReadsAndValidatesOverrides) {
    const RuntimeConfig cfg = load_runtime_config(ConfigSource(
        fake_env({{"CUTIE_PIHOLE_API", "http://pi.hole/api//"},
                  {"CUTIE_FPS", "500"},
                  {"CUTIE_SWIPE_THRESHOLD", "x"}}),
        {{"CUTIE_PIHOLE_PASSWORD", "secret"}, {"CUTIE_SCREEN_WIDTH", "800"}}),
        kDefaultConfigPath);
    EXPECT_EQ(cfg.api_url, "http://pi.hole/api");
    EXPECT_EQ(cfg.api_password, "secret");
    EXPECT_EQ(cfg.screen_width, 800);
    EXPECT_EQ(cfg.fps, 120);
    EXPECT_EQ(cfg.swipe_threshold, 50);
}

TEST(RuntimeConfig, SettingsPathComesFromEnvironmentOnly) {
    EXPECT_EQ(config_file_path(fake_env({})), kDefaultConfigPath);
    EXPECT_EQ(config_file_path(fake_env({{"CUTIE_CONFIG_FILE", " /tmp/cutie.conf "}})), "/tmp/cutie.conf");
    EXPECT_EQ(config_file_path(fake_env({{"CUTIE_CONFIG_FILE", ""}})), kDefaultConfigPath);

    const EnvLookup env = fake_env({{"CUTIE_CONFIG_FILE", "/run/cutie/config"}});
    const std::string path = config_file_path(env);
    const RuntimeConfig cfg =
        load_runtime_config(ConfigSource(env, {{"CUTIE_CONFIG_FILE", "/elsewhere/config"}}), path);
    EXPECT_EQ(cfg.config_path, "/run/cutie/config");
}

TEST(RuntimeConfig, FileCannotRedirectWhereSettingsAreSaved) {
    TempDir dir;
    dir.write("/config", "CUTIE_CONFIG_FILE=" + dir.file("/other") + "\nCUTIE_THEME=matrix\n");
    const EnvLookup env = fake_env({{"CUTIE_CONFIG_FILE", dir.file("/config")}});
    const std::string path = config_file_path(env);
    const std::optional<KeyValueMap> values = load_key_value_file(path);
    ASSERT_TRUE(values.has_value());

    const RuntimeConfig cfg = load_runtime_config(ConfigSource(env, *values), path);
    EXPECT_EQ(cfg.config_path, dir.file("/config"));
}

}  // namespace
}  // namespace cutie
