#include "fetchcache/util/configuration.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/file-system.hh"

#include <gtest/gtest.h>

namespace fetchcache {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    std::string value;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
}

TEST(Config, getDefinedSetting)
{
    Config config;
    std::string value;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "");
    ASSERT_EQ(iter->second.description, "description");
}

TEST(Config, getDefinedOverriddenSettingNotSet)
{
    Config config;
    std::string value;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> foo{&config, value, "name-of-the-setting", "description"};

    config.getSettings(settings, /* overriddenOnly = */ true);
    const auto e = settings.find("name-of-the-setting");
    ASSERT_EQ(e, settings.end());
}

TEST(Config, getDefinedSettingSet1)
{
    Config config;
    std::string value;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, value, "name-of-the-setting", "description"};

    setting.assign("value");

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto iter = settings.find("name-of-the-setting");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "value");
    ASSERT_EQ(iter->second.description, "description");
}

TEST(Config, getDefinedSettingSet2)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_TRUE(config.set("name-of-the-setting", "value"));

    config.getSettings(settings, /* overriddenOnly = */ false);
    const auto e = settings.find("name-of-the-setting");
    ASSERT_NE(e, settings.end());
    ASSERT_EQ(e->second.value, "value");
    ASSERT_EQ(e->second.description, "description");
}

TEST(Config, resetOverridden)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_TRUE(config.set("name-of-the-setting", "value"));
    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_EQ(settings.size(), 1);

    config.resetOverridden();

    settings.clear();
    config.getSettings(settings, /* overriddenOnly = */ true);
    ASSERT_TRUE(settings.empty());
    ASSERT_EQ(setting.get(), "value");
}

TEST(Config, addSettingWithAlias)
{
    Config config;
    Setting<bool> setting{&config, false, "lock-cache-entries", "description", {"lock-entries"}};

    ASSERT_TRUE(config.set("lock-entries", "true"));
    ASSERT_EQ(setting.get(), true);
}

TEST(Config, integerSettings)
{
    Config config;
    Setting<unsigned long> bufferSize{&config, 65536, "buffer-size", "description"};

    ASSERT_TRUE(config.set("buffer-size", "4K"));
    ASSERT_EQ(bufferSize.get(), 4096u);

    ASSERT_THROW(config.set("buffer-size", "lots"), UsageError);
}

TEST(Config, booleanSettings)
{
    Config config;
    Setting<bool> flag{&config, true, "flag", "description"};

    ASSERT_TRUE(config.set("flag", "no"));
    ASSERT_EQ(flag.get(), false);

    ASSERT_THROW(config.set("flag", "maybe"), UsageError);
}

TEST(Config, optionalPathSetting)
{
    Config config;
    OptionalPathSetting dir{&config, std::nullopt, "cache-dir", "description"};

    ASSERT_TRUE(config.set("cache-dir", "/var/cache//fetchcache/"));
    ASSERT_EQ(dir.get(), std::optional<Path>("/var/cache/fetchcache"));

    ASSERT_TRUE(config.set("cache-dir", ""));
    ASSERT_FALSE(dir.get().has_value());
}

TEST(Config, toKeyValue)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    setting.assign("value");

    ASSERT_EQ(config.toKeyValue(), R"#(name-of-the-setting = value
)#");
}

TEST(Config, applyConfigEmpty)
{
    Config config;
    std::map<std::string, Config::SettingInfo> settings;
    config.applyConfig("");
    config.getSettings(settings);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, applyConfigWithComments)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    config.applyConfig(
        "# a comment\n"
        "name-of-the-setting = value # trailing comment\n"
        "\n");

    ASSERT_EQ(setting.get(), "value");
}

TEST(Config, applyConfigJoinsWords)
{
    Config config;
    Setting<std::string> setting{&config, "", "user-agent-suffix", "description"};

    config.applyConfig("user-agent-suffix = my   build  bot\n");

    ASSERT_EQ(setting.get(), "my build bot");
}

TEST(Config, applyConfigSyntaxError)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    ASSERT_THROW(config.applyConfig("name-of-the-setting value\n"), UsageError);
    ASSERT_THROW(config.applyConfig("name-of-the-setting\n"), UsageError);
}

TEST(Config, applyConfigInclude)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir);

    writeFile(tmpDir + "/included.conf", "name-of-the-setting = from-include\n");

    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    config.applyConfig("include included.conf\n", tmpDir + "/main.conf");
    ASSERT_EQ(setting.get(), "from-include");

    ASSERT_THROW(config.applyConfig("include missing.conf\n", tmpDir + "/main.conf"), Error);
    config.applyConfig("!include missing.conf\n", tmpDir + "/main.conf");
}

/* ----------------------------------------------------------------------------
 * GlobalConfig
 * --------------------------------------------------------------------------*/

TEST(GlobalConfig, unknownSettingIsReported)
{
    ASSERT_FALSE(globalConfig.set("surely-not-a-setting", "1"));
}

} // namespace fetchcache
