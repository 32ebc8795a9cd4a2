#include <gtest/gtest.h>

#include <cstdlib>

#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/environment-variables.hh"

namespace fetchcache {

class CacheSettingsTest : public ::testing::Test
{
protected:
    std::optional<std::string> oldCacheHome = getEnv("FETCHCACHE_CACHE_HOME");
    std::optional<std::string> oldXdgCacheHome = getEnv("XDG_CACHE_HOME");

    void TearDown() override
    {
        restore("FETCHCACHE_CACHE_HOME", oldCacheHome);
        restore("XDG_CACHE_HOME", oldXdgCacheHome);
        cacheSettings.cacheDir = std::optional<Path>{};
    }

    static void restore(const char * name, const std::optional<std::string> & value)
    {
        if (value)
            setEnv(name, value->c_str());
        else
            unsetenv(name);
    }
};

TEST_F(CacheSettingsTest, cacheHomeEnvironment)
{
    setEnv("FETCHCACHE_CACHE_HOME", "/var/cache/fetchcache-test");
    setEnv("XDG_CACHE_HOME", "/xdg");

    ASSERT_EQ(cacheSettings.getCacheRoot(), "/var/cache/fetchcache-test");
}

TEST_F(CacheSettingsTest, xdgCacheHome)
{
    unsetenv("FETCHCACHE_CACHE_HOME");
    setEnv("XDG_CACHE_HOME", "/xdg");

    ASSERT_EQ(cacheSettings.getCacheRoot(), "/xdg/fetchcache");
}

TEST_F(CacheSettingsTest, emptyVariablesAreIgnored)
{
    setEnv("FETCHCACHE_CACHE_HOME", "");
    setEnv("XDG_CACHE_HOME", "/xdg");

    ASSERT_EQ(cacheSettings.getCacheRoot(), "/xdg/fetchcache");
}

TEST_F(CacheSettingsTest, cacheDirSetting)
{
    setEnv("FETCHCACHE_CACHE_HOME", "/var/cache/fetchcache-test");

    ASSERT_TRUE(globalConfig.set("cache-dir", "/srv/cache/../fetchcache"));
    ASSERT_EQ(cacheSettings.getCacheRoot(), "/srv/fetchcache");
}

TEST_F(CacheSettingsTest, registeredGlobally)
{
    ASSERT_TRUE(globalConfig.set("lock-cache-entries", "false"));
    ASSERT_FALSE(cacheSettings.lockCacheEntries.get());
    ASSERT_TRUE(globalConfig.set("lock-cache-entries", "true"));

    ASSERT_TRUE(globalConfig.set("verify-buffer-size", "1M"));
    ASSERT_EQ(cacheSettings.verifyBufferSize.get(), 1024 * 1024);
    ASSERT_TRUE(globalConfig.set("verify-buffer-size", "65536"));
}

} // namespace fetchcache
