#include "fetchcache/util/logging.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/strings.hh"

#include <fcntl.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fetchcache {

TEST(JSONLogger, writesOneRecordPerLine)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir);
    auto path = tmpDir + "/log";

    {
        AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0600);
        ASSERT_TRUE(fd);

        auto jsonLogger = makeJSONLogger(fd.get());
        jsonLogger->log(lvlInfo, "hello");
        {
            Activity act(*jsonLogger, lvlTalkative, actVerifyFile, "verifying 'x'", {"x"}, 0);
            act.progress(5, 10);
        }
    }

    auto lines = tokenizeString<std::vector<std::string>>(readFile(path), "\n");
    ASSERT_EQ(lines.size(), 4u);

    auto msg = nlohmann::json::parse(lines[0]);
    ASSERT_EQ(msg["action"], "msg");
    ASSERT_EQ(msg["level"], lvlInfo);
    ASSERT_EQ(msg["msg"], "hello");

    auto start = nlohmann::json::parse(lines[1]);
    ASSERT_EQ(start["action"], "start");
    ASSERT_EQ(start["type"], actVerifyFile);
    ASSERT_EQ(start["text"], "verifying 'x'");
    ASSERT_EQ(start["fields"], nlohmann::json::array({"x"}));

    auto progress = nlohmann::json::parse(lines[2]);
    ASSERT_EQ(progress["action"], "result");
    ASSERT_EQ(progress["type"], resProgress);
    ASSERT_EQ(progress["fields"], nlohmann::json::array({5, 10, 0, 0}));
    ASSERT_EQ(progress["id"], start["id"]);

    auto stop = nlohmann::json::parse(lines[3]);
    ASSERT_EQ(stop["action"], "stop");
    ASSERT_EQ(stop["id"], start["id"]);
}

TEST(warn, usesLogger)
{
    struct Capture : Logger
    {
        std::vector<std::pair<Verbosity, std::string>> messages;

        void log(Verbosity lvl, std::string_view s) override
        {
            messages.emplace_back(lvl, std::string(s));
        }

        void logEI(const ErrorInfo & ei) override {}
    };

    auto oldLogger = std::move(logger);
    logger = std::make_unique<Capture>();
    warn("cache entry for '%s' is stale", "https://example.org/");
    auto & capture = dynamic_cast<Capture &>(*logger);
    auto messages = capture.messages;
    logger = std::move(oldLogger);

    ASSERT_EQ(messages.size(), 1u);
    ASSERT_EQ(messages[0].first, lvlWarn);
    ASSERT_NE(messages[0].second.find("cache entry for 'https://example.org/' is stale"), std::string::npos);
}

} // namespace fetchcache
