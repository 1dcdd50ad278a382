#include <gtest/gtest.h>
#include "engine/capture_runner.hpp"
#include "feed/event_normalizer.hpp"
#include "recording/capture_recorder.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace draftlink;

namespace fs = std::filesystem;

class CaptureRunnerTest : public ::testing::Test {
protected:
    Config config = Config::defaults();
    fs::path path;
    std::ostringstream out;
    WallTime start = std::chrono::system_clock::from_time_t(1714587723);

    void SetUp() override {
        path = fs::temp_directory_path() /
               (std::string("draftlink_runner_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        fs::remove(path);
    }

    void TearDown() override {
        fs::remove(path);
    }

    static FeedEvent feed_event(const std::string& raw, WallTime at) {
        auto normalized = feed::normalize_text(raw);
        return FeedEvent{raw, normalized.value_or(feed::NormalizedEvent{}), at};
    }

    Json read_capture() const {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return Json::parse(buffer.str());
    }
};

TEST_F(CaptureRunnerTest, RecordsSessionUntilTerminal) {
    CaptureRunner runner(config, path, out);
    const std::string first = R"([8,"OnJsonApiEvent_lol-champ-select_v1_session",{"eventType":"Create","data":{"x":1}}])";
    const std::string second = R"([8,"OnJsonApiEvent_lol-champ-select_v1_session",{"eventType":"Update","data":{"x":2}}])";
    const std::string last = R"([8,"OnJsonApiEvent_lol-champ-select_v1_session",{"eventType":"Delete","data":null}])";

    EXPECT_FALSE(runner.handle(Connected{ConnectionInfo{.scheme = "https", .host = "127.0.0.1", .port = "5000"}, start}));
    EXPECT_FALSE(runner.handle(feed_event(first, start)));
    EXPECT_FALSE(runner.handle(feed_event(second, start + std::chrono::seconds(1))));
    EXPECT_FALSE(runner.handle(feed_event(last, start + std::chrono::seconds(2))));
    EXPECT_TRUE(runner.handle(FeedTerminated{start + std::chrono::seconds(2)}));

    EXPECT_FALSE(runner.failed());
    EXPECT_TRUE(runner.recorder().is_finalized());

    auto doc = read_capture();
    ASSERT_EQ(doc["events"].size(), 4u);
    EXPECT_EQ(doc["eventCount"], 4);
    EXPECT_EQ(doc["events"][0]["rawData"], Json::parse(first));
    EXPECT_EQ(doc["events"][2]["rawData"], Json::parse(last));
    EXPECT_EQ(doc["events"][3]["rawData"], Json::parse(recording::kTerminalMarker));

    auto text = out.str();
    EXPECT_NE(text.find("=== Champion Select Started ==="), std::string::npos);
    EXPECT_NE(text.find("Event #3 captured"), std::string::npos);
    EXPECT_NE(text.find("=== Champion Select Ended ==="), std::string::npos);
    EXPECT_NE(text.find("Total events captured: 4"), std::string::npos);
    EXPECT_NE(text.find("  Duration: 2s"), std::string::npos);
}

TEST_F(CaptureRunnerTest, DisconnectMidCaptureFinalizes) {
    CaptureRunner runner(config, path, out);

    EXPECT_FALSE(runner.handle(feed_event(R"({"eventType":"Update","data":{}})", start)));
    EXPECT_TRUE(runner.handle(Disconnected{"lockfile removed", start + std::chrono::seconds(65)}));

    EXPECT_TRUE(runner.recorder().is_finalized());
    auto doc = read_capture();
    EXPECT_EQ(doc["eventCount"], 1);
    EXPECT_TRUE(doc.contains("endTime"));
    EXPECT_NE(out.str().find("  Duration: 1m5s"), std::string::npos);
}

TEST_F(CaptureRunnerTest, DisconnectBeforeCaptureKeepsWaiting) {
    CaptureRunner runner(config, path, out);

    EXPECT_FALSE(runner.handle(Disconnected{"socket closed", start}));
    EXPECT_FALSE(runner.handle(FeedTerminated{start}));

    EXPECT_FALSE(runner.recorder().is_open());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CaptureRunnerTest, EventsAfterCompletionAreIgnored) {
    CaptureRunner runner(config, path, out);
    EXPECT_FALSE(runner.handle(feed_event(R"({"eventType":"Update"})", start)));
    EXPECT_TRUE(runner.handle(FeedTerminated{start}));

    EXPECT_TRUE(runner.handle(feed_event(R"({"eventType":"Update"})", start)));

    EXPECT_EQ(runner.recorder().event_count(), 2u);
}
