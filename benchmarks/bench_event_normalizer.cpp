#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include "feed/event_normalizer.hpp"

using namespace draftlink;

namespace {

// Champ select session frame of typical shape and size
std::string make_session_frame(int team_size) {
    Json data;
    data["timer"] = {{"phase", "BAN_PICK"}, {"adjustedTimeLeftInPhase", 27000}};
    data["localPlayerCellId"] = 2;
    data["myTeam"] = Json::array();
    data["theirTeam"] = Json::array();
    for (int i = 0; i < team_size; ++i) {
        Json player = {
            {"cellId", i},
            {"championId", 100 + i},
            {"summonerId", 1000000 + i},
            {"assignedPosition", "middle"},
            {"spell1Id", 4},
            {"spell2Id", 14}
        };
        data["myTeam"].push_back(player);
        player["cellId"] = i + team_size;
        data["theirTeam"].push_back(player);
    }
    Json ban = {{"actorCellId", 0}, {"type", "ban"}, {"completed", true}};
    data["actions"] = Json::array();
    data["actions"].push_back(Json::array({ban}));

    Json frame = Json::array({8, "OnJsonApiEvent_lol-champ-select_v1_session",
                              {{"eventType", "Update"}, {"uri", "/lol-champ-select/v1/session"}, {"data", data}}});
    return frame.dump();
}

}  // namespace

// Benchmark parse + normalize of a full session frame
static void BM_NormalizeText(benchmark::State& state) {
    const std::string frame = make_session_frame(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(feed::normalize_text(frame));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(frame.size()));
}
BENCHMARK(BM_NormalizeText)->Arg(1)->Arg(5);

// Benchmark normalize of an already parsed frame
static void BM_NormalizeParsed(benchmark::State& state) {
    const Json frame = Json::parse(make_session_frame(5));

    for (auto _ : state) {
        benchmark::DoNotOptimize(feed::normalize(frame));
    }
}
BENCHMARK(BM_NormalizeParsed);

// Benchmark the feed filter applied to every incoming frame
static void BM_MatchesFeed(benchmark::State& state) {
    const Json frame = Json::parse(make_session_frame(5));

    for (auto _ : state) {
        benchmark::DoNotOptimize(feed::matches_feed(frame, "OnJsonApiEvent_lol-champ-select_v1_session"));
    }
}
BENCHMARK(BM_MatchesFeed);

// Benchmark the terminal check on the Delete marker
static void BM_IsTerminalEvent(benchmark::State& state) {
    const Json marker = Json::parse(R"({"eventType":"Delete"})");

    for (auto _ : state) {
        benchmark::DoNotOptimize(feed::is_terminal_event(marker));
    }
}
BENCHMARK(BM_IsTerminalEvent);
