#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include "core/messages.hpp"
#include "queue/event_channel.hpp"

using namespace draftlink;

// Benchmark single send/receive cycle on the default capacity-1 channel
static void BM_EventChannelSendReceive(benchmark::State& state) {
    EventChannel<int> channel;
    for (auto _ : state) {
        benchmark::DoNotOptimize(channel.try_send(42));
        benchmark::DoNotOptimize(channel.try_receive());
    }
}
BENCHMARK(BM_EventChannelSendReceive);

// Benchmark the drop path: sends into a full channel
static void BM_EventChannelSendWhenFull(benchmark::State& state) {
    EventChannel<int> channel;
    benchmark::DoNotOptimize(channel.try_send(1));

    for (auto _ : state) {
        benchmark::DoNotOptimize(channel.try_send(2));
    }
}
BENCHMARK(BM_EventChannelSendWhenFull);

// Benchmark peek-then-receive as done by the connector's ordered merge
static void BM_EventChannelPeekReceive(benchmark::State& state) {
    EventChannel<Sequenced<int>> channel;
    std::uint64_t seq = 0;

    for (auto _ : state) {
        benchmark::DoNotOptimize(channel.try_send(Sequenced<int>{seq, 42}));
        const auto* head = channel.peek();
        if (head != nullptr && head->seq == seq) {
            benchmark::DoNotOptimize(channel.try_receive());
            ++seq;
        }
    }
}
BENCHMARK(BM_EventChannelPeekReceive);

// Benchmark with a realistic feed event (raw frame plus parsed body)
static void BM_EventChannelFeedEvent(benchmark::State& state) {
    EventChannel<Sequenced<FeedEvent>> channel;
    const std::string raw =
        R"([8,"OnJsonApiEvent_lol-champ-select_v1_session",{"eventType":"Update","data":{"timer":{"phase":"BAN_PICK"}}}])";
    FeedEvent event{raw, *feed::normalize_text(raw), std::chrono::system_clock::now()};

    for (auto _ : state) {
        benchmark::DoNotOptimize(channel.try_send(Sequenced<FeedEvent>{0, event}));
        benchmark::DoNotOptimize(channel.try_receive());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(raw.size()));
}
BENCHMARK(BM_EventChannelFeedEvent);
