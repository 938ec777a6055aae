#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "workflow/event_stream.hpp"

using namespace codeloop::workflow;

namespace {

WorkflowEvent step_event(uint32_t step, WorkflowStatus status) {
    WorkflowEvent event;
    event.step = step;
    event.status = status;
    event.kind = StepKind::EXECUTE;
    event.language = "python";
    return event;
}

}

TEST(WorkflowEventStream, AssignsDenseSequenceNumbers) {
    WorkflowEventStream stream("wf-test");
    ASSERT_TRUE(stream.append(step_event(1, WorkflowStatus::EXECUTING)));
    ASSERT_TRUE(stream.append(step_event(1, WorkflowStatus::FAILED)));
    ASSERT_TRUE(stream.append(step_event(2, WorkflowStatus::FIX_REQUEST)));

    auto all = stream.entries();
    ASSERT_EQ(all.size(), 3u);
    for (size_t i = 0; i < all.size(); i++) {
        EXPECT_EQ(all[i].sequence, i + 1);
        EXPECT_EQ(all[i].workflow_id, "wf-test");
    }
    EXPECT_EQ(stream.last_sequence(), 3u);
}

TEST(WorkflowEventStream, EntriesSinceAndLimit) {
    WorkflowEventStream stream("wf-test");
    for (uint32_t i = 1; i <= 5; i++) {
        stream.append(step_event(i, WorkflowStatus::EXECUTING));
    }

    auto after_two = stream.entries(2);
    ASSERT_EQ(after_two.size(), 3u);
    EXPECT_EQ(after_two.front().sequence, 3u);

    auto limited = stream.entries(0, 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited.back().sequence, 2u);

    EXPECT_TRUE(stream.entries(5).empty());
    EXPECT_TRUE(stream.entries(100).empty());
}

TEST(WorkflowEventStream, TailReturnsLastEntries) {
    WorkflowEventStream stream("wf-test");
    for (uint32_t i = 1; i <= 4; i++) {
        stream.append(step_event(i, WorkflowStatus::EXECUTING));
    }

    auto last = stream.tail(2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0].sequence, 3u);
    EXPECT_EQ(last[1].sequence, 4u);
    EXPECT_EQ(stream.tail(10).size(), 4u);
}

TEST(WorkflowEventStream, WaitForTimesOutWithoutEntries) {
    WorkflowEventStream stream("wf-test");
    auto start = std::chrono::steady_clock::now();
    auto result = stream.wait_for(0, std::chrono::milliseconds(50));
    EXPECT_TRUE(result.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST(WorkflowEventStream, WaitForWakesOnAppend) {
    WorkflowEventStream stream("wf-test");
    std::thread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        stream.append(step_event(1, WorkflowStatus::EXECUTING));
    });

    auto result = stream.wait_for(0, std::chrono::seconds(5));
    writer.join();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].sequence, 1u);
}

TEST(WorkflowEventStream, WaitForReturnsWhenClosed) {
    WorkflowEventStream stream("wf-test");
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        stream.close();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = stream.wait_for(0, std::chrono::seconds(5));
    closer.join();
    EXPECT_TRUE(result.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST(WorkflowEventStream, SubscribeReplaysThenDeliversInOrder) {
    WorkflowEventStream stream("wf-test");
    stream.append(step_event(1, WorkflowStatus::EXECUTING));

    std::vector<uint64_t> seen;
    uint64_t id = stream.subscribe([&](const WorkflowEvent& event) { seen.push_back(event.sequence); });

    stream.append(step_event(1, WorkflowStatus::FAILED));
    stream.append(step_event(2, WorkflowStatus::FIX_REQUEST));
    EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2, 3}));

    EXPECT_TRUE(stream.unsubscribe(id));
    EXPECT_FALSE(stream.unsubscribe(id));
    stream.append(step_event(2, WorkflowStatus::NO_FIX));
    EXPECT_EQ(seen.size(), 3u);
}

TEST(WorkflowEventStream, ThrowingSubscriberDoesNotBreakAppend) {
    WorkflowEventStream stream("wf-test");
    stream.subscribe([](const WorkflowEvent&) { throw std::runtime_error("renderer gone"); });

    EXPECT_TRUE(stream.append(step_event(1, WorkflowStatus::EXECUTING)));
    EXPECT_EQ(stream.size(), 1u);
}

TEST(WorkflowEventStream, CallbackMaySubscribeToSameStream) {
    WorkflowEventStream stream("wf-test");
    stream.append(step_event(1, WorkflowStatus::EXECUTING));

    std::vector<uint64_t> outer;
    std::vector<uint64_t> nested;
    bool subscribed = false;
    stream.subscribe([&](const WorkflowEvent& event) {
        outer.push_back(event.sequence);
        if (!subscribed) {
            subscribed = true;
            stream.subscribe([&](const WorkflowEvent& inner) { nested.push_back(inner.sequence); });
        }
    });

    stream.append(step_event(1, WorkflowStatus::FAILED));
    EXPECT_EQ(outer, (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(nested, (std::vector<uint64_t>{1, 2}));
}

TEST(WorkflowEventStream, CallbackMayAppendWithoutReordering) {
    WorkflowEventStream stream("wf-test");

    std::vector<uint64_t> first;
    std::vector<uint64_t> second;
    stream.subscribe([&](const WorkflowEvent& event) {
        first.push_back(event.sequence);
        if (event.sequence == 1) {
            EXPECT_TRUE(stream.append(step_event(1, WorkflowStatus::FAILED)));
        }
    });
    stream.subscribe([&](const WorkflowEvent& event) { second.push_back(event.sequence); });

    stream.append(step_event(1, WorkflowStatus::EXECUTING));
    EXPECT_EQ(stream.size(), 2u);
    EXPECT_EQ(first, (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(second, (std::vector<uint64_t>{1, 2}));
}

TEST(WorkflowEventStream, ConcurrentAppendsReachSubscriberInOrder) {
    WorkflowEventStream stream("wf-test");
    std::vector<uint64_t> seen;
    stream.subscribe([&](const WorkflowEvent& event) {
        seen.push_back(event.sequence);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([&] {
            for (int i = 0; i < 10; i++) {
                stream.append(step_event(1, WorkflowStatus::EXECUTING));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    ASSERT_EQ(stream.size(), 40u);
    std::vector<uint64_t> expected;
    for (uint64_t seq = 1; seq <= 40; seq++) {
        expected.push_back(seq);
    }
    // Whichever writer dispatches drains the queue before returning
    EXPECT_EQ(seen, expected);
}

TEST(WorkflowEventStream, ClosedStreamRejectsAppends) {
    WorkflowEventStream stream("wf-test");
    stream.append(step_event(1, WorkflowStatus::COMPLETED));
    stream.close();

    EXPECT_TRUE(stream.is_closed());
    EXPECT_FALSE(stream.append(step_event(2, WorkflowStatus::EXECUTING)));
    EXPECT_EQ(stream.size(), 1u);
}

TEST(WorkflowEventStream, EventJsonShape) {
    WorkflowEventStream stream("wf-7");

    WorkflowEvent start;
    start.type = EVENT_TYPE_START;
    start.language = "python";
    start.detail = {{"session_id", "s1"}};
    stream.append(start);

    WorkflowEvent failed = step_event(1, WorkflowStatus::FAILED);
    codeloop::runtime::ExecutionResult result;
    result.outcome = codeloop::runtime::ExecOutcome::TIMEOUT;
    result.exit_code = 124;
    result.stderr_text = "slow";
    failed.result = result;
    failed.error = "timeout: execution exceeded 100 ms";
    stream.append(failed);

    auto entries = stream.entries();
    auto j0 = entries[0].to_json();
    EXPECT_EQ(j0["type"], "start");
    EXPECT_EQ(j0["sequence"], 1);
    EXPECT_EQ(j0["workflow_id"], "wf-7");
    EXPECT_EQ(j0["session_id"], "s1");
    EXPECT_FALSE(j0.contains("status"));

    auto j1 = entries[1].to_json();
    EXPECT_EQ(j1["type"], "workflow");
    EXPECT_EQ(j1["status"], "failed");
    EXPECT_EQ(j1["step"], 1);
    EXPECT_EQ(j1["kind"], "execute");
    EXPECT_EQ(j1["language"], "python");
    EXPECT_EQ(j1["result"]["outcome"], "timeout");
    EXPECT_EQ(j1["result"]["exit_code"], 124);
    EXPECT_EQ(j1["result"]["stderr"], "slow");
    EXPECT_EQ(j1["error"], "timeout: execution exceeded 100 ms");
    EXPECT_TRUE(j1["timestamp"].get<std::string>().back() == 'Z');
}

TEST(WorkflowEventStream, ExportJsonlHasOneObjectPerLine) {
    WorkflowEventStream stream("wf-test");
    stream.append(step_event(1, WorkflowStatus::EXECUTING));
    stream.append(step_event(1, WorkflowStatus::COMPLETED));

    std::istringstream in(stream.export_jsonl());
    std::string line;
    uint64_t expected = 1;
    while (std::getline(in, line)) {
        auto j = nlohmann::json::parse(line);
        EXPECT_EQ(j["sequence"], expected++);
    }
    EXPECT_EQ(expected, 3u);
}
