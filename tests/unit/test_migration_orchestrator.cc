/**
 * @file test_migration_orchestrator.cc
 * @brief Unit tests for MigrationOrchestrator run sequencing
 */

#include "fakes.h"
#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/transfer/migration_orchestrator.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace handover::core::test {

namespace {

int PercentValue(const std::string& percentage) {
    return std::stoi(percentage.substr(0, percentage.size() - 1));
}

} // namespace

class MigrationOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        manifest_.type = MigrationOptionType::kAdvanced;
        timing_ = SamplerTiming{
            .first_sample_delay = std::chrono::milliseconds(5),
            .sample_interval = std::chrono::milliseconds(5),
        };
    }

    std::unique_ptr<MigrationOrchestrator> MakeOrchestrator() {
        auto orchestrator = std::make_unique<MigrationOrchestrator>(ioc_,
                                                                    channel_,
                                                                    sink_,
                                                                    manifest_,
                                                                    timing_);
        orchestrator->SetFeedbackCallback([this](Feedback&& message) {
            if (message.type == FeedbackType::kProgressUpdated) {
                snapshots_.push_back(message.payload<ProgressSnapshot>());
            } else if (message.type == FeedbackType::kPhaseChanged) {
                phases_.push_back(message.payload<feedback::PhaseChanged>().phase);
            } else if (message.type == FeedbackType::kRunFinished) {
                ++runs_finished_;
            }
        });
        return orchestrator;
    }

    void RunOnce(MigrationOrchestrator& orchestrator) {
        orchestrator.Start();
        orchestrator.OnPeerReady(true);
        ioc_.run();
    }

    boost::asio::io_context ioc_;
    FakeTransferChannel channel_;
    RecordingReportSink sink_;
    Manifest manifest_;
    SamplerTiming timing_{};
    std::vector<ProgressSnapshot> snapshots_;
    std::vector<RunPhase> phases_;
    int runs_finished_ = 0;
};

TEST_F(MigrationOrchestratorTest, ResumesAfterAlreadySentItems) {
    manifest_.files = {
        MakeItem("/src/a", 10),
        MakeItem("/src/b", 20, ItemKind::kFile, true),
        MakeItem("/src/c", 30),
    };
    manifest_.total_size = 61;
    manifest_.total_files = 3;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(channel_.sent, (std::vector<std::string>{"/src/a", "/src/c"}));
    EXPECT_EQ(orchestrator->counters().bytes_sent, 61);
    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);

    ASSERT_FALSE(snapshots_.empty());
    EXPECT_EQ(snapshots_.back().percentage, "100%");
    EXPECT_DOUBLE_EQ(snapshots_.back().fraction, 1.0);

    auto first_complete = std::find_if(snapshots_.begin(), snapshots_.end(), [](const auto& s) {
        return s.percentage == "100%";
    });
    int previous = 0;
    for (auto it = snapshots_.begin(); it != first_complete; ++it) {
        int value = PercentValue(it->percentage);
        EXPECT_GE(value, previous);
        EXPECT_LT(value, 100);
        EXPECT_LT(it->fraction, 1.0);
        previous = value;
    }
    for (auto it = first_complete; it != snapshots_.end(); ++it) {
        EXPECT_EQ(it->percentage, "100%");
    }
    EXPECT_EQ(sink_.ends, 1);
    EXPECT_EQ(runs_finished_, 1);
}

TEST_F(MigrationOrchestratorTest, BytesStartAtResumeOffset) {
    manifest_.files = {
        MakeItem("/src/a", 10),
        MakeItem("/src/b", 20, ItemKind::kFile, true),
        MakeItem("/src/c", 30),
    };
    manifest_.total_size = 61;

    std::vector<std::int64_t> observed;
    auto orchestrator = MakeOrchestrator();
    channel_.on_send = [&](const TransferItem&) {
        observed.push_back(orchestrator->counters().bytes_sent);
    };
    RunOnce(*orchestrator);

    EXPECT_EQ(observed, (std::vector<std::int64_t>{21, 31}));
}

TEST_F(MigrationOrchestratorTest, FinalizationFailureKeepsProgressBelowComplete) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;
    channel_.fail_completion = true;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(orchestrator->phase(), RunPhase::kFinalizing);
    EXPECT_EQ(sink_.ends, 0);
    EXPECT_EQ(runs_finished_, 0);
    for (const auto& snapshot : snapshots_) {
        EXPECT_NE(snapshot.percentage, "100%");
        EXPECT_LT(snapshot.fraction, 1.0);
    }
    EXPECT_EQ(orchestrator->Snapshot().percentage, "99%");
}

TEST_F(MigrationOrchestratorTest, PeerReadyAfterFailedFinalizationStartsNewRun) {
    manifest_.files = {MakeItem("/src/a", 10), MakeItem("/src/b", 5)};
    manifest_.total_size = 16;
    channel_.fail_completion = true;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);
    ASSERT_EQ(orchestrator->phase(), RunPhase::kFinalizing);
    ASSERT_EQ(channel_.sent.size(), 2u);

    channel_.fail_completion = false;
    orchestrator->OnPeerReady(true);
    ioc_.restart();
    ioc_.run();

    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);
    EXPECT_EQ(channel_.sent.size(), 2u);
    EXPECT_EQ(orchestrator->Snapshot().percentage, "100%");
    EXPECT_EQ(sink_.ends, 1);
}

TEST_F(MigrationOrchestratorTest, SkipsUnselectedAndSentItems) {
    manifest_.files = {
        MakeItem("/src/unselected", 10, ItemKind::kFile, false, false),
        MakeItem("/src/sent", 10, ItemKind::kFile, true),
        MakeItem("/src/pending", 10),
    };
    manifest_.apps = {
        MakeItem("/apps/Old.app", 10, ItemKind::kApplication, true),
        MakeItem("/apps/New.app", 10, ItemKind::kApplication),
    };
    manifest_.total_size = 41;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(channel_.sent, (std::vector<std::string>{"/src/pending", "/apps/New.app"}));
    EXPECT_FALSE(manifest_.files[0].sent);
    EXPECT_TRUE(manifest_.files[2].sent);
    EXPECT_TRUE(manifest_.apps[1].sent);
}

TEST_F(MigrationOrchestratorTest, FailedItemDoesNotStopLaterItems) {
    manifest_.files = {MakeItem("/src/a", 10), MakeItem("/src/b", 10)};
    manifest_.apps = {MakeItem("/apps/A.app", 10, ItemKind::kApplication)};
    manifest_.total_size = 31;
    channel_.failing_paths = {"/src/a"};

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(channel_.sent, (std::vector<std::string>{"/src/b", "/apps/A.app"}));
    EXPECT_FALSE(manifest_.files[0].sent);
    EXPECT_TRUE(manifest_.files[1].sent);
    ASSERT_EQ(sink_.errors.size(), 1u);
    EXPECT_NE(sink_.errors[0].find("/src/a"), std::string::npos);
    EXPECT_EQ(sink_.migrated_files, (std::vector<std::string>{"/src/b"}));
    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);
}

TEST_F(MigrationOrchestratorTest, AppFailuresAreNotReported) {
    manifest_.apps = {MakeItem("/apps/A.app", 10, ItemKind::kApplication),
                      MakeItem("/apps/B.app", 10, ItemKind::kApplication)};
    manifest_.total_size = 21;
    channel_.failing_paths = {"/apps/A.app"};

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_TRUE(sink_.errors.empty());
    EXPECT_TRUE(sink_.migrated_files.empty());
    EXPECT_EQ(channel_.sent, (std::vector<std::string>{"/apps/B.app"}));
    EXPECT_FALSE(manifest_.apps[0].sent);
}

TEST_F(MigrationOrchestratorTest, CancelStopsDispatch) {
    manifest_.files = {MakeItem("/src/a", 10), MakeItem("/src/b", 10), MakeItem("/src/c", 10)};
    manifest_.total_size = 31;

    auto orchestrator = MakeOrchestrator();
    channel_.on_send = [&](const TransferItem&) { orchestrator->Cancel(); };
    RunOnce(*orchestrator);

    EXPECT_EQ(channel_.sent, (std::vector<std::string>{"/src/a"}));
    EXPECT_EQ(orchestrator->phase(), RunPhase::kAborted);
    EXPECT_EQ(channel_.completion_signals, 0);
    EXPECT_EQ(sink_.ends, 0);
    EXPECT_FALSE(orchestrator->start_time().has_value());
}

TEST_F(MigrationOrchestratorTest, CancelBeforePeerReadyAborts) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    orchestrator->Start();
    orchestrator->Cancel();
    orchestrator->OnPeerReady(true);
    ioc_.run();

    EXPECT_TRUE(channel_.sent.empty());
    EXPECT_EQ(orchestrator->phase(), RunPhase::kAborted);
}

TEST_F(MigrationOrchestratorTest, DuplicatePeerReadyIsIgnored) {
    manifest_.files = {MakeItem("/src/a", 10), MakeItem("/src/b", 10)};
    manifest_.total_size = 21;

    auto orchestrator = MakeOrchestrator();
    orchestrator->Start();
    orchestrator->OnPeerReady(true);
    orchestrator->OnPeerReady(true);
    ioc_.run();

    EXPECT_EQ(channel_.sent.size(), 2u);
    EXPECT_EQ(sink_.starts, 1);
    EXPECT_EQ(std::count(phases_.begin(), phases_.end(), RunPhase::kPreparing), 1);

    orchestrator->OnPeerReady(true);
    ioc_.restart();
    ioc_.run();
    EXPECT_EQ(channel_.sent.size(), 2u);
    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);
}

TEST_F(MigrationOrchestratorTest, PeerNotReadyDoesNothing) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    orchestrator->Start();
    orchestrator->OnPeerReady(false);
    ioc_.run();

    EXPECT_TRUE(channel_.sent.empty());
    EXPECT_EQ(orchestrator->phase(), RunPhase::kNotStarted);
    EXPECT_EQ(channel_.announced_size, 11);
}

TEST_F(MigrationOrchestratorTest, PhasesFollowRunOrder) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(phases_,
              (std::vector<RunPhase>{RunPhase::kPreparing,
                                     RunPhase::kSendingFiles,
                                     RunPhase::kSendingApps,
                                     RunPhase::kFinalizing,
                                     RunPhase::kCompleted}));
    EXPECT_TRUE(orchestrator->start_time().has_value());
}

TEST_F(MigrationOrchestratorTest, SendsSkipRebootFlagWithoutPreferences) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    ASSERT_EQ(channel_.default_flags.size(), 1u);
    EXPECT_EQ(channel_.default_flags[0].first, "skipDeviceReboot");
    EXPECT_TRUE(channel_.default_flags[0].second);
}

TEST_F(MigrationOrchestratorTest, NoSkipRebootFlagWhenPreferencesMigrate) {
    manifest_.type = MigrationOptionType::kComplete;
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_TRUE(channel_.default_flags.empty());
}

TEST_F(MigrationOrchestratorTest, PreliminaryFailuresAreIgnored) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;
    channel_.fail_migration_size = true;
    channel_.fail_default_flag = true;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(channel_.sent.size(), 1u);
    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);
}

TEST_F(MigrationOrchestratorTest, RecordsStartAndTotalSize) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(sink_.starts, 1);
    EXPECT_EQ(sink_.total_size, 11);
    EXPECT_EQ(sink_.migrated_files, (std::vector<std::string>{"/src/a"}));
}

TEST_F(MigrationOrchestratorTest, PowerStateIsForwarded) {
    auto orchestrator = MakeOrchestrator();
    EXPECT_TRUE(orchestrator->Snapshot().power_connected);

    orchestrator->OnPowerStateChanged(false);
    EXPECT_FALSE(orchestrator->Snapshot().power_connected);
    ASSERT_FALSE(snapshots_.empty());
    EXPECT_FALSE(snapshots_.back().power_connected);

    orchestrator->OnPowerStateChanged(true);
    EXPECT_TRUE(orchestrator->Snapshot().power_connected);
}

TEST_F(MigrationOrchestratorTest, InterfaceLabelFollowsChannel) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;
    channel_.interface_type = InterfaceType::kWiredEthernet;

    auto orchestrator = MakeOrchestrator();
    RunOnce(*orchestrator);

    EXPECT_EQ(orchestrator->Snapshot().interface_label, "Thunderbolt");
}

TEST_F(MigrationOrchestratorTest, RunFinishedHookRunsOnCompletion) {
    manifest_.files = {MakeItem("/src/a", 10)};
    manifest_.total_size = 11;

    int hook_calls = 0;
    auto orchestrator = MakeOrchestrator();
    orchestrator->SetRunFinishedHook([&hook_calls]() { ++hook_calls; });
    RunOnce(*orchestrator);

    EXPECT_EQ(hook_calls, 1);
}

TEST_F(MigrationOrchestratorTest, FeedbackIsNeverEnteredConcurrently) {
    for (int i = 0; i < 200; ++i) {
        manifest_.files.push_back(MakeItem("/src/f" + std::to_string(i), 1));
    }
    manifest_.total_size = 1'000'000;

    std::atomic<bool> inside{false};
    std::atomic<bool> overlapped{false};
    auto orchestrator = MakeOrchestrator();
    orchestrator->SetFeedbackCallback([&](Feedback&&) {
        if (inside.exchange(true)) {
            overlapped = true;
        }
        std::this_thread::yield();
        inside = false;
    });
    orchestrator->Start();
    orchestrator->OnPeerReady(true);

    // Progress from a transport thread while the io_context thread moves through the run
    std::atomic<bool> done{false};
    std::thread notifier([&]() {
        while (!done) {
            channel_.NotifyBytesSent(1);
        }
    });
    ioc_.run();
    done = true;
    notifier.join();

    EXPECT_EQ(orchestrator->phase(), RunPhase::kCompleted);
    EXPECT_FALSE(overlapped);
}

} // namespace handover::core::test
