/**
 * @file test_save_session.cpp
 * @brief Tests for the caller facing save session
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sync/SaveSession.hpp"

#include "utils/TestFixtures.hpp"

#include <stdexcept>
#include <vector>

using namespace Tether;
using namespace Tether::Test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using nlohmann::json;

class SaveSessionTest : public AutoSaveTestFixture {};

// =============================================================================
// Construction
// =============================================================================

TEST_F(SaveSessionTest, ConstructorRejectsMissingInputs) {
    SaveSession::Dependencies deps;
    deps.scheduler = &scheduler;
    deps.store = &store;

    EXPECT_THROW(SaveSession("", remote.AsSaveFunction(), deps), std::invalid_argument);
    EXPECT_THROW(SaveSession(kStorageKey, nullptr, deps), std::invalid_argument);

    deps.store = nullptr;
    EXPECT_THROW(SaveSession(kStorageKey, remote.AsSaveFunction(), deps), std::invalid_argument);
}

TEST_F(SaveSessionTest, InvalidConfigThrows) {
    config.retryDelay = Milliseconds(-1);

    EXPECT_THROW(MakeSession(), std::invalid_argument);
}

TEST_F(SaveSessionTest, RegistersForConnectivityWhileAlive) {
    {
        auto session = MakeSession();
        EXPECT_EQ(1u, connectivity.GetListenerCount());
    }
    EXPECT_EQ(0u, connectivity.GetListenerCount());
}

TEST_F(SaveSessionTest, SessionDestroyedByEarlierListenerIsNotNotified) {
    class ClosingListener : public IConnectivityListener {
    public:
        explicit ClosingListener(std::unique_ptr<SaveSession>& session) : m_session(session) {}
        void OnConnectivityChanged(bool) override { m_session.reset(); }

    private:
        std::unique_ptr<SaveSession>& m_session;
    };

    std::unique_ptr<SaveSession> session;
    ClosingListener closer(session);
    connectivity.AddListener(&closer);
    session = MakeSession();
    ASSERT_EQ(2u, connectivity.GetListenerCount());

    connectivity.SetOnline(false);

    EXPECT_EQ(nullptr, session);
    EXPECT_EQ(1u, connectivity.GetListenerCount());
    connectivity.RemoveListener(&closer);
}

// =============================================================================
// UpdateData
// =============================================================================

TEST_F(SaveSessionTest, UpdateWithUnchangedDataIsNoOp) {
    EXPECT_CALL(remote, Save(_)).Times(0);
    auto session = MakeSession();
    session->SetBaseline(MakeRecord("Ada"), 1);

    session->UpdateData(MakeRecord("Ada"));
    scheduler.AdvanceBy(5000ms);

    EXPECT_EQ(SaveState::Idle, session->GetState());
    EXPECT_FALSE(session->HasPendingChanges());
    EXPECT_TRUE(observer.transitions.empty());
}

TEST_F(SaveSessionTest, RepeatedUpdateDoesNotRestartDebounce) {
    std::vector<Milliseconds> times;
    EXPECT_CALL(remote, Save(_)).WillOnce(Invoke([&](const SaveRequest&) {
        times.push_back(scheduler.Now());
        return SaveResult::Success(1);
    }));
    auto session = MakeSession();

    session->UpdateData(MakeRecord("Ada", 1));
    scheduler.AdvanceBy(600ms);
    session->UpdateData(MakeRecord("Ada", 1));
    scheduler.AdvanceBy(400ms);

    EXPECT_EQ((std::vector<Milliseconds>{1000ms}), times);
}

TEST_F(SaveSessionTest, RecoveryDataIsLatestUpdate) {
    auto session = MakeSession();

    session->UpdateData(MakeRecord("Ada", 1));
    session->UpdateData(MakeRecord("Ada", 2));

    EXPECT_EQ(std::optional<json>(MakeRecord("Ada", 2)), session->GetRecoveryData());
    EXPECT_TRUE(session->HasPendingChanges());
    EXPECT_TRUE(session->HasUnsavedChangesOnExit());
}

TEST_F(SaveSessionTest, RecoveryDataFromPreviousRun) {
    connectivity.SetOnline(false);
    {
        auto session = MakeSession();
        session->UpdateData(MakeRecord("draft"));
    }

    auto session = MakeSession();
    EXPECT_EQ(std::optional<json>(MakeRecord("draft")), session->GetRecoveryData());
    EXPECT_FALSE(session->HasPendingChanges());
}

// =============================================================================
// Host Events
// =============================================================================

TEST_F(SaveSessionTest, VisibilityLossSavesImmediately) {
    std::vector<Milliseconds> times;
    EXPECT_CALL(remote, Save(_)).WillOnce(Invoke([&](const SaveRequest& request) {
        times.push_back(scheduler.Now());
        EXPECT_EQ(MakeRecord("Ada", 1), request.data);
        return SaveResult::Success(1);
    }));
    auto session = MakeSession();

    session->UpdateData(MakeRecord("Ada", 1));
    scheduler.AdvanceBy(200ms);
    connectivity.SetVisible(false);
    scheduler.RunPending();

    EXPECT_EQ((std::vector<Milliseconds>{200ms}), times);
    EXPECT_EQ(SaveState::Saved, session->GetState());

    scheduler.AdvanceBy(5000ms);
    EXPECT_EQ(1u, times.size());
}

TEST_F(SaveSessionTest, VisibilityLossWithoutChangesDoesNothing) {
    EXPECT_CALL(remote, Save(_)).Times(0);
    auto session = MakeSession();

    connectivity.SetVisible(false);
    scheduler.RunPending();

    EXPECT_EQ(0u, scheduler.GetPendingCount());
}

TEST_F(SaveSessionTest, ReconnectReplaysQueue) {
    connectivity.SetOnline(false);
    auto session = MakeSession();
    session->UpdateData(MakeRecord("offline edit"));
    scheduler.AdvanceBy(1000ms);

    ASSERT_EQ(SaveState::Offline, session->GetState());
    ASSERT_EQ(1u, session->GetQueuedSaveCount());

    EXPECT_CALL(remote, Save(_)).WillOnce(Return(SaveResult::Success(1)));
    connectivity.SetOnline(true);
    scheduler.RunPending();

    EXPECT_EQ(0u, session->GetQueuedSaveCount());
    EXPECT_EQ(SaveState::Saved, session->GetState());
    EXPECT_FALSE(session->HasUnsavedChangesOnExit());
}

TEST_F(SaveSessionTest, ReconnectWithoutQueueSavesCurrentData) {
    config.enableOfflineQueue = false;
    connectivity.SetOnline(false);
    auto session = MakeSession();
    session->UpdateData(MakeRecord("offline edit"));
    scheduler.AdvanceBy(1000ms);
    ASSERT_EQ(SaveState::Offline, session->GetState());

    EXPECT_CALL(remote, Save(_)).WillOnce(Return(SaveResult::Success(1)));
    connectivity.SetOnline(true);
    scheduler.RunPending();

    EXPECT_EQ(SaveState::Saved, session->GetState());
}

// =============================================================================
// Explicit Saves
// =============================================================================

TEST_F(SaveSessionTest, ManualSaveReportsOutcome) {
    auto session = MakeSession();
    session->UpdateData(MakeRecord("Ada"));

    auto future = session->ManualSave();
    scheduler.RunPending();

    EXPECT_TRUE(future.get().Succeeded());
    ASSERT_EQ(1u, observer.manualResults.size());
    EXPECT_TRUE(observer.manualResults[0].Succeeded());
}

TEST_F(SaveSessionTest, ManualSaveReportsFailure) {
    EXPECT_CALL(remote, Save(_)).WillOnce(Return(SaveResult::ValidationFailure("HTTP 400")));
    auto session = MakeSession();
    session->UpdateData(MakeRecord("Ada"));

    session->ManualSave();
    scheduler.RunPending();

    ASSERT_EQ(1u, observer.manualResults.size());
    EXPECT_EQ(SaveState::Error, observer.manualResults[0].state);
    EXPECT_EQ("HTTP 400", observer.manualResults[0].message);
}

TEST_F(SaveSessionTest, ForceSaveWithNothingToSave) {
    EXPECT_CALL(remote, Save(_)).Times(0);
    auto session = MakeSession();

    auto future = session->ForceSave();

    ASSERT_TRUE(IsReady(future));
    EXPECT_EQ("nothing to save", future.get().message);
}

TEST_F(SaveSessionTest, ValidatorBlocksInvalidData) {
    EXPECT_CALL(remote, Save(_)).Times(0);
    auto session = MakeSession(nullptr, [](const json& data) -> std::optional<std::string> {
        if (!data.contains("name")) {
            return "missing name";
        }
        return std::nullopt;
    });

    session->UpdateData(json{{"bio", "no name"}});
    auto future = session->ForceSave();
    scheduler.RunPending();

    EXPECT_EQ(SaveState::Error, future.get().state);
    EXPECT_EQ(0u, session->GetQueuedSaveCount());
}

TEST_F(SaveSessionTest, RetryFailedSavesAfterExhaustedRetries) {
    EXPECT_CALL(remote, Save(_))
        .Times(4)
        .WillOnce(Return(SaveResult::TransientFailure("HTTP 503")))
        .WillOnce(Return(SaveResult::TransientFailure("HTTP 503")))
        .WillOnce(Return(SaveResult::TransientFailure("HTTP 503")))
        .WillOnce(Return(SaveResult::Success(1)));
    auto session = MakeSession();

    session->UpdateData(MakeRecord("Ada"));
    scheduler.AdvanceBy(60000ms);
    ASSERT_EQ(SaveState::Error, session->GetState());
    ASSERT_EQ(1u, session->GetQueuedSaveCount());

    auto report = session->RetryFailedSaves();
    scheduler.RunPending();

    EXPECT_TRUE(report.get().Succeeded());
    EXPECT_EQ(1u, report.get().succeeded);
    EXPECT_EQ(SaveState::Saved, session->GetState());
}

TEST_F(SaveSessionTest, RetryWithEmptyQueueReportsNothing) {
    auto session = MakeSession();

    auto report = session->RetryFailedSaves();
    scheduler.RunPending();

    EXPECT_EQ(0u, report.get().attempted);
    EXPECT_TRUE(report.get().Succeeded());
}

// =============================================================================
// Conflicts and Clearing
// =============================================================================

TEST_F(SaveSessionTest, ConflictResolvedByMergeResolver) {
    EXPECT_CALL(remote, Save(_))
        .WillOnce(Return(SaveResult::ConflictWith(json{{"avatar", "b.png"}}, 8)))
        .WillOnce(Invoke([](const SaveRequest& request) {
            EXPECT_EQ((json{{"avatar", "b.png"}, {"name", "Ada"}}), request.data);
            return SaveResult::Success(9);
        }));
    auto session = MakeSession(std::make_shared<JsonMergeResolver>());
    session->SetBaseline(json::object(), 7);

    session->UpdateData(json{{"name", "Ada"}});
    scheduler.AdvanceBy(1000ms);

    EXPECT_EQ(SaveState::Saved, session->GetState());
    EXPECT_FALSE(session->GetConflict().has_value());
    EXPECT_EQ(1u, observer.conflicts.size());
}

TEST_F(SaveSessionTest, ConflictResolvedByCaller) {
    EXPECT_CALL(remote, Save(_))
        .WillOnce(Return(SaveResult::ConflictWith(MakeRecord("theirs"), 3)))
        .WillOnce(Return(SaveResult::Success(4)));
    auto session = MakeSession();

    session->UpdateData(MakeRecord("mine"));
    scheduler.AdvanceBy(1000ms);
    ASSERT_EQ(SaveState::Conflict, session->GetState());
    ASSERT_TRUE(session->GetConflict().has_value());

    auto outcome = session->ResolveConflict(MakeRecord("both"));
    scheduler.RunPending();

    EXPECT_TRUE(outcome.get().Succeeded());
    EXPECT_EQ(std::optional<json>(MakeRecord("both")), session->GetRecoveryData());
}

TEST_F(SaveSessionTest, ClearPendingChangesReturnsToIdle) {
    EXPECT_CALL(remote, Save(_)).Times(0);
    auto session = MakeSession();
    session->UpdateData(MakeRecord("Ada"));

    session->ClearPendingChanges();
    scheduler.AdvanceBy(5000ms);

    EXPECT_EQ(SaveState::Idle, session->GetState());
    EXPECT_FALSE(session->HasUnsavedChangesOnExit());

    session->UpdateData(MakeRecord("Ada"));
    EXPECT_FALSE(session->HasPendingChanges());
}

TEST_F(SaveSessionTest, SessionsWithDifferentKeysShareStore) {
    auto first = MakeSession();

    SaveSession::Dependencies deps;
    deps.scheduler = &scheduler;
    deps.store = &store;
    deps.connectivity = &connectivity;
    SaveSession second("settings-42", remote.AsSaveFunction(), deps, config);

    first->UpdateData(MakeRecord("profile"));
    second.UpdateData(MakeRecord("settings"));

    EXPECT_EQ(2u, store.Keys(config.storageKeyPrefix + "_").size());
    EXPECT_EQ(std::optional<json>(MakeRecord("settings")), second.GetRecoveryData());

    scheduler.AdvanceBy(1000ms);
    EXPECT_EQ(SaveState::Saved, first->GetState());
    EXPECT_EQ(SaveState::Saved, second.GetState());
}
