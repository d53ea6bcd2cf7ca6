/**
 * @file MockServices.hpp
 * @brief Mock implementations of the collaborators a save session talks to
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "persistence/IDurableStore.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/SaveTypes.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Tether {
namespace Test {

// =============================================================================
// MockRemoteStore
// =============================================================================

/**
 * @brief Remote save contract whose results are scripted per test
 */
class MockRemoteStore {
public:
    MOCK_METHOD(SaveResult, Save, (const SaveRequest& request), ());

    SaveFunction AsSaveFunction() {
        return [this](const SaveRequest& request) { return Save(request); };
    }
};

// =============================================================================
// MockSaveObserver
// =============================================================================

class MockSaveObserver : public ISaveObserver {
public:
    MOCK_METHOD(void, OnStateChanged, (SaveState from, SaveState to), (override));
    MOCK_METHOD(void, OnConflict, (const ConflictCase& conflict), (override));
    MOCK_METHOD(void, OnSyncStalled, (const ReplayReport& report), (override));
    MOCK_METHOD(void, OnManualSaveResult, (const SaveOutcome& outcome), (override));
};

// =============================================================================
// MockConflictResolver
// =============================================================================

class MockConflictResolver : public IConflictResolver {
public:
    MOCK_METHOD(std::optional<nlohmann::json>, Resolve, (const ConflictCase& conflict), (override));
};

// =============================================================================
// MockDurableStore
// =============================================================================

/**
 * @brief Store mock for checking exact storage traffic
 */
class MockDurableStore : public IDurableStore {
public:
    MOCK_METHOD(std::optional<std::string>, Get, (const std::string& key), (override));
    MOCK_METHOD(bool, Set, (const std::string& key, const std::string& value), (override));
    MOCK_METHOD(bool, Remove, (const std::string& key), (override));
    MOCK_METHOD(std::vector<std::string>, Keys, (const std::string& prefix), (override));
};

// =============================================================================
// RecordingObserver
// =============================================================================

/**
 * @brief Observer fake that keeps everything it is told, in order
 */
class RecordingObserver : public ISaveObserver {
public:
    void OnStateChanged(SaveState from, SaveState to) override {
        transitions.emplace_back(from, to);
        states.push_back(to);
    }

    void OnConflict(const ConflictCase& conflict) override {
        conflicts.push_back(conflict);
    }

    void OnSyncStalled(const ReplayReport& report) override {
        stalls.push_back(report);
    }

    void OnManualSaveResult(const SaveOutcome& outcome) override {
        manualResults.push_back(outcome);
    }

    [[nodiscard]] bool Saw(SaveState state) const {
        return std::find(states.begin(), states.end(), state) != states.end();
    }

    std::vector<std::pair<SaveState, SaveState>> transitions;
    std::vector<SaveState> states;
    std::vector<ConflictCase> conflicts;
    std::vector<ReplayReport> stalls;
    std::vector<SaveOutcome> manualResults;
};

} // namespace Test
} // namespace Tether
