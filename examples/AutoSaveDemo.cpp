#include "config/AutoSaveConfig.hpp"
#include "core/Logger.hpp"
#include "core/TaskScheduler.hpp"
#include "persistence/SQLiteStore.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/ConnectivityMonitor.hpp"
#include "sync/SaveSession.hpp"

#include <chrono>
#include <mutex>
#include <thread>

namespace {

/**
 * @brief In-process stand-in for a versioned document service
 *
 * Fails every third request with a transient error and reports a conflict
 * when the caller's expected version is stale.
 */
class SimulatedRemote {
public:
    Tether::SaveResult Save(const Tether::SaveRequest& request) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        std::lock_guard<std::mutex> lock(m_mutex);
        if (++m_requests % 3 == 0) {
            return Tether::SaveResult::TransientFailure("HTTP 503");
        }
        if (request.expectedVersion && *request.expectedVersion != m_version) {
            return Tether::SaveResult::ConflictWith(m_document, m_version);
        }

        m_document = request.data;
        ++m_version;
        spdlog::info("Remote stored '{}' at version {}", request.storageKey, m_version);
        return Tether::SaveResult::Success(m_version);
    }

    // Simulates an edit made from another device
    void EditElsewhere(const nlohmann::json& patch) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_document.merge_patch(patch);
        ++m_version;
    }

private:
    std::mutex m_mutex;
    nlohmann::json m_document = nlohmann::json::object();
    uint64_t m_version = 0;
    uint64_t m_requests = 0;
};

class ConsoleObserver : public Tether::ISaveObserver {
public:
    void OnStateChanged(Tether::SaveState from, Tether::SaveState to) override {
        spdlog::info("Save state {} -> {}", Tether::ToString(from), Tether::ToString(to));
    }

    void OnConflict(const Tether::ConflictCase& conflict) override {
        spdlog::warn("Conflict, remote is now {}", conflict.remoteData.dump());
    }

    void OnSyncStalled(const Tether::ReplayReport& report) override {
        spdlog::error("Sync stalled with {} item(s) left: {}", report.remaining, report.error);
    }
};

} // namespace

/**
 * @brief Walks a profile editor through debounced saves, an offline spell
 * and a conflicting edit from another device
 *
 * Usage: tether_demo [config.json]
 */
int main(int argc, char* argv[]) {
    Tether::Logger::Initialize("tether_demo.log");
    Tether::Logger::SetLevel(spdlog::level::debug);

    Tether::AutoSaveConfig config;
    config.debounce = std::chrono::milliseconds(300);
    config.retryDelay = std::chrono::milliseconds(200);
    if (argc > 1) {
        auto loaded = Tether::LoadAutoSaveConfigFile(argv[1]);
        if (!loaded) {
            spdlog::critical("Failed to load config {}: {}", argv[1], Tether::ToString(loaded.error()));
            return -1;
        }
        config = *loaded;
    }

    Tether::SQLiteStore::Config storeConfig;
    storeConfig.databasePath = "tether_demo.db";
    Tether::SQLiteStore store(storeConfig);
    if (!store.Open()) {
        spdlog::critical("Failed to open {}", storeConfig.databasePath);
        return -1;
    }

    Tether::ThreadTaskScheduler scheduler;
    Tether::ConnectivityMonitor connectivity;
    SimulatedRemote remote;
    ConsoleObserver observer;

    Tether::SaveSession::Dependencies deps;
    deps.scheduler = &scheduler;
    deps.store = &store;
    deps.connectivity = &connectivity;
    deps.observer = &observer;
    deps.resolver = std::make_shared<Tether::JsonMergeResolver>();

    Tether::SaveSession session("profile-42",
                                [&remote](const Tether::SaveRequest& request) { return remote.Save(request); },
                                std::move(deps), config);

    if (auto recovered = session.GetRecoveryData()) {
        spdlog::info("Recovered unsaved profile from last run: {}", recovered->dump());
        session.UpdateData(*recovered);
    }

    // Typing burst, coalesced into one save
    for (int i = 1; i <= 5; ++i) {
        session.UpdateData({{"name", "Ada"}, {"bio", std::string("Mathematician").substr(0, i * 3)}});
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    session.ForceSave().wait();

    // Offline edits are queued, then replayed on reconnect
    connectivity.SetOnline(false);
    session.UpdateData({{"name", "Ada Lovelace"}, {"bio", "Mathematician"}});
    std::this_thread::sleep_for(config.debounce + std::chrono::milliseconds(200));
    spdlog::info("{} save(s) queued while offline", session.GetQueuedSaveCount());
    connectivity.SetOnline(true);
    session.RetryFailedSaves().wait();

    // Another device changes the record, the next save merges
    remote.EditElsewhere({{"avatar", "ada.png"}});
    session.UpdateData({{"name", "Ada Lovelace"}, {"bio", "Mathematician and writer"}});
    Tether::SaveOutcome outcome = session.ManualSave().get();

    spdlog::info("Final state {} ({}), unsaved on exit: {}",
                 Tether::ToString(session.GetState()), outcome.message,
                 session.HasUnsavedChangesOnExit());

    Tether::Logger::Shutdown();
    return 0;
}
