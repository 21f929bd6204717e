// Simulates one scheduled run of a watcher task: load the previous snapshot,
// compare, and store the new one.
//
//   result_store_demo [manifest] [task_id] [command_id]
#include <trs/core/id_generator.hpp>
#include <trs/per/result_store.hpp>
#include <persistency/storage_registry.hpp>
#include "log.hpp"
#include "sinks_console.hpp"
#ifdef TRS_HAVE_DLT
#  include "sinks_dlt.hpp"
#endif

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace {

struct Snapshot {
    std::string run_id;
    int run_count{0};
    long long saved_at_ms{0};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Snapshot, run_id, run_count, saved_at_ms)

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

int main(int argc, char** argv) {
    using namespace trs::log;

    const std::string manifest = argc > 1 ? argv[1] : "manifests/result_store.json";
    const std::string task_id  = Trim(argc > 2 ? argv[2] : "NaverShopping");
    const std::string cmd_id   = Trim(argc > 3 ? argv[3] : "WatchPrice_Any");

    LogManager::Instance().SetAppId("TRSD");
    LogManager::Instance().AddSink(std::make_shared<ConsoleSink>());
#ifdef TRS_HAVE_DLT
    LogManager::Instance().AddSink(std::make_shared<DltSink>("Result store demo"));
#endif

    auto& reg = persistency::StorageRegistry::Instance();
    if (auto r = reg.InitFromFile(manifest); !r) {
        auto log = Logger::CreateLogger("MAIN");
        TRS_LOGFATAL(log, "cannot load manifest {}: {}", manifest, r.Error().ToString());
        return EXIT_FAILURE;
    }
    if (auto lvl = reg.LogLevel()) {
        LogManager::Instance().SetDefaultLevel(*lvl);
    }
    auto log = Logger::CreateLogger("MAIN");

    if (task_id.empty() || cmd_id.empty()) {
        TRS_LOGERROR(log, "task id and command id must not be blank");
        return EXIT_FAILURE;
    }

    auto h = trs::per::OpenResultStore(trs::core::InstanceSpecifier{"Task/Results"});
    if (!h) {
        TRS_LOGFATAL(log, "cannot open result store: {}", h.Error().ToString());
        return EXIT_FAILURE;
    }
    auto store = h.Value();

    Snapshot prev;
    auto loaded = store->Load(task_id, cmd_id, &prev);
    if (!loaded && !loaded.Error().Is(trs::core::StoreErrc::kNotFound)) {
        TRS_LOGERROR(log, "cannot load previous snapshot: {}", loaded.Error().ToString());
        return EXIT_FAILURE;
    }
    if (loaded) {
        TRS_LOGINFO(log, "previous run {} (#{})", prev.run_id, prev.run_count);
    } else {
        TRS_LOGINFO(log, "first run for {}/{}", task_id, cmd_id);
    }

    trs::core::IdGenerator ids;
    Snapshot next;
    next.run_id = ids.Next();
    next.run_count = prev.run_count + 1;
    next.saved_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    if (auto r = store->Save(task_id, cmd_id, next); !r) {
        TRS_LOGERROR(log, "cannot save snapshot: {}", r.Error().ToString());
        return EXIT_FAILURE;
    }
    TRS_LOGINFO(log, "saved run {} (#{}) under {}", next.run_id, next.run_count, store->BaseDir());
    return EXIT_SUCCESS;
}
