// ============================================================================
// Example 02: Conversion Server
// ============================================================================
//
// This example runs the whole engine behind the TCP transport:
// 1. Reads settings from an optional "key=value" file
// 2. Serves requests and event groups on net.host:net.port
// 3. Runs a simulated transcoder: it subscribes to the hub like any other
//    connection, picks up every TaskCreated event and reports progress
//    every 300ms until the task completes (or fails, if its name contains
//    "fail")
//
// RUN:
//   cd build && ./examples/02_conversion_server [settings-file] [seconds]
//
// TEST WITH:
//   ./examples/03_watch_client
//   or by hand:
//   echo '{"type":"Request","requestId":1,"op":"GetSpaceUsage","args":{}}' | nc localhost 7300
//
// ============================================================================

#include "convq/core/detached_task.hpp"
#include "convq/core/settings.hpp"
#include "convq/core/task.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/timer.hpp"
#include "convq/net/connection_manager.hpp"
#include "convq/service/engine_context.hpp"
#include "convq/service/request_dispatcher.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

using namespace convq;
using namespace std::chrono_literals;

namespace {

constexpr const char* kWorkerConnection = "worker";

// Stands in for the external transcoder
Task<void> SimulateConversion(EngineContext& engine, TaskId id, std::string name) {
    if (auto begun = engine.BeginConversion(id); begun.IsErr()) {
        std::cout << "[Worker] " << id << " not started: " << begun.Error().message << std::endl;
        co_return;
    }

    const bool doomed = name.find("fail") != std::string::npos;
    for (int progress = 10; progress <= 100; progress += 10) {
        co_await AsyncSleep(300ms);
        if (doomed && progress == 60) {
            engine.ReportFailed(id, "simulated encoder error at 60%");
            std::cout << "[Worker] " << id << " failed" << std::endl;
            co_return;
        }
        auto eta = std::chrono::seconds((100 - progress) * 3 / 10);
        if (auto reported = engine.ReportProgress(id, progress, 1.0 + progress / 100.0, eta); reported.IsErr()) {
            // Cancelled or deleted underneath us
            std::cout << "[Worker] " << id << " stopped: " << reported.Error().message << std::endl;
            co_return;
        }
    }
    if (engine.ReportCompleted(id).IsOk()) {
        std::cout << "[Worker] " << id << " completed" << std::endl;
    }
}

Task<void> WorkerLoop(EngineContext& engine, std::shared_ptr<Outbox> inbox) {
    while (true) {
        auto event = co_await inbox->Receive();
        if (!event) {
            break;
        }
        if ((*event)->kind != EventKind::Created) {
            continue;
        }
        const ConversionTask* task = (*event)->TaskSnapshot();
        std::cout << "[Worker] picked up " << task->id << " '" << task->name << "'" << std::endl;
        auto job = MakeDetached(SimulateConversion(engine, task->id, task->name));
        job.Start();
    }
}

Task<void> RunServer(LibuvExecutor& executor, EngineContext& engine, RequestDispatcher& dispatcher,
                     std::chrono::seconds run_for) {
    const EngineConfig& config = engine.Config();

    ConnectionManager::Options options;
    options.host = config.host;
    options.port = config.port;
    options.ping_interval = config.ping_interval;
    options.pong_timeout = config.pong_timeout;
    options.outbox_capacity = config.outbox_capacity;

    ConnectionManager server(executor, engine.Hub(), &dispatcher, options);
    if (auto ec = server.Start()) {
        std::cout << "[Server] Failed to start: " << ec.message() << std::endl;
        executor.Stop();
        co_return;
    }

    auto inbox = std::make_shared<Outbox>(config.outbox_capacity, &executor);
    if (auto added = engine.Hub().AddConnection(kWorkerConnection, inbox); added.IsErr()) {
        std::cout << "[Server] Worker not registered: " << added.Error().message << std::endl;
    }
    auto worker = MakeDetached(WorkerLoop(engine, inbox));
    worker.Start();

    std::cout << "[Server] Listening on " << options.host << ":" << server.Port() << " for " << run_for.count()
              << "s" << std::endl;

    co_await AsyncSleep(run_for);

    std::cout << "[Server] Shutting down" << std::endl;
    engine.Hub().RemoveConnection(kWorkerConnection);
    server.Stop();

    // Let the closed connections' writers observe their outboxes
    co_await AsyncSleep(50ms);
    executor.Stop();
}

}  // namespace

int main(int argc, char** argv) {
    std::cout << "=== convq Example 02: Conversion Server ===" << std::endl;
    std::cout << std::endl;

    std::unique_ptr<SettingsStore> store;
    if (argc > 1) {
        auto opened = FileSettingsStore::Open(argv[1]);
        if (opened.IsErr()) {
            std::cerr << "cannot read " << argv[1] << ": " << opened.Error().message() << std::endl;
            return 1;
        }
        store = std::move(opened).Value();
    } else {
        store = std::make_unique<MemorySettingsStore>();
    }
    std::chrono::seconds run_for(argc > 2 ? std::atoi(argv[2]) : 60);

    Settings settings(*store);
    EngineDependencies deps;
    deps.settings = store.get();

    auto created = EngineContext::Create(EngineConfig::FromSettings(settings), deps);
    if (created.IsErr()) {
        std::cerr << "invalid configuration: " << created.Error().message << std::endl;
        return 1;
    }
    auto engine = std::move(created).Value();
    if (auto init = engine->Init(); init.IsErr()) {
        std::cerr << "init failed: " << init.Error().message << std::endl;
        return 1;
    }
    RequestDispatcher dispatcher(*engine);

    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    auto server = RunServer(executor, *engine, dispatcher, run_for);
    executor.Schedule(server.GetHandle());
    executor.Run();

    engine->Shutdown();
    std::cout << "\n=== Server stopped: " << dispatcher.HandledCount() << " requests handled ===" << std::endl;
    return 0;
}
