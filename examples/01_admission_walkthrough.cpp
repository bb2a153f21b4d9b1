// ============================================================================
// Example 01: Admission Walkthrough
// ============================================================================
//
// This example drives an EngineContext by hand, without any networking:
// 1. Configures a 2 GiB budget and admits a 1 GB conversion
// 2. Shows a larger request being refused for lack of space
// 3. Walks the first task through its lifecycle, including the
//    transitions the state machine rejects
// 4. Shows the reservation being released when the task completes
//
// RUN:
//   cd build && ./examples/01_admission_walkthrough
//
// ============================================================================

#include "convq/engine/storage_probe.hpp"
#include "convq/service/engine_context.hpp"

#include <iostream>

using namespace convq;

namespace {

void PrintCheck(const SpaceCheckResult& check) {
    std::cout << "  hasEnoughSpace=" << (check.has_enough_space ? "true" : "false")
              << " required=" << check.required_bytes / kMiB << " MiB"
              << " available=" << check.available_bytes / kMiB << " MiB"
              << " (" << check.message << ")" << std::endl;
}

void PrintTask(const ConversionTask& task) {
    std::cout << "  " << task.id << " '" << task.name << "' " << ToString(task.status) << " " << task.progress
              << "%";
    if (task.error_message) {
        std::cout << " error='" << *task.error_message << "'";
    }
    std::cout << std::endl;
}

void PrintError(const EngineError& error) {
    std::cout << "  rejected: " << ErrcName(error.code) << ": " << error.message << std::endl;
}

}  // namespace

int main() {
    std::cout << "=== convq Example 01: Admission Walkthrough ===" << std::endl;
    std::cout << std::endl;

    EngineConfig config;
    config.budget.max_total_bytes = 2 * kGiB;
    config.budget.reserved_bytes = 0;
    config.log_level = LogLevel::Warn;

    // Nothing on disk yet
    StaticStorageProbe probe(UsageBreakdown{});
    SequentialIdGenerator ids("task");
    EngineDependencies deps;
    deps.probe = &probe;
    deps.ids = &ids;

    auto created = EngineContext::Create(config, deps);
    if (created.IsErr()) {
        std::cerr << "config rejected: " << created.Error().message << std::endl;
        return 1;
    }
    auto engine = std::move(created).Value();
    if (auto init = engine->Init(); init.IsErr()) {
        std::cerr << "init failed: " << init.Error().message << std::endl;
        return 1;
    }

    // ------------------------------------------------------------------------
    std::cout << "1. Admit a 1 GB mp4 -> h265 conversion" << std::endl;

    StartTaskRequest request;
    request.name = "holiday.mov";
    request.source_path = "/media/in/holiday.mov";
    request.source_size_bytes = 1'000'000'000;
    request.parameters.output_format = "mp4";
    request.parameters.video_codec = "libx265";
    request.parameters.quality = "medium";

    auto first = engine->StartTask(request);
    if (first.IsErr()) {
        PrintError(first.Error());
        return 1;
    }
    PrintTask(first.Value().task);
    PrintCheck(first.Value().check);
    std::cout << "  reserved for it: " << first.Value().task.reserved_bytes / kMiB << " MiB" << std::endl;
    std::cout << std::endl;

    // ------------------------------------------------------------------------
    std::cout << "2. A 2 GB h264 conversion no longer fits" << std::endl;

    StartTaskRequest big = request;
    big.name = "master.mov";
    big.source_size_bytes = 2'000'000'000;
    big.parameters.video_codec = "libx264";
    auto second = engine->StartTask(big);
    if (second.IsErr()) {
        PrintError(second.Error());
        if (second.Error().space_check) {
            PrintCheck(*second.Error().space_check);
        }
    }
    std::cout << std::endl;

    // ------------------------------------------------------------------------
    std::cout << "3. Lifecycle of " << first.Value().task.id << std::endl;

    const TaskId id = first.Value().task.id;
    if (auto early = engine->ReportCompleted(id); early.IsErr()) {
        PrintError(early.Error());
    }

    engine->BeginConversion(id);
    engine->ReportProgress(id, 40, 2.5, std::chrono::seconds(90));
    PrintTask(engine->GetTask(id).Value());

    if (auto bad = engine->ReportProgress(id, 150); bad.IsErr()) {
        PrintError(bad.Error());
    }
    PrintTask(engine->GetTask(id).Value());

    engine->ReportProgress(id, 35);  // encoders do go backwards
    PrintTask(engine->ReportCompleted(id).Value());
    std::cout << std::endl;

    // ------------------------------------------------------------------------
    std::cout << "4. Reservation released on completion" << std::endl;

    std::cout << "  live reservations: " << engine->Accountant().ReservationCount() << std::endl;
    PrintCheck(engine->CheckSpace(1 * kGiB).Value());

    auto done = engine->ListCompletedTasks(1, 10).Value();
    std::cout << "  completed tasks: " << done.size() << std::endl;
    for (const auto& task : done) {
        PrintTask(task);
    }

    engine->Shutdown();
    std::cout << "\n=== Done ===" << std::endl;
    return 0;
}
