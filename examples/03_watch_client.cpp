// ============================================================================
// Example 03: Watch Client
// ============================================================================
//
// This example is the consumer side of example 02:
// 1. Connects with a ReconnectingClient and joins "space-monitor"
// 2. Starts a conversion once the first resync has arrived
// 3. Follows that task through its "task:<id>" group until it finishes
//
// Kill and restart the server while this runs to watch the client back off,
// reconnect, re-join its groups and resync its mirror of active tasks.
//
// RUN:
//   cd build && ./examples/03_watch_client [port] [task-name]
//
// ============================================================================

#include "convq/core/task.hpp"
#include "convq/hub/groups.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/timer.hpp"
#include "convq/net/reconnecting_client.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace convq;
using namespace std::chrono_literals;

namespace {

void PrintEvent(const Json& event) {
    std::string type = OptString(event, "type").value_or("?");
    std::cout << "[Event] " << type;
    if (auto id = OptString(event, "taskId")) {
        std::cout << " " << *id;
    }
    auto payload = event.find("payload");
    if (payload != event.end() && payload->is_object()) {
        if (auto status = OptString(*payload, "status")) {
            std::cout << " " << *status;
        }
        if (auto progress = OptInt(*payload, "progress")) {
            std::cout << " " << *progress << "%";
        }
        if (auto percent = OptDouble(*payload, "usagePercent")) {
            std::cout << " usage " << *percent << "% (" << OptString(*payload, "level").value_or("") << ")";
        }
    }
    std::cout << std::endl;
}

Task<void> Watch(LibuvExecutor& executor, uint16_t port, std::string task_name) {
    ReconnectingClient::Options options;
    options.port = port;
    options.backoff.initial_delay = 1000ms;
    options.ping_interval = 5000ms;
    options.pong_timeout = 15000ms;

    ReconnectingClient client(executor, options);
    bool submitted = false;
    bool finished = false;
    std::string watched;

    client.OnStateChange([](ClientState state) { std::cout << "[Client] " << ToString(state) << std::endl; });
    client.OnReconnectFailed([&](std::error_code ec) {
        std::cout << "[Client] giving up: " << ec.message() << std::endl;
        finished = true;
    });
    client.OnResync([&](const std::vector<ConversionTask>& active) {
        std::cout << "[Client] resynced, " << active.size() << " active tasks" << std::endl;
        if (submitted) return;
        submitted = true;

        Json args{{"name", task_name},
                  {"sourcePath", "/media/in/" + task_name},
                  {"sourceSizeBytes", 250'000'000},
                  {"parameters", {{"outputFormat", "mkv"}, {"videoCodec", "h265_nvenc"}, {"resolution", "1080p"}}}};
        client.SendRequest(op::kStartTask, args, [&](Result<Json, RemoteError> response) {
            if (response.IsErr()) {
                std::cout << "[Client] StartTask failed: " << response.Error().message << std::endl;
                finished = true;
                return;
            }
            watched = OptString(response.Value(), "taskId").value_or("");
            std::cout << "[Client] started " << watched << std::endl;
            client.JoinGroup(TaskGroupName(watched));
        });
    });
    client.OnEvent([&](const Json& event) {
        PrintEvent(event);
        std::string type = OptString(event, "type").value_or("");
        if (OptString(event, "taskId").value_or("") != watched) return;
        if (type == EventTypeName(EventKind::Completed) || type == EventTypeName(EventKind::Deleted)) {
            finished = true;
        } else if (type == EventTypeName(EventKind::StatusChanged)) {
            auto payload = event.find("payload");
            if (payload != event.end()) {
                auto status = ParseTaskStatus(OptString(*payload, "status").value_or(""));
                finished = status && IsTerminal(*status);
            }
        }
    });

    client.JoinGroup(std::string(kSpaceMonitorGroup));
    client.Start();

    while (!finished) {
        co_await AsyncSleep(200ms);
    }

    std::cout << "[Client] done after " << client.ConnectCount() << " connection(s)" << std::endl;
    client.Stop();
    co_await AsyncSleep(50ms);
    executor.Stop();
}

}  // namespace

int main(int argc, char** argv) {
    std::cout << "=== convq Example 03: Watch Client ===" << std::endl;
    std::cout << std::endl;

    auto port = static_cast<uint16_t>(argc > 1 ? std::atoi(argv[1]) : 7300);
    std::string task_name = argc > 2 ? argv[2] : "lecture.avi";

    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;

    auto watch = Watch(executor, port, task_name);
    executor.Schedule(watch.GetHandle());
    executor.Run();

    std::cout << "\n=== Watch finished ===" << std::endl;
    return 0;
}
