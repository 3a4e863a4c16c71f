#pragma once

#include "line_channel.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

// Owns one `funasr-srt --worker` child process and talks to it over its
// stdin/stdout. stderr is inherited.
class WorkerClient {
public:
    WorkerClient();
    ~WorkerClient();

    WorkerClient(const WorkerClient&) = delete;
    WorkerClient& operator=(const WorkerClient&) = delete;

    // argv[0] is the executable path.
    bool start(const std::vector<std::string>& argv);

    // Waits for the {"type":"ready"} announcement, skipping any other JSON
    // lines before it.
    bool wait_ready(nlohmann::json& ready, int timeout_ms = 60000);

    bool send(const nlohmann::json& msg);
    bool send_line(const std::string& line);
    bool recv(nlohmann::json& msg, int timeout_ms = 30000);

    // Closes the worker's stdin; the worker exits at end of input.
    void close_input();

    // Exit status once the child has exited (128 + signal when killed), or
    // nullopt if it is still running after timeout_ms.
    std::optional<int> wait_exit(int timeout_ms);

    // Sends shutdown, then escalates to SIGTERM if the worker lingers.
    void stop(int timeout_ms = 5000);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !exit_status_; }

    static std::string default_worker_path(const char* argv0);

private:
    pid_t pid_ = -1;
    int to_child_ = -1;
    int from_child_ = -1;
    std::unique_ptr<LineChannel> channel_;
    std::optional<int> exit_status_;
};
