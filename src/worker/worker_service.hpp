#pragma once

#include "config.hpp"
#include "engine/backend.hpp"
#include "idle_timer.hpp"
#include "line_channel.hpp"
#include "pipeline.hpp"
#include "protocol.hpp"
#include "storage/history_db.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

enum class WorkerState { Starting, Ready, Busy, Terminated };

std::string_view to_string(WorkerState state);

// Persistent worker: one loaded backend, requests read one line at a time
// from the channel, one response per request, and an idle timer that is
// disarmed for the whole time a request is being handled.
class WorkerService {
public:
    WorkerService(Config config, RecognitionBackend& backend, LineChannel& channel,
                  IdleTimer::Callback on_idle, bool verbose = false);
    ~WorkerService();

    WorkerService(const WorkerService&) = delete;
    WorkerService& operator=(const WorkerService&) = delete;

    // Loads the backend. Returns false if it cannot be used.
    bool init();

    // Announces readiness and serves requests until a shutdown request or end
    // of input. Returns the process exit status.
    int run();

    // Handles one transcription. Never throws.
    std::expected<JobOutput, JobError> handle_transcribe(const protocol::TranscribeRequest& req);

    void attach_history(HistoryDb* history) { history_ = history; }

    WorkerState state() const { return state_.load(std::memory_order_acquire); }

private:
    protocol::Response handle_line(const std::string& line, bool& shutdown);
    void record(const protocol::TranscribeRequest& req,
                const std::expected<JobOutput, JobError>& result);
    bool send(const protocol::Response& response);
    void set_state(WorkerState state);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RecognitionBackend& backend_;
    LineChannel& channel_;
    SubtitlePipeline pipeline_;
    HistoryDb* history_ = nullptr;

    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::unique_ptr<IdleTimer> idle_timer_; // null when idle exit is disabled
};
