#include "worker_service.hpp"

#include <format>
#include <print>
#include <unistd.h>
#include <variant>

std::string_view to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Starting: return "starting";
        case WorkerState::Ready: return "ready";
        case WorkerState::Busy: return "busy";
        case WorkerState::Terminated: return "terminated";
    }
    return "unknown";
}

WorkerService::WorkerService(Config config, RecognitionBackend& backend, LineChannel& channel,
                             IdleTimer::Callback on_idle, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      backend_(backend), channel_(channel),
      pipeline_(backend_, config_.recognition, config_.subtitle) {
    if (config_.worker.idle_seconds > 0) {
        idle_timer_ = std::make_unique<IdleTimer>(
            std::chrono::seconds(config_.worker.idle_seconds),
            [this, on_idle = std::move(on_idle)]() {
                set_state(WorkerState::Terminated);
                if (on_idle) on_idle();
            });
    }
}

WorkerService::~WorkerService() = default;

bool WorkerService::init() {
    set_state(WorkerState::Starting);
    if (!backend_.load()) {
        std::println(stderr, "worker: failed to load backend {}", backend_.name());
        return false;
    }
    log("Backend loaded: " + backend_.name());
    return true;
}

int WorkerService::run() {
    set_state(WorkerState::Ready);
    bool announced = send(protocol::Ready{
        .pid = static_cast<int>(::getpid()),
        .device = config_.recognition.device,
        .ncpu = config_.recognition.ncpu,
        .idle_seconds = config_.worker.idle_seconds,
        .merge_cues = config_.subtitle.merge,
        .max_words = config_.subtitle.max_words,
    });
    if (!announced) {
        set_state(WorkerState::Terminated);
        return 1;
    }
    if (idle_timer_) idle_timer_->arm();

    while (auto line = channel_.read_line()) {
        if (protocol::is_blank(*line)) continue;

        // Disarm before parsing so a slow request cannot race the expiry.
        if (idle_timer_) idle_timer_->disarm();
        set_state(WorkerState::Busy);

        bool shutdown = false;
        auto response = handle_line(*line, shutdown);
        bool sent = send(response);

        if (shutdown) {
            log("Shutdown requested");
            set_state(WorkerState::Terminated);
            return 0;
        }
        if (!sent) {
            set_state(WorkerState::Terminated);
            return 1;
        }

        set_state(WorkerState::Ready);
        if (idle_timer_) idle_timer_->arm();
    }

    if (idle_timer_) idle_timer_->disarm();
    log("Input closed, exiting");
    set_state(WorkerState::Terminated);
    return 0;
}

protocol::Response WorkerService::handle_line(const std::string& line, bool& shutdown) {
    auto parsed = protocol::parse_request(line);
    if (!parsed) {
        auto& err = parsed.error();
        log("Rejected request: " + err.message);
        constexpr size_t MAX_ECHO = 500;
        return protocol::ResultError{
            .id = err.id,
            .error = err.message,
            .traceback = std::format("{}: {}\n  line: {}{}\n", to_string(ErrorKind::Protocol),
                                     err.message, line.substr(0, MAX_ECHO),
                                     line.size() > MAX_ECHO ? "..." : ""),
        };
    }

    if (auto* stop = std::get_if<protocol::ShutdownRequest>(&*parsed)) {
        shutdown = true;
        return protocol::ShutdownAck{stop->id};
    }

    const auto& req = std::get<protocol::TranscribeRequest>(*parsed);
    auto result = handle_transcribe(req);
    record(req, result);

    if (!result) {
        log(std::format("Request {} failed: {}", req.id.dump(), result.error().message));
        return protocol::ResultError{
            .id = req.id,
            .error = result.error().message,
            .traceback = result.error().trace,
        };
    }

    log(std::format("Request {} done: {} ({} cues, {:.2f}s)", req.id.dump(),
                    result->srt_path, result->cue_count, result->processing_s));
    return protocol::ResultOk{.id = req.id, .srt_path = result->srt_path};
}

std::expected<JobOutput, JobError>
WorkerService::handle_transcribe(const protocol::TranscribeRequest& req) {
    JobRequest job{
        .audio_path = req.audio_path,
        .out_dir = req.out_dir.value_or(config_.output.dir),
        .write_json = req.write_json.value_or(config_.output.write_json),
        .write_orig_srt = req.write_orig_srt.value_or(config_.output.write_orig_srt),
    };
    log("Transcribing " + job.audio_path);
    return pipeline_.run(job);
}

void WorkerService::record(const protocol::TranscribeRequest& req,
                           const std::expected<JobOutput, JobError>& result) {
    if (!history_) return;

    JobRecord rec{.audio_path = req.audio_path, .backend = backend_.name()};
    if (result) {
        rec.ok = true;
        rec.srt_path = result->srt_path;
        rec.cue_count = static_cast<int64_t>(result->cue_count);
        rec.processing_time = result->processing_s;
    } else {
        rec.error = result.error().message;
    }
    if (!history_->insert(rec)) {
        log("History insert failed");
    }
}

bool WorkerService::send(const protocol::Response& response) {
    return channel_.write_message(protocol::to_json(response));
}

void WorkerService::set_state(WorkerState state) {
    auto prev = state_.exchange(state, std::memory_order_acq_rel);
    if (prev != state) {
        log(std::format("State: {} -> {}", to_string(prev), to_string(state)));
    }
}

void WorkerService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[funasr-srt] {}", msg);
    }
}
