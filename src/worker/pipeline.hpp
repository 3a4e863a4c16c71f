#pragma once

#include "engine/backend.hpp"
#include "subtitle/cue.hpp"

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

struct SubtitleOptions {
    bool merge = false;
    size_t max_words = 15;
    bool split_long = false;
    size_t max_chars_per_line = 40;
};

enum class ErrorKind { Input, Engine, Io, Protocol };

std::string_view to_string(ErrorKind kind);

struct JobError {
    ErrorKind kind;
    std::string message;
    std::string trace;
};

struct JobRequest {
    std::string audio_path;
    std::string out_dir;
    bool write_json = false;
    bool write_orig_srt = false;
};

struct JobOutput {
    std::string srt_path;
    size_t cue_count = 0;
    double processing_s = 0.0;
};

// Cues for the final SRT: extraction (or splitting), then the optional merge.
CueSequence build_cues(const nlohmann::json& raw, const SubtitleOptions& options);

// Running record of one job, rendered into the failure "traceback".
class JobTrace {
public:
    explicit JobTrace(const JobRequest& req);

    void step(std::string_view stage, std::string_view detail = {});
    void fail(std::string_view stage, ErrorKind kind, std::string_view what);

    const std::string& str() const { return text_; }

private:
    std::string text_;
};

class SubtitlePipeline {
public:
    SubtitlePipeline(RecognitionBackend& backend, RecognitionParams params, SubtitleOptions options);

    // Recognize req.audio_path and write <out_dir>/<base>.funasr.srt plus the
    // requested extras. Never throws.
    std::expected<JobOutput, JobError> run(const JobRequest& req);

    // Same outputs from an already available raw result.
    std::expected<JobOutput, JobError> render(const nlohmann::json& raw, const JobRequest& req);

private:
    std::expected<JobOutput, JobError> write_outputs(const nlohmann::json& raw,
                                                     const JobRequest& req, JobTrace& trace);

    RecognitionBackend& backend_;
    RecognitionParams params_;
    SubtitleOptions options_;
};
