#pragma once

#include "engine/backend.hpp"
#include "pipeline.hpp"

#include <cstddef>
#include <string>
#include <string_view>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:10095";
        std::string api_format = "funasr"; // "funasr" or "whisper.cpp"
        long timeout_s = 600;
    } backend;

    RecognitionParams recognition;

    SubtitleOptions subtitle;

    struct Output {
        std::string dir = "srt_out";
        bool write_json = false;
        bool write_orig_srt = false;
    } output;

    struct Worker {
        int idle_seconds = 600; // <= 0 disables the idle exit
    } worker;

    struct History {
        bool enabled = true;
        std::string path; // empty: <data dir>/history.db
    } history;

    static Config load(const std::string& path);
    static Config load_default();

    // Overrides from FUNASR_URL, DEVICE, NCPU, FUNASR_MERGE,
    // FUNASR_MERGE_MAX_WORDS and FUNASR_IDLE_SECONDS.
    void apply_env();

    std::string history_path() const;
};

// Positive integer in `raw`, or `fallback` when it is empty, non-numeric or <= 0.
size_t parse_positive(std::string_view raw, size_t fallback);

// "1", "true", "yes", "on" (any case) are true.
bool parse_flag(std::string_view raw);
