#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

size_t parse_positive(std::string_view raw, size_t fallback) {
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

    long long value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size() || value <= 0) {
        return fallback;
    }
    return static_cast<size_t>(value);
}

bool parse_flag(std::string_view raw) {
    std::string v(raw);
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// max_words accepts a number or a numeric string; anything else keeps the default.
static size_t json_positive(const json& v, size_t fallback) {
    if (v.is_number_integer()) {
        auto n = v.get<long long>();
        return n > 0 ? static_cast<size_t>(n) : fallback;
    }
    if (v.is_string()) return parse_positive(v.get<std::string>(), fallback);
    return fallback;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("timeout_s")) cfg.backend.timeout_s = b["timeout_s"].get<long>();
        }

        if (j.contains("recognition")) {
            auto& r = j["recognition"];
            auto& p = cfg.recognition;
            if (r.contains("device")) p.device = r["device"].get<std::string>();
            if (r.contains("ncpu")) p.ncpu = r["ncpu"].get<int>();
            if (r.contains("batch_size_s")) p.batch_size_s = r["batch_size_s"].get<int>();
            if (r.contains("hotword")) p.hotword = r["hotword"].get<std::string>();
            if (r.contains("hotword_weight")) p.hotword_weight = r["hotword_weight"].get<double>();
            if (r.contains("disable_punc")) p.disable_punc = r["disable_punc"].get<bool>();
            if (r.contains("disable_itn")) p.disable_itn = r["disable_itn"].get<bool>();
            if (r.contains("max_single_segment_time"))
                p.max_single_segment_time = r["max_single_segment_time"].get<int>();
            if (r.contains("max_end_silence_time"))
                p.max_end_silence_time = r["max_end_silence_time"].get<int>();
        }

        if (j.contains("subtitle")) {
            auto& s = j["subtitle"];
            if (s.contains("merge")) cfg.subtitle.merge = s["merge"].get<bool>();
            if (s.contains("max_words")) cfg.subtitle.max_words = json_positive(s["max_words"], 15);
            if (s.contains("split_long")) cfg.subtitle.split_long = s["split_long"].get<bool>();
            if (s.contains("max_chars_per_line"))
                cfg.subtitle.max_chars_per_line = json_positive(s["max_chars_per_line"], 40);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("dir")) cfg.output.dir = o["dir"].get<std::string>();
            if (o.contains("write_json")) cfg.output.write_json = o["write_json"].get<bool>();
            if (o.contains("write_orig_srt")) cfg.output.write_orig_srt = o["write_orig_srt"].get<bool>();
        }

        if (j.contains("worker")) {
            auto& w = j["worker"];
            if (w.contains("idle_seconds")) cfg.worker.idle_seconds = w["idle_seconds"].get<int>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* v = std::getenv("FUNASR_URL"); v && *v) backend.url = v;
    if (const char* v = std::getenv("DEVICE"); v && *v) recognition.device = v;
    if (const char* v = std::getenv("NCPU"); v && *v) {
        recognition.ncpu = static_cast<int>(parse_positive(v, static_cast<size_t>(recognition.ncpu)));
    }
    if (const char* v = std::getenv("FUNASR_MERGE"); v && *v) subtitle.merge = parse_flag(v);
    if (const char* v = std::getenv("FUNASR_MERGE_MAX_WORDS")) {
        subtitle.max_words = parse_positive(v, 15);
    }
    if (const char* v = std::getenv("FUNASR_IDLE_SECONDS"); v && *v) {
        int seconds = 0;
        std::string_view s(v);
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds);
        if (ec == std::errc() && ptr == s.data() + s.size()) worker.idle_seconds = seconds;
    }
}

std::string Config::history_path() const {
    if (!history.path.empty()) return history.path;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/history.db";
    return "/tmp/funasr-srt/history.db";
}
