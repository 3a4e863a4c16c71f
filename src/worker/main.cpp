#include "config.hpp"
#include "engine/lan_backend.hpp"
#include "line_channel.hpp"
#include "pipeline.hpp"
#include "storage/history_db.hpp"
#include "worker_service.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static void usage() {
    std::println("Usage: funasr-srt [options]");
    std::println("Modes:");
    std::println("  --worker                   Serve JSON requests on stdin/stdout");
    std::println("  --audio PATH               Transcribe one file (default: $AUDIO_PATH)");
    std::println("  --from-json PATH           Render a saved .funasr.json without the engine");
    std::println("  --history [N]              Show the last N jobs (default 10)");
    std::println("Output:");
    std::println("  --out-dir DIR              Output directory");
    std::println("  --write-json               Also write <base>.funasr.json");
    std::println("  --write-orig-srt           Also write the unmerged <base>.funasr.orig.srt");
    std::println("  --print-srt-path           Print the SRT path instead of 'Done!'");
    std::println("Subtitles:");
    std::println("  --merge / --no-merge       Join cues split at a comma");
    std::println("  --max-words N              Word cap for a merged cue (default 15)");
    std::println("  --split-long               Cut long sentences at character timestamps");
    std::println("  --max-chars-per-line N     Length that allows a cut (default 40)");
    std::println("Engine:");
    std::println("  --url URL                  Recognition server");
    std::println("  --api-format FMT           funasr | whisper.cpp");
    std::println("  --device D  --ncpu N  --batch-size-s N");
    std::println("  --hotword W  --hotword-weight F  --disable-punc  --disable-itn");
    std::println("  --max-single-segment-time MS  --max-end-silence-time MS");
    std::println("General:");
    std::println("  --idle-seconds N           Worker idle exit, 0 disables");
    std::println("  --no-history               Do not record jobs");
    std::println("  -c, --config PATH          Config file path");
    std::println("  -v, --verbose              Enable verbose logging");
    std::println("  -h, --help                 Show this help");
}

static std::unique_ptr<RecognitionBackend> make_backend(const Config& config) {
    if (config.backend.type == "lan") {
        return std::make_unique<LanBackend>(config.backend.url, config.backend.api_format,
                                            config.backend.timeout_s);
    }
    std::println(stderr, "Unknown backend type: {}", config.backend.type);
    return nullptr;
}

static int show_history(const Config& config, int limit) {
    HistoryDb db;
    if (!db.open(config.history_path())) return 1;
    for (auto& e : db.recent(limit)) {
        if (e.job.ok) {
            std::println("[{}] {} -> {} ({} cues, {:.1f}s)", e.timestamp, e.job.audio_path,
                         e.job.srt_path, e.job.cue_count, e.job.processing_time);
        } else {
            std::println("[{}] {} FAILED: {}", e.timestamp, e.job.audio_path, e.job.error);
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool worker = false;
    bool verbose = false;
    bool print_srt_path = false;
    bool no_history = false;
    int history_limit = 0;
    std::string config_path;
    std::string audio_path;
    std::string from_json;

    // Flags are applied after the config file and environment.
    std::vector<std::pair<std::string, std::string>> overrides;

    const std::vector<std::string> value_flags = {
        "--out-dir", "--max-words", "--max-chars-per-line", "--url", "--api-format",
        "--device", "--ncpu", "--batch-size-s", "--hotword", "--hotword-weight",
        "--max-single-segment-time", "--max-end-silence-time", "--idle-seconds",
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--worker") {
            worker = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--audio") {
            if (i + 1 < argc) audio_path = argv[++i];
        } else if (arg == "--from-json") {
            if (i + 1 < argc) from_json = argv[++i];
        } else if (arg == "--history") {
            history_limit = 10;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                history_limit = static_cast<int>(parse_positive(argv[++i], 10));
            }
        } else if (arg == "--print-srt-path") {
            print_srt_path = true;
        } else if (arg == "--no-history") {
            no_history = true;
        } else if (arg == "--write-json" || arg == "--write-orig-srt" || arg == "--merge" ||
                   arg == "--no-merge" || arg == "--split-long" || arg == "--disable-punc" ||
                   arg == "--disable-itn") {
            overrides.emplace_back(arg, "");
        } else if (std::find(value_flags.begin(), value_flags.end(), arg) != value_flags.end()) {
            if (i + 1 >= argc) {
                std::println(stderr, "Missing value for {}", arg);
                return 1;
            }
            overrides.emplace_back(arg, argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();

    try {
        for (auto& [flag, value] : overrides) {
            if (flag == "--write-json") config.output.write_json = true;
            else if (flag == "--write-orig-srt") config.output.write_orig_srt = true;
            else if (flag == "--merge") config.subtitle.merge = true;
            else if (flag == "--no-merge") config.subtitle.merge = false;
            else if (flag == "--split-long") config.subtitle.split_long = true;
            else if (flag == "--disable-punc") config.recognition.disable_punc = true;
            else if (flag == "--disable-itn") config.recognition.disable_itn = true;
            else if (flag == "--out-dir") config.output.dir = value;
            else if (flag == "--max-words") config.subtitle.max_words = parse_positive(value, 15);
            else if (flag == "--max-chars-per-line")
                config.subtitle.max_chars_per_line = parse_positive(value, 40);
            else if (flag == "--url") config.backend.url = value;
            else if (flag == "--api-format") config.backend.api_format = value;
            else if (flag == "--device") config.recognition.device = value;
            else if (flag == "--ncpu") config.recognition.ncpu = std::stoi(value);
            else if (flag == "--batch-size-s") config.recognition.batch_size_s = std::stoi(value);
            else if (flag == "--hotword") config.recognition.hotword = value;
            else if (flag == "--hotword-weight") config.recognition.hotword_weight = std::stod(value);
            else if (flag == "--max-single-segment-time")
                config.recognition.max_single_segment_time = std::stoi(value);
            else if (flag == "--max-end-silence-time")
                config.recognition.max_end_silence_time = std::stoi(value);
            else if (flag == "--idle-seconds") config.worker.idle_seconds = std::stoi(value);
        }
    } catch (const std::logic_error& e) {
        std::println(stderr, "Invalid option value: {}", e.what());
        return 1;
    }
    if (no_history) config.history.enabled = false;

    if (history_limit > 0) {
        return show_history(config, history_limit);
    }

    HistoryDb history;
    if (config.history.enabled && !history.open(config.history_path())) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    auto backend = make_backend(config);
    if (!backend) return 1;

    if (worker) {
        // A vanished caller must surface as a write error, not a signal.
        ::signal(SIGPIPE, SIG_IGN);

        if (verbose) {
            std::println(stderr, "[funasr-srt] Starting worker (backend: {} @ {}, idle {}s)",
                         backend->name(), config.backend.url, config.worker.idle_seconds);
        }

        LineChannel channel(STDIN_FILENO, STDOUT_FILENO);
        int idle_seconds = config.worker.idle_seconds;
        WorkerService service(std::move(config), *backend, channel,
                              [idle_seconds]() {
                                  std::println(stderr, "[funasr-srt] Idle for {}s, exiting",
                                               idle_seconds);
                                  _exit(0);
                              },
                              verbose);
        if (history.is_open()) service.attach_history(&history);

        if (!service.init()) return 1;
        return service.run();
    }

    // One-shot
    if (audio_path.empty()) {
        if (const char* env = std::getenv("AUDIO_PATH"); env && *env) audio_path = env;
    }
    if (audio_path.empty() && from_json.empty()) {
        std::println(stderr, "Missing --audio (or set AUDIO_PATH)");
        return 1;
    }

    SubtitlePipeline pipeline(*backend, config.recognition, config.subtitle);
    JobRequest job{
        .audio_path = !audio_path.empty() ? audio_path : from_json,
        .out_dir = config.output.dir,
        .write_json = config.output.write_json,
        .write_orig_srt = config.output.write_orig_srt,
    };

    std::expected<JobOutput, JobError> result;
    if (!from_json.empty()) {
        std::ifstream f(from_json);
        if (!f.is_open()) {
            std::println(stderr, "Error: cannot open {}", from_json);
            return 1;
        }
        nlohmann::json raw;
        try {
            raw = nlohmann::json::parse(f);
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "Error: {} is not valid JSON: {}", from_json, e.what());
            return 1;
        }
        // foo.funasr.json renders to foo.funasr.srt
        if (audio_path.empty()) {
            auto stem = fs::path(from_json).stem();
            if (stem.extension() == ".funasr") stem = stem.stem();
            job.audio_path = stem.string();
            job.write_json = false;
        }
        result = pipeline.render(raw, job);
    } else {
        if (!backend->load()) return 1;
        result = pipeline.run(job);
    }

    if (history.is_open()) {
        JobRecord rec{.audio_path = job.audio_path, .backend = backend->name()};
        rec.ok = result.has_value();
        if (result) {
            rec.srt_path = result->srt_path;
            rec.cue_count = static_cast<int64_t>(result->cue_count);
            rec.processing_time = result->processing_s;
        } else {
            rec.error = result.error().message;
        }
        if (!history.insert(rec)) {
            std::println(stderr, "Warning: job not recorded in history");
        }
    }

    if (!result) {
        std::println(stderr, "Error: {}", result.error().message);
        if (verbose) std::print(stderr, "{}", result.error().trace);
        return 1;
    }

    if (print_srt_path) {
        std::println("{}", result->srt_path);
    } else {
        std::println("Done!");
    }
    return 0;
}
