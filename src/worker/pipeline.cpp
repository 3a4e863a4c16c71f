#include "pipeline.hpp"

#include "subtitle/cue_extractor.hpp"
#include "subtitle/cue_merger.hpp"
#include "subtitle/cue_splitter.hpp"
#include "subtitle/srt_renderer.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Input: return "InputError";
        case ErrorKind::Engine: return "EngineError";
        case ErrorKind::Io: return "IOError";
        case ErrorKind::Protocol: return "ProtocolError";
    }
    return "Error";
}

CueSequence build_cues(const json& raw, const SubtitleOptions& options) {
    auto cues = options.split_long ? subtitle::split_cues(raw, options.max_chars_per_line)
                                   : subtitle::extract_cues(raw);
    if (options.merge) {
        cues = subtitle::merge_cues(cues, options.max_words);
    }
    return cues;
}

JobTrace::JobTrace(const JobRequest& req)
    : text_(std::format("job audio={} out_dir={} write_json={} write_orig_srt={}\n",
                        req.audio_path, req.out_dir, req.write_json, req.write_orig_srt)) {}

void JobTrace::step(std::string_view stage, std::string_view detail) {
    text_ += std::format("  ok     {}", stage);
    if (!detail.empty()) text_ += std::format(": {}", detail);
    text_ += '\n';
}

void JobTrace::fail(std::string_view stage, ErrorKind kind, std::string_view what) {
    text_ += std::format("  FAILED {} [{}]: {}\n", stage, to_string(kind), what);
}

namespace {

// Runs fn, turning any exception into a JobError tagged with stage and kind.
template <typename Fn>
auto guarded(JobTrace& trace, std::string_view stage, ErrorKind kind, Fn&& fn)
    -> std::expected<std::invoke_result_t<Fn>, JobError> {
    auto error = [&](std::string what) {
        trace.fail(stage, kind, what);
        return std::unexpected(JobError{kind, std::move(what), trace.str()});
    };

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            fn();
            return {};
        } else {
            return fn();
        }
    } catch (const fs::filesystem_error& e) {
        return error(e.what());
    } catch (const json::exception& e) {
        return error(std::format("malformed data: {}", e.what()));
    } catch (const std::exception& e) {
        return error(e.what());
    } catch (...) {
        return error("unknown exception");
    }
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }
    f << content;
    f.close();
    if (f.fail()) {
        throw std::runtime_error("failed writing " + path.string());
    }
}

} // namespace

SubtitlePipeline::SubtitlePipeline(RecognitionBackend& backend, RecognitionParams params,
                                   SubtitleOptions options)
    : backend_(backend), params_(std::move(params)), options_(options) {}

std::expected<JobOutput, JobError> SubtitlePipeline::run(const JobRequest& req) {
    auto started = std::chrono::steady_clock::now();
    JobTrace trace(req);

    auto prepared = guarded(trace, "prepare_output_dir", ErrorKind::Io, [&] {
        fs::create_directories(req.out_dir);
    });
    if (!prepared) return std::unexpected(prepared.error());
    trace.step("prepare_output_dir", req.out_dir);

    std::error_code ec;
    if (req.audio_path.empty() || !fs::is_regular_file(req.audio_path, ec)) {
        auto what = std::format("audio file not found: {}", req.audio_path);
        trace.fail("check_audio", ErrorKind::Input, what);
        return std::unexpected(JobError{ErrorKind::Input, what, trace.str()});
    }
    trace.step("check_audio", req.audio_path);

    std::expected<json, std::string> raw;
    try {
        raw = backend_.recognize(req.audio_path, params_);
    } catch (const std::exception& e) {
        raw = std::unexpected(std::string(e.what()));
    }
    if (!raw) {
        trace.fail("recognize", ErrorKind::Engine, raw.error());
        return std::unexpected(JobError{ErrorKind::Engine, raw.error(), trace.str()});
    }

    auto recognize_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    trace.step("recognize", std::format("{} in {:.2f}s", backend_.name(), recognize_s));

    auto out = write_outputs(*raw, req, trace);
    if (out) {
        out->processing_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
    return out;
}

std::expected<JobOutput, JobError> SubtitlePipeline::render(const json& raw, const JobRequest& req) {
    auto started = std::chrono::steady_clock::now();
    JobTrace trace(req);

    auto prepared = guarded(trace, "prepare_output_dir", ErrorKind::Io, [&] {
        fs::create_directories(req.out_dir);
    });
    if (!prepared) return std::unexpected(prepared.error());
    trace.step("prepare_output_dir", req.out_dir);

    auto out = write_outputs(raw, req, trace);
    if (out) {
        out->processing_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
    return out;
}

std::expected<JobOutput, JobError> SubtitlePipeline::write_outputs(const json& raw,
                                                                   const JobRequest& req,
                                                                   JobTrace& trace) {
    fs::path out_dir(req.out_dir);
    std::string base = fs::path(req.audio_path).stem().string();

    if (req.write_json) {
        auto json_path = out_dir / (base + ".funasr.json");
        auto written = guarded(trace, "write_json", ErrorKind::Io, [&] {
            write_file(json_path, raw.dump(2, ' ', false, json::error_handler_t::replace));
        });
        if (!written) return std::unexpected(written.error());
        trace.step("write_json", json_path.string());
    }

    // All cue sequences are built before the first SRT is written.
    auto built = guarded(trace, "build_cues", ErrorKind::Engine, [&] {
        auto cues = build_cues(raw, options_);
        CueSequence orig;
        if (req.write_orig_srt) orig = subtitle::extract_cues(raw);
        return std::pair{std::move(cues), std::move(orig)};
    });
    if (!built) return std::unexpected(built.error());
    const auto& [cues, orig_cues] = *built;
    trace.step("build_cues", std::format("{} cues (merge={}, split={})",
                                         cues.size(), options_.merge, options_.split_long));

    auto srt_path = out_dir / (base + ".funasr.srt");
    auto written = guarded(trace, "write_srt", ErrorKind::Io, [&] {
        write_file(srt_path, subtitle::render_srt(cues));
    });
    if (!written) return std::unexpected(written.error());
    trace.step("write_srt", srt_path.string());

    if (req.write_orig_srt) {
        auto orig_path = out_dir / (base + ".funasr.orig.srt");
        auto orig = guarded(trace, "write_orig_srt", ErrorKind::Io, [&] {
            write_file(orig_path, subtitle::render_srt(orig_cues));
        });
        if (!orig) return std::unexpected(orig.error());
        trace.step("write_orig_srt", orig_path.string());
    }

    return JobOutput{.srt_path = srt_path.string(), .cue_count = cues.size()};
}
