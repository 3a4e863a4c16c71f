#include "protocol.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace protocol {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::expected<std::optional<bool>, std::string> optional_bool(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) return std::optional<bool>{};
    if (!it->is_boolean()) return std::unexpected(std::string(key) + " must be a boolean");
    return std::optional<bool>{it->get<bool>()};
}

} // namespace

std::expected<Request, RequestError> parse_request(const std::string& line) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::exception& e) {
        return std::unexpected(RequestError{nullptr, std::string("invalid JSON: ") + e.what()});
    }

    if (!msg.is_object()) {
        return std::unexpected(RequestError{nullptr, "request must be a JSON object"});
    }

    json id = msg.contains("id") ? msg["id"] : json(nullptr);

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        return std::unexpected(RequestError{id, "missing request type"});
    }
    const auto& type = type_it->get_ref<const std::string&>();

    if (type == "shutdown") {
        return ShutdownRequest{id};
    }

    if (type != "transcribe" && type != "asr") {
        return std::unexpected(RequestError{id, "unknown request type: " + type});
    }

    TranscribeRequest req{.id = id};

    auto audio = msg.find("audioPath");
    if (audio == msg.end() || !audio->is_string() || audio->get_ref<const std::string&>().empty()) {
        return std::unexpected(RequestError{id, "audioPath must be a non-empty string"});
    }
    req.audio_path = audio->get<std::string>();

    auto out = msg.find("outDir");
    if (out != msg.end() && !out->is_null()) {
        if (!out->is_string() || out->get_ref<const std::string&>().empty()) {
            return std::unexpected(RequestError{id, "outDir must be a non-empty string"});
        }
        req.out_dir = out->get<std::string>();
    }

    auto write_json = optional_bool(msg, "writeJson");
    if (!write_json) return std::unexpected(RequestError{id, write_json.error()});
    req.write_json = *write_json;

    auto write_orig = optional_bool(msg, "writeOrigSrt");
    if (!write_orig) return std::unexpected(RequestError{id, write_orig.error()});
    req.write_orig_srt = *write_orig;

    return req;
}

json to_json(const Response& response) {
    return std::visit(overloaded{
        [](const Ready& r) -> json {
            return {
                {"type", "ready"},
                {"pid", r.pid},
                {"device", r.device},
                {"ncpu", r.ncpu},
                {"idleSeconds", r.idle_seconds},
                {"mergeCues", r.merge_cues},
                {"maxWords", r.max_words},
            };
        },
        [](const ResultOk& r) -> json {
            return {{"type", "result"}, {"id", r.id}, {"ok", true}, {"srtPath", r.srt_path}};
        },
        [](const ResultError& r) -> json {
            return {
                {"type", "result"},
                {"id", r.id},
                {"ok", false},
                {"error", r.error},
                {"traceback", r.traceback},
            };
        },
        [](const ShutdownAck& r) -> json {
            return {{"type", "shutdown"}, {"id", r.id}, {"ok", true}};
        },
    }, response);
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace protocol
