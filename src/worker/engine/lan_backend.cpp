#include "lan_backend.hpp"

#include <cmath>
#include <curl/curl.h>
#include <format>
#include <print>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

LanBackend::LanBackend(std::string url, std::string api_format, long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)), timeout_s_(timeout_s) {}

LanBackend::~LanBackend() {
    if (curl_ready_) curl_global_cleanup();
}

bool LanBackend::load() {
    if (url_.empty()) {
        std::println(stderr, "backend: no server url configured");
        return false;
    }
    if (api_format_ != "funasr" && api_format_ != "whisper.cpp") {
        std::println(stderr, "backend: unknown api_format '{}'", api_format_);
        return false;
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::println(stderr, "backend: curl_global_init failed");
        return false;
    }
    curl_ready_ = true;
    return true;
}

std::expected<json, std::string>
LanBackend::recognize(const std::string& audio_path, const RecognitionParams& params) {
    if (!curl_ready_) {
        return std::unexpected("backend not loaded");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);

    if (api_format_ == "whisper.cpp") {
        endpoint = url_ + "/inference";

        curl_mime_name(part, "file");
        curl_mime_filedata(part, audio_path.c_str());

        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "verbose_json");
        if (!params.hotword.empty()) add_field(mime, "prompt", params.hotword);
    } else {
        // FunASR HTTP runtime
        endpoint = url_ + "/recognition";

        curl_mime_name(part, "audio");
        curl_mime_filedata(part, audio_path.c_str());

        add_field(mime, "sentence_timestamp", "true");
        add_field(mime, "batch_size_s", std::to_string(params.batch_size_s));
        add_field(mime, "hotword", params.hotword);
        add_field(mime, "hotword_weight", std::format("{}", params.hotword_weight));
        add_field(mime, "disable_punc", params.disable_punc ? "true" : "false");
        add_field(mime, "disable_itn", params.disable_itn ? "true" : "false");
        add_field(mime, "max_single_segment_time", std::to_string(params.max_single_segment_time));
        add_field(mime, "max_end_silence_time", std::to_string(params.max_end_silence_time));
    }

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        auto body = json::parse(response_body);
        if (http_status >= 400 && !body.contains("error")) {
            return std::unexpected(std::format("server returned HTTP {}: {}", http_status,
                                               trim(response_body)));
        }
        return normalize_response(body, api_format_);
    } catch (const json::exception& e) {
        if (http_status >= 400) {
            return std::unexpected(std::format("server returned HTTP {}: {}", http_status,
                                               trim(response_body)));
        }
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<json, std::string>
LanBackend::normalize_response(const json& body, const std::string& api_format) {
    if (body.is_object() && body.contains("error")) {
        const auto& err = body["error"];
        return std::unexpected("server error: " + (err.is_string() ? err.get<std::string>() : err.dump()));
    }

    if (api_format == "whisper.cpp") {
        if (!body.is_object() || !body.contains("segments") || !body["segments"].is_array()) {
            return std::unexpected("unexpected response: " + body.dump());
        }

        // verbose_json segment times are seconds.
        auto to_ms = [](const json& seg, const char* key) -> int64_t {
            auto it = seg.find(key);
            if (it == seg.end() || !it->is_number()) return 0;
            return std::llround(it->get<double>() * 1000.0);
        };

        json sentences = json::array();
        for (const auto& seg : body["segments"]) {
            if (!seg.is_object()) continue;
            sentences.push_back({
                {"text", trim(seg.value("text", ""))},
                {"start", to_ms(seg, "start")},
                {"end", to_ms(seg, "end")},
            });
        }
        return json{{"text", trim(body.value("text", ""))}, {"sentence_info", std::move(sentences)}};
    }

    // FunASR shapes: the AutoModel list as-is, or the HTTP runtime's
    // {"code", "text"/"result", "sentences"} envelope.
    if (body.is_array()) return body;
    if (!body.is_object()) {
        return std::unexpected("unexpected response: " + body.dump());
    }
    if (body.contains("code") && body["code"].is_number() && body["code"].get<int>() != 0) {
        return std::unexpected("server error: " + body.value("msg", body.dump()));
    }
    if (body.contains("sentence_info")) return body;
    if (body.contains("sentences") && body["sentences"].is_array()) {
        std::string text;
        if (body.contains("text") && body["text"].is_string()) text = body["text"].get<std::string>();
        else if (body.contains("result") && body["result"].is_string()) text = body["result"].get<std::string>();
        return json{{"text", std::move(text)}, {"sentence_info", body["sentences"]}};
    }
    return std::unexpected("unexpected response: " + body.dump());
}
