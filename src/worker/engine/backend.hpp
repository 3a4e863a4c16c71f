#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Fixed tuning parameters sent with every recognition call.
struct RecognitionParams {
    std::string device = "cuda";
    int ncpu = 4;
    int batch_size_s = 300;
    std::string hotword;
    double hotword_weight = 1.0;
    bool disable_punc = false;
    bool disable_itn = false;
    int max_single_segment_time = 30000; // ms
    int max_end_silence_time = 400;      // ms
};

// Speech-recognition engine. recognize() returns the raw sentence-level
// result: one item or an array of items, each with an optional
// "sentence_info" array of {text, start, end[, timestamp]} records in ms.
class RecognitionBackend {
public:
    virtual ~RecognitionBackend() = default;

    // Called once before the first recognize().
    virtual bool load() = 0;

    virtual std::expected<nlohmann::json, std::string>
        recognize(const std::string& audio_path, const RecognitionParams& params) = 0;

    virtual std::string name() const = 0;
};
