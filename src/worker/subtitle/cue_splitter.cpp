#include "subtitle/cue_splitter.hpp"

#include "subtitle/cue_extractor.hpp"
#include "subtitle/utf8.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace subtitle {

namespace {

constexpr std::u32string_view BREAK_PUNCTUATION = U"，。！？；：,.!?;:";

struct Span {
    int64_t start;
    int64_t end;
};

// Per-character [start, end] pairs, or empty when the array is unusable.
std::vector<Span> char_spans(const nlohmann::json& record, size_t expected) {
    auto it = record.find("timestamp");
    if (it == record.end() || !it->is_array() || it->size() != expected) return {};

    std::vector<Span> spans;
    spans.reserve(expected);
    for (const auto& pair : *it) {
        if (!pair.is_array() || pair.size() < 2 ||
            !pair[0].is_number() || !pair[1].is_number()) {
            return {};
        }
        spans.push_back({pair[0].get<int64_t>(), pair[1].get<int64_t>()});
    }
    return spans;
}

std::string strip(std::u32string_view chunk) {
    size_t b = 0;
    size_t e = chunk.size();
    while (b < e && utf8::is_whitespace(chunk[b])) ++b;
    while (e > b && utf8::is_whitespace(chunk[e - 1])) --e;
    return utf8::encode(chunk.substr(b, e - b));
}

} // namespace

CueSequence split_cues(const nlohmann::json& raw, size_t max_chars) {
    CueSequence cues;

    for_each_sentence(raw, [&cues, max_chars](const nlohmann::json& record) {
        auto text_it = record.find("text");
        std::string text = (text_it != record.end() && text_it->is_string())
                               ? text_it->get<std::string>() : "";
        auto chars = utf8::decode(text);
        auto spans = chars.empty() ? std::vector<Span>{} : char_spans(record, chars.size());

        if (spans.empty()) {
            cues.push_back(Cue{
                .start = time_field(record, "start"),
                .end = time_field(record, "end"),
                .text = std::move(text),
            });
            return;
        }

        std::u32string chunk;
        int64_t chunk_start = spans[0].start;
        for (size_t i = 0; i < chars.size(); ++i) {
            char32_t c = chars[i];
            chunk.push_back(c);

            bool is_punct = BREAK_PUNCTUATION.find(c) != std::u32string_view::npos;
            bool too_long = chunk.size() >= max_chars;
            bool is_last = i + 1 == chars.size();

            if ((too_long && is_punct) || is_last ||
                (too_long && chunk.find(U' ') != std::u32string::npos)) {
                auto line = strip(chunk);
                if (!line.empty()) {
                    cues.push_back(Cue{.start = chunk_start, .end = spans[i].end, .text = std::move(line)});
                }
                chunk.clear();
                if (!is_last) chunk_start = spans[i + 1].start;
            }
        }
    });

    return cues;
}

} // namespace subtitle
