#include "subtitle/cue_merger.hpp"

#include "subtitle/utf8.hpp"

namespace subtitle {

bool is_final_punctuation(char32_t cp) {
    switch (cp) {
        case U'.': case U'!': case U'?':
        case U'。': case U'！': case U'？':
            return true;
        default:
            return false;
    }
}

bool is_join_punctuation(char32_t cp) {
    return cp == U',' || cp == U'，' || cp == U'、';
}

std::string join_text(std::string_view current, std::string_view next) {
    auto tail = utf8::last(current);
    std::string_view head = current;
    if (tail.bytes > 0 && is_join_punctuation(tail.cp)) {
        head.remove_suffix(tail.bytes);
    }

    std::string joined(head);
    auto left = utf8::last(head);
    char32_t right = utf8::first(next);
    if (left.bytes > 0 && !next.empty() &&
        utf8::is_ascii_alnum(left.cp) && utf8::is_ascii_alnum(right)) {
        joined.push_back(' ');
    }
    joined.append(next);
    return joined;
}

std::optional<std::string> try_merge(const Cue& current, const Cue& next, size_t max_words) {
    // A gap means the engine heard a real pause.
    if (current.end != next.start) return std::nullopt;
    if (current.text.empty()) return std::nullopt;

    auto last = utf8::last(current.text).cp;
    if (is_final_punctuation(last)) return std::nullopt;
    if (!is_join_punctuation(last)) return std::nullopt;

    auto candidate = join_text(current.text, next.text);
    if (utf8::mixed_script_word_count(candidate) > max_words) return std::nullopt;
    return candidate;
}

CueSequence merge_cues(const CueSequence& cues, size_t max_words) {
    CueSequence out;
    out.reserve(cues.size());

    size_t i = 0;
    while (i < cues.size()) {
        Cue current = cues[i++];
        while (i < cues.size()) {
            auto merged = try_merge(current, cues[i], max_words);
            if (!merged) break;
            current.text = std::move(*merged);
            current.end = cues[i].end;
            ++i;
        }
        out.push_back(std::move(current));
    }
    return out;
}

} // namespace subtitle
