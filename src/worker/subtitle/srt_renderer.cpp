#include "subtitle/srt_renderer.hpp"
#include "subtitle/utf8.hpp"

#include <format>

namespace subtitle {

std::string format_timestamp(int64_t ms) {
    if (ms < 0) ms = 0;
    int64_t s = ms / 1000;
    ms %= 1000;
    int64_t m = s / 60;
    s %= 60;
    int64_t h = m / 60;
    m %= 60;
    return std::format("{:02}:{:02}:{:02},{:03}", h, m, s, ms);
}

std::string render_srt(const CueSequence& cues) {
    std::string out;
    size_t index = 1;
    for (const auto& cue : cues) {
        out += std::format("{}\n{} --> {}\n{}\n\n", index++,
                           format_timestamp(cue.start), format_timestamp(cue.end), cue.text);
    }

    for (auto tail = utf8::last(out); tail.bytes > 0 && utf8::is_whitespace(tail.cp);
         tail = utf8::last(out)) {
        out.resize(out.size() - tail.bytes);
    }
    out.push_back('\n');
    return out;
}

} // namespace subtitle
