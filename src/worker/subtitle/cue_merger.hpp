#pragma once

#include "subtitle/cue.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace subtitle {

constexpr size_t DEFAULT_MAX_WORDS = 15;

// . ! ? 。 ！ ？
bool is_final_punctuation(char32_t cp);

// , ， 、
bool is_join_punctuation(char32_t cp);

// Text of `current` with its trailing join mark removed, joined to `next`.
// One space is inserted only between two ASCII letters or digits.
std::string join_text(std::string_view current, std::string_view next);

// The merged text if `next` may be folded into `current`, nullopt otherwise.
std::optional<std::string> try_merge(const Cue& current, const Cue& next, size_t max_words);

// Single greedy left-to-right pass. A cue absorbs its successors while they
// start exactly where it ends, it ends in a join mark, and the joined text
// stays within max_words.
CueSequence merge_cues(const CueSequence& cues, size_t max_words = DEFAULT_MAX_WORDS);

} // namespace subtitle
