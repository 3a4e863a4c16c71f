#include <catch2/catch_test_macros.hpp>

#include "subtitle/cue_merger.hpp"
#include "subtitle/utf8.hpp"

#include <string>

using namespace subtitle;

namespace {

// Concatenated text of all cues with join marks and ASCII spaces removed:
// the part of the text that merging must never alter.
std::string spoken_text(const CueSequence& cues) {
    std::string out;
    for (auto& cue : cues) {
        for (char32_t cp : utf8::decode(cue.text)) {
            if (cp != U' ' && !is_join_punctuation(cp)) utf8::append(out, cp);
        }
    }
    return out;
}

} // namespace

TEST_CASE("Cue merge rules", "[merge]") {

    SECTION("CommaJoinsAdjacentCues") {
        auto merged = try_merge({0, 1000, "Hello,"}, {1000, 2000, "world."}, 15);
        REQUIRE(merged);
        REQUIRE(*merged == "Hello world.");
    }

    SECTION("GapBlocksMerge") {
        REQUIRE_FALSE(try_merge({0, 1000, "Hello,"}, {1001, 2000, "world."}, 15));
    }

    SECTION("OverlapBlocksMerge") {
        REQUIRE_FALSE(try_merge({0, 1000, "Hello,"}, {999, 2000, "world."}, 15));
    }

    SECTION("FinalPunctuationBlocksMerge") {
        REQUIRE_FALSE(try_merge({0, 1000, "Hello."}, {1000, 2000, "World"}, 15));
        REQUIRE_FALSE(try_merge({0, 1000, "Really?"}, {1000, 2000, "yes"}, 15));
        REQUIRE_FALSE(try_merge({0, 1000, "你好。"}, {1000, 2000, "世界"}, 15));
        REQUIRE_FALSE(try_merge({0, 1000, "好！"}, {1000, 2000, "世界"}, 15));
    }

    SECTION("NoTrailingMarkBlocksMerge") {
        REQUIRE_FALSE(try_merge({0, 1000, "Hello"}, {1000, 2000, "world"}, 15));
        REQUIRE_FALSE(try_merge({0, 1000, "wait;"}, {1000, 2000, "what"}, 15));
    }

    SECTION("EmptyCurrentBlocksMerge") {
        REQUIRE_FALSE(try_merge({0, 1000, ""}, {1000, 2000, "world"}, 15));
    }

    SECTION("FullwidthCommaAndEnumerationComma") {
        auto a = try_merge({0, 1000, "你好，"}, {1000, 2000, "世界。"}, 15);
        REQUIRE(a);
        REQUIRE(*a == "你好世界。");

        auto b = try_merge({0, 1000, "苹果、"}, {1000, 2000, "香蕉"}, 15);
        REQUIRE(b);
        REQUIRE(*b == "苹果香蕉");
    }

    SECTION("WordCapIsInclusive") {
        auto at_cap = try_merge({0, 1000, "one two,"}, {1000, 2000, "three"}, 3);
        REQUIRE(at_cap);
        REQUIRE(*at_cap == "one two three");

        REQUIRE_FALSE(try_merge({0, 1000, "one two three,"}, {1000, 2000, "four"}, 3));
    }

    SECTION("CjkCharactersCountAsWords") {
        REQUIRE(try_merge({0, 1000, "你好，"}, {1000, 2000, "世界"}, 4));
        REQUIRE_FALSE(try_merge({0, 1000, "你好，"}, {1000, 2000, "世界"}, 3));
    }

    SECTION("NonLatinWordsCountTowardsCap") {
        // Neither side of the join is ASCII, so the two middle words fuse.
        auto merged = try_merge({0, 1000, "مرحبا بك صديقي,"}, {1000, 2000, "كيف حالك"}, 4);
        REQUIRE(merged);
        REQUIRE(*merged == "مرحبا بك صديقيكيف حالك");
        REQUIRE_FALSE(try_merge({0, 1000, "مرحبا بك صديقي,"}, {1000, 2000, "كيف حالك"}, 3));

        REQUIRE_FALSE(try_merge({0, 1000, "สวัสดี ครับ,"}, {1000, 2000, "ทุก คน"}, 2));
        REQUIRE_FALSE(try_merge({0, 1000, "नमस्ते आप,"}, {1000, 2000, "कैसे हैं"}, 2));
    }
}

TEST_CASE("Joining text", "[merge]") {

    SECTION("SpaceOnlyBetweenAsciiAlnum") {
        REQUIRE(join_text("Hello,", "world") == "Hello world");
        REQUIRE(join_text("1,", "2") == "1 2");
        REQUIRE(join_text("OK,", "好") == "OK好");
        REQUIRE(join_text("好，", "OK") == "好OK");
    }

    SECTION("NoDoubleSpace") {
        REQUIRE(join_text("Hello, ", "world") == "Hello, world");
        REQUIRE(join_text("Hello,", " world") == "Hello world");
    }

    SECTION("OnlyOneMarkStripped") {
        REQUIRE(join_text("a,,", "b") == "a,b");
    }
}

TEST_CASE("Merging a sequence", "[merge]") {

    SECTION("EmptyAndSingle") {
        REQUIRE(merge_cues({}).empty());
        CueSequence one = {{0, 1000, "Hello,"}};
        REQUIRE(merge_cues(one) == one);
    }

    SECTION("ChainedMerge") {
        CueSequence cues = {
            {0, 1000, "a,"},
            {1000, 2000, "b,"},
            {2000, 3000, "c."},
            {3000, 4000, "d"},
        };
        auto out = merge_cues(cues);
        REQUIRE(out.size() == 2);
        REQUIRE(out[0] == Cue{0, 3000, "a b c."});
        REQUIRE(out[1] == Cue{3000, 4000, "d"});
    }

    SECTION("CapStopsTheChain") {
        CueSequence cues = {
            {0, 1000, "one two,"},
            {1000, 2000, "three,"},
            {2000, 3000, "four"},
        };
        auto out = merge_cues(cues, 3);
        REQUIRE(out.size() == 2);
        REQUIRE(out[0] == Cue{0, 2000, "one two three,"});
        REQUIRE(out[1] == Cue{2000, 3000, "four"});
    }

    SECTION("NothingMergeable") {
        CueSequence cues = {
            {0, 1000, "First."},
            {1500, 2000, "Second,"},
            {2001, 3000, "Third"},
        };
        REQUIRE(merge_cues(cues) == cues);
    }

    SECTION("Idempotent") {
        CueSequence cues = {
            {0, 1000, "我们今天，"},
            {1000, 2000, "讨论一下，"},
            {2000, 3000, "这个问题。"},
            {3000, 4000, "Next one,"},
            {4000, 5000, "please."},
        };
        auto once = merge_cues(cues, 8);
        REQUIRE(merge_cues(once, 8) == once);
    }

    SECTION("ContentPreserved") {
        CueSequence cues = {
            {0, 1000, "我们今天，"},
            {1000, 2000, "讨论一下、"},
            {2000, 3000, "this issue,"},
            {3000, 4000, "with GPU，"},
            {4000, 5000, "好的。"},
            {5000, 6000, "Next one,"},
            {6000, 7000, "please"},
        };
        auto out = merge_cues(cues);
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].text == "我们今天讨论一下this issue with GPU好的。");
        REQUIRE(out[1].text == "Next one please");
        REQUIRE(spoken_text(out) == spoken_text(cues));

        for (size_t cap : {1, 3, 6, 10}) {
            REQUIRE(spoken_text(merge_cues(cues, cap)) == spoken_text(cues));
        }
    }

    SECTION("SpanAndOrderPreserved") {
        CueSequence cues = {
            {0, 1000, "x,"},
            {1000, 2000, "y"},
            {2500, 3000, "z,"},
            {3000, 4000, "w"},
        };
        auto out = merge_cues(cues);
        REQUIRE(out.size() == 2);
        REQUIRE(out.front().start == 0);
        REQUIRE(out.back().end == 4000);
        for (size_t i = 1; i < out.size(); ++i) {
            REQUIRE(out[i - 1].end <= out[i].start);
        }
    }
}
