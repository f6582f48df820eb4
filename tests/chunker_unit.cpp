// Unit coverage for byte-budget chunking: split tiers, decimal protection,
// budget invariants and scene chunk bookkeeping.
#include <iostream>
#include <string>
#include <vector>

#include "byte_budget_chunker.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

using namespace narrationforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[chunker_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string joined(const std::vector<TextChunk> &chunks) {
    std::string out;
    for (const auto &c : chunks) {
        if (!out.empty()) {
            out += ' ';
        }
        out += c.text;
    }
    return out;
}

bool test_empty_input() {
    bool ok = check(chunk_text("").empty(), "empty input yields no chunks");
    auto ws = chunk_text("   \n ", 100);
    ok &= check(ws.size() == 1, "whitespace-only input still yields one fallback chunk");
    return ok;
}

bool test_decimal_sentence_at_small_budget() {
    const std::string text = "안녕하세요. 저는 1.5톤 트럭을 운전합니다.";
    auto chunks = chunk_text(text, 20);
    bool ok = check(chunks.size() >= 2, "20 byte budget splits the narration");
    bool saw_decimal = false;
    for (size_t i = 0; i < chunks.size(); ++i) {
        ok &= check(chunks[i].byte_length <= 20, "chunk within 20 bytes");
        ok &= check(chunks[i].byte_length == chunks[i].text.size(), "byte_length matches text");
        ok &= check(chunks[i].index == i, "chunk indices are sequential");
        saw_decimal |= chunks[i].text.find("1.5") != std::string::npos;
        if (i + 1 < chunks.size()) {
            const auto &a = chunks[i].text;
            const auto &b = chunks[i + 1].text;
            ok &= check(!(a.back() == '.' && a.size() >= 2 && a[a.size() - 2] == '1' &&
                          b.front() == '5'),
                        "no boundary between 1. and 5");
        }
    }
    ok &= check(saw_decimal, "1.5 survives intact in one chunk");
    ok &= check(chunks.front().text == "안녕하세요.", "first sentence is its own chunk");
    return ok;
}

bool test_forced_cut_keeps_decimal() {
    auto chunks = chunk_text("가가가가가가1.5톤", 20);
    bool ok = check(chunks.size() == 2, "forced cut yields two chunks");
    if (chunks.size() == 2) {
        ok &= check(chunks[0].text == "가가가가가가", "cut moves before the number");
        ok &= check(chunks[1].text == "1.5톤", "decimal starts the next chunk");
    }
    auto pieces = split_by_bytes("가1.25", 5);
    ok &= check(pieces.size() == 2 && pieces[0] == "가" && pieces[1] == "1.25",
                "forced tier backs up to the run start");
    auto wide = split_by_bytes("12.345678", 4);
    ok &= check(wide.size() == 3 && wide[0] == "12.3", "oversized run still cut by bytes");
    return ok;
}

bool test_budget_invariant_and_reconstruction() {
    const std::string text = test_utils::repeat("오늘은 날씨가 좋았다, 바람이 불었고, 3.75도였다. ", 12) +
                             test_utils::repeat("끝없이이어지는문장", 30) + "!" +
                             " 마지막 문장입니다?! 그리고 끝...";
    bool ok = true;
    for (size_t budget : {4u, 7u, 20u, 100u, 2500u}) {
        auto chunks = chunk_text(text, budget);
        ok &= check(!chunks.empty(), "non-empty input yields chunks");
        for (const auto &c : chunks) {
            ok &= check(c.byte_length <= budget,
                        "chunk exceeds budget " + std::to_string(budget) + ": " + c.text);
            ok &= check(!c.text.empty(), "no empty chunk");
        }
        ok &= check(test_utils::strip_whitespace(joined(chunks)) ==
                        test_utils::strip_whitespace(text),
                    "chunks reconstruct the input modulo whitespace at budget " +
                        std::to_string(budget));
    }
    return ok;
}

bool test_greedy_packing() {
    auto chunks = chunk_text("하나. 둘. 셋.", 100);
    bool ok = check(chunks.size() == 1, "short sentences pack into one chunk");
    ok &= check(chunks.size() == 1 && chunks[0].text == "하나. 둘. 셋.", "packed with single spaces");

    // "하나." is 7 bytes; two of them joined need 15.
    auto tight = chunk_text("하나. 하나. 하나.", 15);
    ok &= check(tight.size() == 2, "packing stops when the joined size exceeds the budget");
    ok &= check(tight.size() == 2 && tight[0].text == "하나. 하나.", "first chunk holds two sentences");
    return ok;
}

bool test_sentence_tier() {
    auto s = split_sentences("가격은 3.14입니다. 그리고 1.2.3 버전!");
    bool ok = check(s.size() == 2, "decimal periods do not end sentences");
    ok &= check(s.size() == 2 && s[0] == "가격은 3.14입니다.", "first sentence keeps 3.14");
    ok &= check(s.size() == 2 && s[1] == "그리고 1.2.3 버전!", "1.2.3 keeps both periods");

    auto runs = split_sentences("정말?! 네... 끝");
    ok &= check(runs.size() == 3, "terminal runs close one sentence");
    ok &= check(runs.size() == 3 && runs[0] == "정말?!" && runs[1] == "네..." && runs[2] == "끝",
                "punctuation stays attached and trailing text is a sentence");

    auto cjk = split_sentences("첫째。둘째！셋째？");
    ok &= check(cjk.size() == 3, "full-width terminals split");

    auto p = protect_decimals(U"1.5.");
    ok &= check(p == std::u32string{U'1', kDecimalPlaceholder, U'5', U'.'},
                "only digit-period-digit is protected");
    ok &= check(restore_decimals(p) == U"1.5.", "protection is reversible");
    return ok;
}

bool test_comma_tier() {
    auto pieces = split_at_commas("하나, 둘, 셋", 9);
    bool ok = check(pieces.size() == 2, "comma split packs to budget");
    ok &= check(pieces.size() == 2 && pieces[0] == "하나," && pieces[1] == "둘, 셋",
                "separator stays with the left piece");
    auto wide = split_at_commas("가，나、다", 100);
    ok &= check(wide.size() == 1 && wide[0] == "가，나、다", "full-width commas pack together");
    return ok;
}

bool test_forced_byte_tier() {
    auto pieces = split_by_bytes("가나다라", 7);
    bool ok = check(pieces.size() == 2 && pieces[0] == "가나" && pieces[1] == "다라",
                    "forced split stops at code point boundaries");
    auto narrow = split_by_bytes("가나", 4);
    ok &= check(narrow.size() == 2 && narrow[0] == "가" && narrow[1] == "나",
                "minimum budget fits one code point");

    auto order = split_strategy_order();
    ok &= check(order.size() == 3 && order[0] == SplitStrategy::Sentence &&
                    order[1] == SplitStrategy::Comma && order[2] == SplitStrategy::ForcedByte,
                "tiers are ordered sentence, comma, forced-byte");
    ok &= check(std::string(split_strategy_name(SplitStrategy::ForcedByte)) == "forced-byte",
                "tier names");
    return ok;
}

bool test_budget_floor_logs() {
    set_log_verbosity(LogVerbosity::Warn);
    std::vector<TextChunk> chunks;
    auto log_text = test_utils::capture_stderr([&]() { chunks = chunk_text("abc def", 1); });
    bool ok = check(log_text.find("below minimum") != std::string::npos,
                    "budget below the floor is logged, got: " + log_text);
    ok &= check(chunks.size() == 2 && chunks[0].text == "abc" && chunks[1].text == "def",
                "budget raised to 4 bytes");
    set_log_verbosity(LogVerbosity::Info);
    return ok;
}

bool test_scene_chunks() {
    std::vector<SceneInput> scenes = {
        {"s1", "첫 장면입니다. 둘째 문장.", ""},
        {"s2", "   ", ""},
        {"", "셋째 장면.", ""},
    };
    auto chunks = build_chunks_for_scenes(scenes);
    bool ok = check(chunks.size() == 2, "blank scenes are skipped");
    if (chunks.size() == 2) {
        ok &= check(chunks[0].scene_id == "s1", "scene id kept");
        ok &= check(chunks[0].chunk_index == 0, "chunk index is per scene");
        ok &= check(chunks[0].sentences.size() == 2, "sentences recorded per chunk");
        ok &= check(chunks[1].scene_id == "scene_1", "missing id falls back to scene_<n>");
    }
    auto stats = estimate_chunk_stats(chunks);
    ok &= check(stats.total_chunks == 2, "stats count chunks");
    ok &= check(chunks.size() == 2 &&
                    stats.total_bytes == chunks[0].byte_length + chunks[1].byte_length,
                "stats sum bytes");
    ok &= check(stats.min_bytes <= stats.avg_bytes && stats.avg_bytes <= stats.max_bytes,
                "min <= avg <= max");
    auto none = estimate_chunk_stats({});
    ok &= check(none.total_chunks == 0 && none.min_bytes == 0, "empty stats are zero");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_empty_input();
    ok &= test_decimal_sentence_at_small_budget();
    ok &= test_forced_cut_keeps_decimal();
    ok &= test_budget_invariant_and_reconstruction();
    ok &= test_greedy_packing();
    ok &= test_sentence_tier();
    ok &= test_comma_tier();
    ok &= test_forced_byte_tier();
    ok &= test_budget_floor_logs();
    ok &= test_scene_chunks();
    return ok ? 0 : 1;
}
