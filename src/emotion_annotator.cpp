//
//  emotion_annotator.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "emotion_annotator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "logging.hpp"
#include "synthesis_text.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

namespace {

AnnotatedChunk plain_chunk(std::string_view chunk, size_t hard_ceiling) {
    AnnotatedChunk out{};
    out.content = std::string(chunk);
    if (out.content.size() >= hard_ceiling) {
        const size_t keep = utf8_prefix_within(out.content, hard_ceiling > 0 ? hard_ceiling - 1 : 0);
        NF_LOG("warn", "annotator: plain chunk of " << out.content.size()
                                                    << " bytes reaches ceiling " << hard_ceiling
                                                    << "; truncating to " << keep);
        out.content.resize(keep);
    }
    out.byte_length = out.content.size();
    return out;
}

}  // namespace

const std::vector<std::string> &emotion_lexicon() {
    static const std::vector<std::string> lexicon = {
        // physical reactions
        "눈물이", "눈시울", "손이 떨", "목이 메", "가슴이 먹먹", "잠이 오지", "밥이 넘어가지",
        "숨이 막", "몸이 굳",
        // emotional states
        "마음이 무거", "희망이", "미안", "허무", "믿기지 않", "슬", "아프", "고통", "절망", "두려",
        "무서", "감사", "감격", "벅차", "뭉클", "찡",
        // intensifiers
        "정말", "진심으로", "간절히", "애타게", "처절하게",
        // loss and finality
        "마지막", "이별", "죽음", "떠나", "영원히",
    };
    return lexicon;
}

bool contains_emotion_trigger(std::string_view text) {
    const auto &lexicon = emotion_lexicon();
    return std::any_of(lexicon.begin(), lexicon.end(), [&](const std::string &kw) {
        return text.find(kw) != std::string_view::npos;
    });
}

double emotion_rate(double base_rate) {
    return std::max(kMinSpeakingRate, base_rate * kEmotionRateFactor);
}

AnnotatedChunk annotate(std::string_view chunk, double base_rate, size_t hard_ceiling) {
    const auto sentences = split_sentences(chunk);

    std::ostringstream rate;
    rate << std::fixed << std::setprecision(2) << emotion_rate(base_rate);

    std::vector<std::string> parts;
    parts.reserve(sentences.size());
    bool has_emotion = false;
    for (const auto &sentence : sentences) {
        if (!contains_emotion_trigger(sentence)) {
            parts.push_back(escape_markup(sentence));
            continue;
        }
        has_emotion = true;
        parts.push_back("<break time=\"300ms\"/><prosody rate=\"" + rate.str() + "\">" +
                        escape_markup(sentence) + "</prosody><break time=\"200ms\"/>");
    }

    if (!has_emotion) {
        return plain_chunk(chunk, hard_ceiling);
    }

    std::string markup = "<speak>";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            markup += ' ';
        }
        markup += parts[i];
    }
    markup += "</speak>";

    if (markup.size() >= hard_ceiling) {
        NF_LOG("warn", "annotator: markup of " << markup.size() << " bytes reaches ceiling "
                                               << hard_ceiling << "; sending plain text");
        return plain_chunk(chunk, hard_ceiling);
    }

    AnnotatedChunk out{};
    out.byte_length = markup.size();
    out.content = std::move(markup);
    out.is_markup = true;
    NF_LOG("debug", "annotator: markup chunk " << out.byte_length << " bytes, rate "
                                               << rate.str());
    return out;
}

}  // namespace narrationforge
