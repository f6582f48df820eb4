//
//  korean_numerals.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace narrationforge {

using NumeralRuleFn = std::u32string (*)(const std::u32string &);

/// One step of spoken-numeral conversion.
struct NumeralRule {
    const char *name;
    NumeralRuleFn apply;
};

/**
 * @brief Conversion rules in application order.
 *
 * Order matters: compounds are converted before their parts so that e.g.
 * `일흔여섯` is never seen as `일흔` + `여섯`.
 *
 *  1. native-tens-ones      일흔여섯 -> 76
 *  2. native-tens           스물 살 -> 20 살
 *  3. native-ones-counter   세 명 -> 3 명
 *  4. sino-digit-run        일일구 -> 119
 *  5. sino-tens             사십칠 -> 47, 이십 -> 20, 십오 -> 15, 십 -> 10
 *  6. large-units           3백5 -> 305, 2천 -> 2000
 *  7. spacing               50 만 원 -> 50만원, 76 살 -> 76살
 */
const std::vector<NumeralRule> &numeral_rules();

// Apply a single rule by name; unknown names return `text` unchanged.
std::string apply_numeral_rule(std::string_view name, std::string_view text);

// Display-only conversion of spoken numerals to digits.
std::string convert_spoken_numerals(std::string_view text);

}  // namespace narrationforge
