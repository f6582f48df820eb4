//
//  synthesis_text.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

namespace narrationforge {

struct SynthesisTextOptions {
    // Read `1.5` as `1점5`. Off by default so chunk text stays byte-identical
    // to the narration it came from.
    bool spell_out_decimals = false;
};

/**
 * @brief Light clean-up applied to a chunk right before it is sent for synthesis.
 *
 * - a comma directly followed by a non-space gets a space (`a,b` -> `a, b`)
 * - comma runs (`,,` or `, ,`) collapse to one comma
 * - optionally spells out decimal points (see SynthesisTextOptions)
 */
std::string preprocess_for_synthesis(std::string_view text, const SynthesisTextOptions &options = {});

// Escape `&`, `<` and `>` for inclusion in pacing markup. Quotes are left alone.
std::string escape_markup(std::string_view text);

}  // namespace narrationforge
