//
//  scene_input.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace narrationforge {

/// @ingroup api
/// One scene of a multi-scene narration request.
struct SceneInput {
    std::string id;         ///< Scene identifier (optional; generated when empty)
    std::string narration;  ///< UTF-8 narration text
    std::string emotion;    ///< Pacing hint used by the scene timeline (e.g. "nostalgia")
    std::string speaker;    ///< Caption speaker tag (empty or "나레이션" for the narrator)
};

}  // namespace narrationforge
