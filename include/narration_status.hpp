//
//  narration_status.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace narrationforge {

/// @ingroup api
enum class StatusCode {
    Ok,
    InvalidInput,     ///< rejected before any work was done
    Authorization,    ///< provider refused the credentials (401/403)
    ProviderFailure,  ///< any other non-2xx provider answer
    Timeout,          ///< provider call exceeded its deadline
    Internal,         ///< unexpected exception
};

inline const char *status_code_name(StatusCode code) {
    switch (code) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::InvalidInput:
            return "invalid-input";
        case StatusCode::Authorization:
            return "authorization";
        case StatusCode::ProviderFailure:
            return "provider-failure";
        case StatusCode::Timeout:
            return "timeout";
        case StatusCode::Internal:
            return "internal";
    }
    return "unknown";
}

/**
 * @brief Result object with success flag, error class and optional message.
 *
 * When `ok == true`, `code` is Ok and `message` is empty. On failure, `message`
 * describes what went wrong; provider failures carry the provider body verbatim.
 */
struct NarrationStatus {
    bool ok{false};
    std::string message;
    StatusCode code{StatusCode::Internal};
};

inline NarrationStatus make_status(bool ok, std::string msg = {},
                                   StatusCode code = StatusCode::Internal) {
    return NarrationStatus{ok, std::move(msg), ok ? StatusCode::Ok : code};
}

}  // namespace narrationforge
