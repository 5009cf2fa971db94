#pragma once

/// @file game_error.hpp
/// @brief Rejection carried by GameResult.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "dcr/foundation/error_code.hpp"

namespace dcr::foundation {

/// Why a verb was rejected.
///
/// Holds an ErrorCode, a player-facing message and an optional payload.
/// The only payload the engine attaches today is the Tombstone written
/// when the hero dies (ErrorCode::CharacterDead).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any payload)
        : code_(code), message_(std::move(message)), context_(std::move(payload)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// "Subsystem: message", for log lines.
    [[nodiscard]] std::string describe() const {
        std::string text(subsystem());
        if (!message_.empty()) {
            text += ": ";
            text += message_;
        }
        return text;
    }

    /// Payload of type T, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// The hero died; the caller has to Reset() before moving on.
    [[nodiscard]] bool isDeath() const noexcept { return code_ == ErrorCode::CharacterDead; }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

}  // namespace dcr::foundation
