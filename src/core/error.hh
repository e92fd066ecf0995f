#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rsec {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::uint8_t {
    OK = 0,
    INVALID_PARAMETERS = 1,   // Bad k/p, buffer length mismatch, bad erasure index
    UNRECOVERABLE_LOSS = 2,   // More erasures than parity blocks
    SINGULAR_SUBMATRIX = 3,   // No pivot while inverting the survivor rows
};

[[nodiscard]] constexpr std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::INVALID_PARAMETERS: return "invalid_parameters";
        case ErrorCode::UNRECOVERABLE_LOSS: return "unrecoverable_loss";
        case ErrorCode::SINGULAR_SUBMATRIX: return "singular_submatrix";
    }
    return "unknown";
}

// ============================================================================
// Erasure Error
// ============================================================================

class ErasureError : public std::runtime_error {
public:
    ErasureError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_string(code)) + ": " + message)
        , code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace rsec
