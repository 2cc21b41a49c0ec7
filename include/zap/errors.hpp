#ifndef ZAP_ERRORS_HPP
#define ZAP_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zap {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    ZERO_AMOUNT = -1,                    // zero input amount or zero liquidity
    PAIR_NOT_FOUND = -2,                 // pool does not exist
    SWAP_BOUNDS_VIOLATED = -3,           // pre-swap not in (0, amount)
    INVALID_SLIPPAGE = -4,               // tolerance above 10000 bps
    SLIPPAGE_EXCEEDED = -5,              // realized result below caller's floor
    UNSUPPORTED_OUTPUT_TOKEN = -6,       // output asset is neither pair asset
    UNSUPPORTED_INPUT_TOKEN = -7,        // input asset is neither pair asset
    EXTERNAL_COLLABORATOR_FAILURE = -20, // router, pool or asset rejected a call
    REENTRANCY_VIOLATION = -30
};

const char* to_string(ErrorCode code);

// =============================================================================
// ZapError - every zap failure, distinguishable by code
// =============================================================================

class ZapError : public std::runtime_error {
public:
    ZapError(ErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(to_string(code)) + ": " + msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Raised by collaborators (router, pool, asset) when they reject a call.
// The reason text is the collaborator's own and is propagated verbatim.
class CollaboratorError : public ZapError {
public:
    explicit CollaboratorError(const std::string& reason)
        : ZapError(ErrorCode::EXTERNAL_COLLABORATOR_FAILURE, reason), reason_(reason) {}

    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

} // namespace zap

#endif // ZAP_ERRORS_HPP
