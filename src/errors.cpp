#include "zap/errors.hpp"

namespace zap {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::ZERO_AMOUNT: return "ZeroAmount";
        case ErrorCode::PAIR_NOT_FOUND: return "PairNotFound";
        case ErrorCode::SWAP_BOUNDS_VIOLATED: return "SwapBoundsViolated";
        case ErrorCode::INVALID_SLIPPAGE: return "InvalidSlippage";
        case ErrorCode::SLIPPAGE_EXCEEDED: return "SlippageExceeded";
        case ErrorCode::UNSUPPORTED_OUTPUT_TOKEN: return "UnsupportedOutputToken";
        case ErrorCode::UNSUPPORTED_INPUT_TOKEN: return "UnsupportedInputToken";
        case ErrorCode::EXTERNAL_COLLABORATOR_FAILURE: return "ExternalCollaboratorFailure";
        case ErrorCode::REENTRANCY_VIOLATION: return "ReentrancyViolation";
    }
    return "Unknown";
}

} // namespace zap
