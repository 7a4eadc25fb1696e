#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pairbook {

enum class ErrorCode : uint8_t {
    InvalidPair = 1,     // tokenIn == tokenOut
    InvalidAmounts = 2,  // zero amountIn or amountOut
    Unauthorized = 3,    // cancel by someone other than the maker
    InvalidState = 4,    // operation on a non-Open order
    TransferFailure = 5, // ledger refused or threw
    OrderNotFound = 6,
    AccessDenied = 7,    // access gate refused the call
    ReentrantCall = 8    // mutating call while another one is in progress
};

[[nodiscard]] inline const char* toString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidPair:
        return "InvalidPair";
    case ErrorCode::InvalidAmounts:
        return "InvalidAmounts";
    case ErrorCode::Unauthorized:
        return "Unauthorized";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::TransferFailure:
        return "TransferFailure";
    case ErrorCode::OrderNotFound:
        return "OrderNotFound";
    case ErrorCode::AccessDenied:
        return "AccessDenied";
    case ErrorCode::ReentrantCall:
        return "ReentrantCall";
    }
    return "Unknown";
}

// Every failure aborts the whole call; nothing is committed before it is thrown
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message), m_code(code)
    {
    }

    [[nodiscard]] ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace pairbook
