#pragma once

#include "types.hpp"

#include <cstdint>

namespace pairbook {

enum class Operation : uint8_t { CreateOrder = 1, CancelOrder = 2 };

// Decides whether a mutating call may proceed (pause state, allow lists, ...)
class AccessGate {
public:
    virtual ~AccessGate() = default;

    [[nodiscard]] virtual bool permits(Operation operation, const Address& caller) const = 0;
};

// Permits everything
class OpenGate : public AccessGate {
public:
    [[nodiscard]] bool permits(Operation, const Address&) const override { return true; }
};

} // namespace pairbook
