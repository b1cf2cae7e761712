// AGORA - Logical Clock
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// The host supplies a monotonic epoch counter. Components never read it
// directly: every action receives an ActionContext snapshot instead.

#ifndef AGORA_CORE_CLOCK_H
#define AGORA_CORE_CLOCK_H

#include "agora/core/types.h"

namespace agora {

/// Monotonic, host-set epoch counter
class LogicalClock {
public:
    LogicalClock() = default;
    explicit LogicalClock(Epoch start) : now_(start) {}
    
    Epoch Now() const { return now_; }
    
    /// Move the clock to epoch. Equal values are accepted; going backwards
    /// returns InvalidInput and leaves the clock unchanged.
    DaoError Set(Epoch epoch) {
        if (epoch < now_) {
            return DaoError::InvalidInput;
        }
        now_ = epoch;
        return DaoError::OK;
    }

private:
    Epoch now_{0};
};

/// Who is acting and at what logical time
struct ActionContext {
    AccountId caller;
    Epoch now{0};
    
    ActionContext() = default;
    ActionContext(const AccountId& who, Epoch when) : caller(who), now(when) {}
};

/// Half-open [start, end) interval of epochs
struct EpochWindow {
    Epoch start{0};
    Epoch end{0};
    
    EpochWindow() = default;
    EpochWindow(Epoch s, Epoch e) : start(s), end(e) {}
    
    bool IsValid() const { return end >= start; }
    bool Contains(Epoch t) const { return t >= start && t < end; }
    bool HasClosed(Epoch t) const { return t >= end; }
};

} // namespace agora

#endif // AGORA_CORE_CLOCK_H
