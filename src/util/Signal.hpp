#pragma once
// Signal.hpp - Minimal synchronous observer list
// Qt signals need QObject, this doesn't

#include <functional>
#include <vector>

namespace nd {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    void connect(Slot slot) {
        slots_.push_back(std::move(slot));
    }

    void emitSignal(Args... args) {
        for (auto& slot : slots_) {
            slot(args...);
        }
    }

private:
    std::vector<Slot> slots_;
};

} // namespace nd
