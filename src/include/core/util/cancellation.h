#pragma once

#include <atomic>
#include <core/network/client/transfer_fault.h>

namespace reup::core {

class CancellationSignal {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    void Reset() noexcept { cancelled_.store(false, std::memory_order_release); }

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw OperationCancelled();
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace reup::core
