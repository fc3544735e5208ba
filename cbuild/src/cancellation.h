#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace profile_export {

/**
 * Caller-owned stop signal for a running export.
 *
 * cancel() is idempotent and may be called from any thread, including a
 * signal-watching thread. Callbacks registered through a Registration run
 * once, on the cancelling thread.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Callbacks run with mutex_ held so that a Registration being destroyed
    // waits for its callback to finish. They must not call back into the token.
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        for (auto& [id, callback] : callbacks_) {
            callback();
        }
        callbacks_.clear();
    }

    bool is_cancelled() const {
        return cancelled_.load();
    }

    /**
     * RAII handle for an on-cancel callback. Destroying it unregisters the
     * callback; if the token is already cancelled the callback runs
     * immediately inside the constructor.
     */
    class Registration {
    public:
        Registration(CancellationToken* token, std::function<void()> callback)
            : token_(token), id_(0) {
            if (token_ == nullptr) {
                return;
            }
            bool run_now = false;
            {
                std::lock_guard<std::mutex> lock(token_->mutex_);
                if (token_->cancelled_) {
                    run_now = true;
                } else {
                    id_ = ++token_->next_id_;
                    token_->callbacks_.emplace(id_, std::move(callback));
                }
            }
            if (run_now) {
                callback();
            }
        }

        ~Registration() {
            if (token_ != nullptr && id_ != 0) {
                std::lock_guard<std::mutex> lock(token_->mutex_);
                token_->callbacks_.erase(id_);
            }
        }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        CancellationToken* token_;
        uint64_t id_;
    };

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<uint64_t, std::function<void()>> callbacks_;
    uint64_t next_id_ = 0;
};

} // namespace profile_export
