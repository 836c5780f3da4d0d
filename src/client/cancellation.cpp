#include "vidlift/client/cancellation.h"

#include <condition_variable>
#include <map>
#include <mutex>

namespace vidlift::client {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    std::size_t next_id{1};
    std::map<std::size_t, std::function<void()>> callbacks;
    // Held while callbacks run so Unregister cannot return mid-callback.
    std::mutex invoke_mutex;
};

CancellationToken::CancellationToken() : state_(std::make_shared<CancellationState>()) {}

CancellationToken::CancellationToken(std::shared_ptr<CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

std::size_t CancellationToken::OnCancel(std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            const auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::Unregister(std::size_t id) const {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> invoke(state_->invoke_mutex);
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationState>()) {}

CancellationToken CancellationSource::token() const { return CancellationToken(state_); }

void CancellationSource::Cancel() {
    std::lock_guard<std::mutex> invoke(state_->invoke_mutex);
    std::map<std::size_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration::CancellationRegistration(const CancellationToken& token,
                                                   std::function<void()> callback)
    : token_(token) {
    id_ = token_.OnCancel(std::move(callback));
}

CancellationRegistration::~CancellationRegistration() { token_.Unregister(id_); }

}  // namespace vidlift::client
