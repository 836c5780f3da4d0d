#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace vidlift::client {

struct CancellationState;

/// @brief Observer side of a cancellation signal. Copies share the same state.
class CancellationToken {
public:
    /// @brief A token that is never cancelled.
    CancellationToken();

    bool IsCancelled() const;
    /// @brief Registers `callback` to run once on cancel; runs it inline if already cancelled.
    /// @return Registration id for `Unregister`, 0 when the callback already ran.
    std::size_t OnCancel(std::function<void()> callback) const;
    /// @brief Removes a callback. Blocks while cancel callbacks are running.
    void Unregister(std::size_t id) const;
    /// @brief Sleeps up to `duration`. Returns false if cancelled before or during the wait.
    bool WaitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationState> state);

    std::shared_ptr<CancellationState> state_;
};

/// @brief Owner side of a cancellation signal.
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;
    /// @brief Sets the flag, wakes waiters and runs registered callbacks. Idempotent.
    void Cancel();
    bool IsCancelled() const;

private:
    std::shared_ptr<CancellationState> state_;
};

/// @brief Scoped callback registration on a token.
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    std::size_t id_{0};
};

}  // namespace vidlift::client
