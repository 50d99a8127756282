#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <atomic>
#include <memory>

/**
 * @brief Shared cancellation flag handed to a long-running batch
 *
 * Copies share one state. The batch checks isCancelled() between items;
 * the forced flag only records that the interruption was not graceful.
 */
class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    void cancel(bool forced = false) {
        if (forced)
            m_state->forced.store(true);
        m_state->cancelled.store(true);
    }

    bool isCancelled() const { return m_state->cancelled.load(); }
    bool isForced() const { return m_state->forced.load(); }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> forced{false};
    };

    std::shared_ptr<State> m_state;
};

#endif // CANCELLATIONTOKEN_HPP
