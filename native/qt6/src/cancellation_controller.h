#pragma once

#include <QtGlobal>
#include <atomic>

/**
 * @brief Cooperative stop signal shared by the caller and the run's worker.
 *
 * The caller calls requestCancel(); the worker polls isCancelRequested()
 * once per consumed output line and on every idle poll. Signalling the tool
 * is left to the worker's ProcessSupervisor, the only place that knows
 * whether the child has been reaped (and its process group id freed).
 * requestCount() lets it re-send the signal for every redundant cancel.
 */
class CancellationController {
public:
    CancellationController() = default;
    Q_DISABLE_COPY(CancellationController)

    // Safe from any thread, never blocks. Only the first call flips the flag.
    void requestCancel();
    bool isCancelRequested() const { return m_requested.load(); }
    int requestCount() const { return m_requests.load(); }

    // Fresh state for the next run.
    void reset();

private:
    std::atomic_bool m_requested{false};
    std::atomic_int m_requests{0};
};
