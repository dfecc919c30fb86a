#ifndef CALCPILOT_SHUTDOWN_MANAGER_H
#define CALCPILOT_SHUTDOWN_MANAGER_H

#include <atomic>

namespace calcpilot {

/**
 * @brief Process-wide stop flag set from signal handlers and polled before every click
 */
class ShutdownManager {
public:
    static ShutdownManager& getInstance() {
        static ShutdownManager instance;
        return instance;
    }

    void requestShutdown() {
        m_shutdown_requested = true;
    }

    bool isShutdownRequested() const {
        return m_shutdown_requested.load();
    }

    // A second Ctrl-C forces exit
    int incrementInterruptCount() {
        return ++m_interrupt_count;
    }

private:
    ShutdownManager() : m_shutdown_requested(false), m_interrupt_count(0) {}

    std::atomic<bool> m_shutdown_requested;
    std::atomic<int> m_interrupt_count;
};

} // namespace calcpilot

#endif // CALCPILOT_SHUTDOWN_MANAGER_H
