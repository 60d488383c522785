/**
 * @file threaded_component.h
 * @brief Defines the ThreadedComponent abstract base class.
 * @details Long-running parts of the engine that own a thread (the event loop) share
 *          this lifecycle: `start()` launches `run()` on `component_thread_`,
 *          `stop()` raises `stop_flag_` and joins.
 */
#ifndef SSDPTRACK_THREADED_COMPONENT_H
#define SSDPTRACK_THREADED_COMPONENT_H

#include <atomic>
#include <thread>

namespace ssdptrack {
namespace utils {

/**
 * @class ThreadedComponent
 * @brief Abstract base class for components running their own processing thread.
 */
class ThreadedComponent {
public:
    virtual ~ThreadedComponent() = default;

    ThreadedComponent(const ThreadedComponent&) = delete;
    ThreadedComponent& operator=(const ThreadedComponent&) = delete;
    ThreadedComponent(ThreadedComponent&&) = delete;
    ThreadedComponent& operator=(ThreadedComponent&&) = delete;

    /**
     * @brief Starts the component's processing thread.
     * @details Implementations clear `stop_flag_` and launch `component_thread_`
     *          executing `run()`.
     */
    virtual void start() = 0;

    /**
     * @brief Signals the processing thread to stop and joins it.
     */
    virtual void stop() = 0;

    /**
     * @brief Checks if the component's thread is currently running.
     */
    bool is_running() const {
        return component_thread_.joinable() && !stop_flag_;
    }

protected:
    ThreadedComponent() : stop_flag_(true) {}

    /** @brief The processing loop executed by `component_thread_`. */
    virtual void run() = 0;

    std::thread component_thread_;
    std::atomic<bool> stop_flag_;
};

} // namespace utils
} // namespace ssdptrack

#endif // SSDPTRACK_THREADED_COMPONENT_H
