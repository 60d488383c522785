/**
 * @file event_loop.h
 * @brief Single-threaded readiness loop driving all SSDP socket I/O and callbacks.
 * @details One thread waits on the registered datagram sockets (epoll on POSIX,
 *          select on Windows) and on a wake-up descriptor. Work from other threads is
 *          handed over with `post()` and runs on the loop thread between socket events,
 *          so transports, listeners and the device tracker are only ever touched from
 *          that thread.
 */
#ifndef SSDPTRACK_NET_EVENT_LOOP_H
#define SSDPTRACK_NET_EVENT_LOOP_H

#include "socket_platform.h"
#include "../configuration/ssdp_engine_settings.h"
#include "../utils/thread_safe_queue.h"
#include "../utils/threaded_component.h"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace ssdptrack {
namespace ssdp {

class EventLoop : public utils::ThreadedComponent {
public:
    using Task = std::function<void()>;
    using ReadHandler = std::function<void()>;

    explicit EventLoop(std::string logger_prefix = "[EventLoop]",
                       int poll_timeout_ms = kDefaultLoopPollTimeoutMs);

    /**
     * @brief Stops and joins the loop thread.
     * @details Must not run on the loop thread: destroying the loop (or an object
     *          owning it) from one of its own tasks or callbacks terminates the process.
     */
    ~EventLoop() override;

    void start() override;

    /**
     * @brief Stops the loop thread and joins it.
     * @details Tasks already posted are run before the thread exits. Calling `stop()`
     *          from the loop thread only signals; the join happens on a later call.
     */
    void stop() override;

    /**
     * @brief Registers `handler` to be called on the loop thread when `fd` is readable.
     * @return false if the descriptor could not be registered.
     */
    bool add_reader(socket_t fd, ReadHandler handler);
    void remove_reader(socket_t fd);

    /** @brief Queues `task` for the loop thread. Returns false once the loop is stopping. */
    bool post(Task task);

    /**
     * @brief Runs `task` on the loop thread and waits for it.
     * @details Runs inline when called on the loop thread or while the loop is not
     *          running. Exceptions thrown by `task` are rethrown to the caller.
     */
    void run_sync(const Task& task);

    bool is_loop_thread() const;

protected:
    void run() override;

private:
    bool open_wakeup();
    void close_wakeup();
    void wake();
    void consume_wakeup();
    void drain_tasks();
    void dispatch_readable(socket_t fd);

    static void increment_winsock_users();
    static void decrement_winsock_users();

    std::string logger_prefix_;
    int poll_timeout_ms_;

    utils::ThreadSafeQueue<Task> tasks_;
    std::atomic<std::thread::id> loop_thread_id_;

    std::mutex readers_mutex_;
    std::map<socket_t, ReadHandler> readers_;

#ifdef _WIN32
    socket_t wake_socket_ = SSDP_INVALID_SOCKET_VALUE;
    static std::atomic<int> winsock_user_count_;
#else
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
#endif
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_NET_EVENT_LOOP_H
