#include "event_loop.h"

#include "../utils/cpp_logger.h"

#include <cstring>
#include <deque>
#include <exception>
#include <future>
#include <stdexcept>
#include <vector>

#ifndef _WIN32
    #include <sys/epoll.h>
    #include <sys/eventfd.h>
#endif

namespace ssdptrack {
namespace ssdp {

#ifdef _WIN32
std::atomic<int> EventLoop::winsock_user_count_(0);
#endif

void EventLoop::increment_winsock_users() {
#ifdef _WIN32
    if (winsock_user_count_.fetch_add(1) == 0) {
        WSADATA wsaData;
        int iResult = WSAStartup(MAKEWORD(2, 2), &wsaData);
        if (iResult != 0) {
            winsock_user_count_.fetch_sub(1);
            throw std::runtime_error("WSAStartup failed: " + std::to_string(iResult));
        }
    }
#endif
}

void EventLoop::decrement_winsock_users() {
#ifdef _WIN32
    if (winsock_user_count_.fetch_sub(1) == 1) {
        WSACleanup();
    }
#endif
}

EventLoop::EventLoop(std::string logger_prefix, int poll_timeout_ms)
    : logger_prefix_(std::move(logger_prefix)),
      poll_timeout_ms_(poll_timeout_ms > 0 ? poll_timeout_ms : kDefaultLoopPollTimeoutMs),
      loop_thread_id_(std::thread::id()) {
    increment_winsock_users();
}

EventLoop::~EventLoop() {
    if (is_loop_thread()) {
        // run() is still on the stack and would keep using this object.
        LOG_CPP_ERROR("%s Event loop destroyed from its own thread", logger_prefix_.c_str());
        std::terminate();
    }
    stop();
    decrement_winsock_users();
}

void EventLoop::start() {
    if (is_running()) {
        return;
    }
    if (component_thread_.joinable()) {
        component_thread_.join();
    }
    if (!open_wakeup()) {
        throw std::runtime_error(logger_prefix_ + " Failed to create event loop wake-up descriptor");
    }

#ifndef _WIN32
    {
        std::lock_guard<std::mutex> lock(readers_mutex_);
        for (const auto& reader : readers_) {
            struct epoll_event event;
            std::memset(&event, 0, sizeof(event));
            event.events = EPOLLIN;
            event.data.fd = reader.first;
            if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, reader.first, &event) == -1) {
                LOG_CPP_ERROR("%s Failed to re-add socket %d to epoll", logger_prefix_.c_str(), reader.first);
            }
        }
    }
#endif

    tasks_.reset();
    stop_flag_ = false;
    component_thread_ = std::thread(&EventLoop::run, this);
    LOG_CPP_DEBUG("%s Event loop started.", logger_prefix_.c_str());
}

void EventLoop::stop() {
    if (stop_flag_ && !component_thread_.joinable()) {
        return;
    }
    stop_flag_ = true;
    wake();
    if (is_loop_thread()) {
        return;
    }
    if (component_thread_.joinable()) {
        component_thread_.join();
    }
    close_wakeup();
    LOG_CPP_DEBUG("%s Event loop stopped.", logger_prefix_.c_str());
}

bool EventLoop::add_reader(socket_t fd, ReadHandler handler) {
    std::lock_guard<std::mutex> lock(readers_mutex_);
#ifndef _WIN32
    if (epoll_fd_ != -1) {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = EPOLLIN;
        event.data.fd = fd;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event) == -1) {
            LOG_CPP_ERROR("%s Failed to add socket to epoll: %s", logger_prefix_.c_str(), strerror(errno));
            return false;
        }
    }
#endif
    readers_[fd] = std::move(handler);
    return true;
}

void EventLoop::remove_reader(socket_t fd) {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    if (readers_.erase(fd) == 0) {
        return;
    }
#ifndef _WIN32
    if (epoll_fd_ != -1 && epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        LOG_CPP_DEBUG("%s epoll_ctl(DEL) failed for socket %d: %s", logger_prefix_.c_str(), fd, strerror(errno));
    }
#endif
}

bool EventLoop::post(Task task) {
    if (!tasks_.push(std::move(task))) {
        LOG_CPP_DEBUG("%s Dropping task posted to a stopping loop.", logger_prefix_.c_str());
        return false;
    }
    wake();
    return true;
}

void EventLoop::run_sync(const Task& task) {
    if (is_loop_thread() || !is_running()) {
        task();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> result = done->get_future();
    const bool queued = post([task, done]() {
        try {
            task();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        task();
        return;
    }
    result.get();
}

bool EventLoop::is_loop_thread() const {
    return loop_thread_id_.load() == std::this_thread::get_id();
}

void EventLoop::run() {
    loop_thread_id_ = std::this_thread::get_id();
    LOG_CPP_DEBUG("%s Event loop thread started.", logger_prefix_.c_str());

#ifndef _WIN32
    const int kMaxEvents = 64;
    struct epoll_event events[kMaxEvents];
#endif

    while (!stop_flag_) {
        drain_tasks();
        if (stop_flag_) {
            break;
        }

#ifdef _WIN32
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(wake_socket_, &read_fds);
        std::vector<socket_t> watched;
        {
            std::lock_guard<std::mutex> lock(readers_mutex_);
            for (const auto& reader : readers_) {
                FD_SET(reader.first, &read_fds);
                watched.push_back(reader.first);
            }
        }
        struct timeval tv;
        tv.tv_sec = poll_timeout_ms_ / 1000;
        tv.tv_usec = (poll_timeout_ms_ % 1000) * 1000;

        int n_events = select(0, &read_fds, nullptr, nullptr, &tv);
#else
        int n_events = epoll_wait(epoll_fd_, events, kMaxEvents, poll_timeout_ms_);
#endif

        if (stop_flag_) {
            break;
        }

        if (n_events < 0) {
#ifdef _WIN32
            if (WSAGetLastError() == WSAEINTR) {
                continue;
            }
            LOG_CPP_ERROR("%s select() error: %d", logger_prefix_.c_str(), WSAGetLastError());
#else
            if (errno == EINTR) {
                continue;
            }
            LOG_CPP_ERROR("%s epoll_wait() error: %s", logger_prefix_.c_str(), strerror(errno));
#endif
            continue;
        }

#ifdef _WIN32
        if (FD_ISSET(wake_socket_, &read_fds)) {
            consume_wakeup();
        }
        for (socket_t fd : watched) {
            if (FD_ISSET(fd, &read_fds)) {
                dispatch_readable(fd);
            }
        }
#else
        for (int i = 0; i < n_events; ++i) {
            if (!(events[i].events & (EPOLLIN | EPOLLERR))) {
                continue;
            }
            if (events[i].data.fd == wake_fd_) {
                consume_wakeup();
                continue;
            }
            dispatch_readable(events[i].data.fd);
        }
#endif
    }

    // Work queued before stop() still runs.
    drain_tasks();
    tasks_.stop();
    drain_tasks();

    LOG_CPP_DEBUG("%s Event loop thread finished.", logger_prefix_.c_str());
    loop_thread_id_ = std::thread::id();
}

void EventLoop::drain_tasks() {
    std::deque<Task> pending;
    tasks_.drain(pending);
    for (auto& task : pending) {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_CPP_ERROR("%s Task raised an exception: %s", logger_prefix_.c_str(), e.what());
        }
    }
}

void EventLoop::dispatch_readable(socket_t fd) {
    ReadHandler handler;
    {
        std::lock_guard<std::mutex> lock(readers_mutex_);
        auto it = readers_.find(fd);
        if (it == readers_.end()) {
            return;
        }
        handler = it->second;
    }
    try {
        handler();
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("%s Read handler raised an exception: %s", logger_prefix_.c_str(), e.what());
    }
}

#ifdef _WIN32

bool EventLoop::open_wakeup() {
    if (wake_socket_ != SSDP_INVALID_SOCKET_VALUE) {
        return true;
    }
    wake_socket_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (wake_socket_ == SSDP_INVALID_SOCKET_VALUE) {
        LOG_CPP_ERROR("%s Failed to create wake-up socket: %d", logger_prefix_.c_str(), WSAGetLastError());
        return false;
    }
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    // Bound to an ephemeral loopback port and connected to itself.
    int len = sizeof(addr);
    if (bind(wake_socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        getsockname(wake_socket_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0 ||
        connect(wake_socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        LOG_CPP_ERROR("%s Failed to set up wake-up socket: %d", logger_prefix_.c_str(), WSAGetLastError());
        closesocket(wake_socket_);
        wake_socket_ = SSDP_INVALID_SOCKET_VALUE;
        return false;
    }
    u_long non_blocking = 1;
    ioctlsocket(wake_socket_, FIONBIO, &non_blocking);
    return true;
}

void EventLoop::close_wakeup() {
    if (wake_socket_ != SSDP_INVALID_SOCKET_VALUE) {
        closesocket(wake_socket_);
        wake_socket_ = SSDP_INVALID_SOCKET_VALUE;
    }
}

void EventLoop::wake() {
    if (wake_socket_ != SSDP_INVALID_SOCKET_VALUE) {
        const char byte = 1;
        send(wake_socket_, &byte, 1, 0);
    }
}

void EventLoop::consume_wakeup() {
    char buffer[64];
    while (recv(wake_socket_, buffer, sizeof(buffer), 0) > 0) {
    }
}

#else

bool EventLoop::open_wakeup() {
    if (epoll_fd_ != -1) {
        return true;
    }
    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ == -1) {
        LOG_CPP_ERROR("%s Failed to create epoll instance: %s", logger_prefix_.c_str(), strerror(errno));
        return false;
    }
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ == -1) {
        LOG_CPP_ERROR("%s Failed to create eventfd: %s", logger_prefix_.c_str(), strerror(errno));
        close(epoll_fd_);
        epoll_fd_ = -1;
        return false;
    }
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &event) == -1) {
        LOG_CPP_ERROR("%s Failed to add eventfd to epoll: %s", logger_prefix_.c_str(), strerror(errno));
        close_wakeup();
        return false;
    }
    return true;
}

void EventLoop::close_wakeup() {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    if (wake_fd_ != -1) {
        close(wake_fd_);
        wake_fd_ = -1;
    }
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

void EventLoop::wake() {
    if (wake_fd_ != -1) {
        const uint64_t one = 1;
        if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            LOG_CPP_WARNING("%s Failed to signal event loop: %s", logger_prefix_.c_str(), strerror(errno));
        }
    }
}

void EventLoop::consume_wakeup() {
    uint64_t value = 0;
    while (read(wake_fd_, &value, sizeof(value)) > 0) {
    }
}

#endif

} // namespace ssdp
} // namespace ssdptrack
