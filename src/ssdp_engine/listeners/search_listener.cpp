#include "search_listener.h"

#include "../protocol/ssdp_codec.h"
#include "../ssdp_types.h"
#include "../utils/cpp_logger.h"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace ssdptrack {
namespace ssdp {

SsdpSearchListener::SsdpSearchListener(SearchCallback callback,
                                       std::optional<AddressTuple> source,
                                       std::optional<AddressTuple> target,
                                       SsdpEngineSettings settings,
                                       EventLoop* loop,
                                       TransportFactory transport_factory,
                                       ConnectCallback connect_callback)
    : logger_prefix_("[SsdpSearchListener]"),
      callback_(std::move(callback)),
      connect_callback_(std::move(connect_callback)),
      requested_source_(std::move(source)),
      requested_target_(std::move(target)),
      settings_(sanitize_settings(std::move(settings))),
      transport_factory_(std::move(transport_factory)),
      loop_(loop),
      state_(State::IDLE) {
    if (!loop_) {
        owned_loop_ = std::make_unique<EventLoop>("[SsdpSearchListener:loop]", settings_.loop_poll_timeout_ms);
        loop_ = owned_loop_.get();
    }
}

SsdpSearchListener::~SsdpSearchListener() {
    stop();
}

void SsdpSearchListener::start() {
    if (state_ == State::STARTED) {
        LOG_CPP_WARNING("%s Already started.", logger_prefix_.c_str());
        return;
    }

    target_ = requested_target_ ? *requested_target_ : default_ssdp_target(requested_source_);
    source_ = get_source_address_tuple(target_, requested_source_);
    LOG_CPP_INFO("%s Starting, source %s, target %s", logger_prefix_.c_str(),
                 source_.to_string().c_str(), target_.to_string().c_str());

    if (owned_loop_) {
        owned_loop_->start();
    }

    TransportSpec spec;
    spec.source = source_;
    spec.target = target_;
    spec.role = TransportRole::SEARCH;
    spec.settings = settings_;

    TransportCallbacks callbacks;
    callbacks.on_connect = [this](ISsdpTransport& transport) { on_connect(transport); };
    callbacks.on_data = [this](const std::string& request_line, const SsdpHeaders& headers) {
        on_data(request_line, headers);
    };

    // Created on the loop thread so on_connect cannot run before the state is set.
    try {
        loop_->run_sync([this, &spec, &callbacks]() {
            transport_ = transport_factory_(spec, *loop_, std::move(callbacks));
            state_ = State::STARTED;
        });
    } catch (...) {
        if (owned_loop_) {
            owned_loop_->stop();
        }
        throw;
    }
}

void SsdpSearchListener::search(const std::optional<AddressTuple>& override_target) {
    if (state_ != State::STARTED || !transport_) {
        throw std::logic_error("SsdpSearchListener::search() called before start()");
    }
    send_search(*transport_, override_target ? *override_target : target_);
}

void SsdpSearchListener::send_search(ISsdpTransport& transport, const AddressTuple& destination) {
    // Many devices ignore a search whose HOST is not the standard group.
    const AddressTuple host_target = is_multicast(target_) ? target_ : default_ssdp_target(target_);
    const std::string packet = build_ssdp_search_packet(host_target, settings_.search_mx, settings_.search_target);
    LOG_CPP_DEBUG("%s Sending M-SEARCH for %s to %s", logger_prefix_.c_str(),
                  settings_.search_target.c_str(), destination.to_string().c_str());
    transport.send(packet, destination);
}

void SsdpSearchListener::stop() {
    if (state_ != State::STARTED) {
        return;
    }
    state_ = State::STOPPED;
    LOG_CPP_INFO("%s Stopping.", logger_prefix_.c_str());
    loop_->run_sync([this]() {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
    });
    if (owned_loop_) {
        owned_loop_->stop();
    }
}

void SsdpSearchListener::on_connect(ISsdpTransport& /*transport*/) {
    LOG_CPP_DEBUG("%s Transport ready.", logger_prefix_.c_str());
    if (connect_callback_) {
        connect_callback_();
    }
}

void SsdpSearchListener::on_data(const std::string& request_line, const SsdpHeaders& headers) {
    if (headers.get_or("MAN", "") == kSsdpDiscover) {
        LOG_CPP_DEBUG("%s Ignoring search request: %s", logger_prefix_.c_str(), request_line.c_str());
        return;
    }
    if (headers.contains("NTS")) {
        LOG_CPP_DEBUG("%s Ignoring advertisement: %s", logger_prefix_.c_str(), request_line.c_str());
        return;
    }

    SsdpHeaders tagged = headers;
    set_source(tagged, SsdpSource::SEARCH);

    if (!is_multicast(target_)) {
        const std::string expected_host = get_host_string(target_);
        const std::string sender_host = tagged.get_or("_host", "");
        if (sender_host != expected_host) {
            LOG_CPP_DEBUG("%s Ignoring response from %s, expected %s", logger_prefix_.c_str(),
                          sender_host.c_str(), expected_host.c_str());
            return;
        }
    }

    if (callback_) {
        callback_(tagged);
    }
}

void search(const SsdpSearchListener::SearchCallback& callback,
            int timeout_seconds,
            const std::string& search_target,
            std::optional<AddressTuple> source,
            std::optional<AddressTuple> target,
            TransportFactory transport_factory) {
    if (timeout_seconds <= 0) {
        throw std::invalid_argument("search timeout must be positive, got " + std::to_string(timeout_seconds));
    }
    SsdpEngineSettings settings;
    settings.search_mx = timeout_seconds;
    settings.search_target = search_target;

    SsdpSearchListener* listener_ptr = nullptr;
    SsdpSearchListener listener(callback,
                                std::move(source),
                                std::move(target),
                                settings,
                                nullptr,
                                std::move(transport_factory),
                                [&listener_ptr]() {
                                    if (listener_ptr) {
                                        listener_ptr->search();
                                    }
                                });
    listener_ptr = &listener;
    listener.start();

    std::this_thread::sleep_for(std::chrono::seconds(listener.settings().search_mx));

    listener.stop();
}

} // namespace ssdp
} // namespace ssdptrack
