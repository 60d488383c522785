#include "advertisement_listener.h"

#include "../ssdp_types.h"
#include "../utils/cpp_logger.h"

namespace ssdptrack {
namespace ssdp {

SsdpAdvertisementListener::SsdpAdvertisementListener(AdvertisementCallback on_alive,
                                                     AdvertisementCallback on_byebye,
                                                     AdvertisementCallback on_update,
                                                     std::optional<AddressTuple> source,
                                                     std::optional<AddressTuple> target,
                                                     SsdpEngineSettings settings,
                                                     EventLoop* loop,
                                                     TransportFactory transport_factory)
    : logger_prefix_("[SsdpAdvertisementListener]"),
      on_alive_(std::move(on_alive)),
      on_byebye_(std::move(on_byebye)),
      on_update_(std::move(on_update)),
      requested_source_(std::move(source)),
      requested_target_(std::move(target)),
      settings_(sanitize_settings(std::move(settings))),
      transport_factory_(std::move(transport_factory)),
      loop_(loop),
      state_(State::IDLE) {
    if (!loop_) {
        owned_loop_ = std::make_unique<EventLoop>("[SsdpAdvertisementListener:loop]", settings_.loop_poll_timeout_ms);
        loop_ = owned_loop_.get();
    }
}

SsdpAdvertisementListener::~SsdpAdvertisementListener() {
    stop();
}

void SsdpAdvertisementListener::start() {
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
    spec.role = TransportRole::ADVERTISEMENT;
    spec.settings = settings_;

    TransportCallbacks callbacks;
    callbacks.on_data = [this](const std::string& request_line, const SsdpHeaders& headers) {
        on_data(request_line, headers);
    };

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

void SsdpAdvertisementListener::stop() {
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

void SsdpAdvertisementListener::on_data(const std::string& request_line, const SsdpHeaders& headers) {
    if (headers.get_or("MAN", "") == kSsdpDiscover) {
        LOG_CPP_DEBUG("%s Ignoring search request: %s", logger_prefix_.c_str(), request_line.c_str());
        return;
    }

    auto nts_value = headers.get("NTS");
    if (!nts_value) {
        LOG_CPP_DEBUG("%s Got non-advertisement packet: %s", logger_prefix_.c_str(), request_line.c_str());
        return;
    }

    auto nts = notification_sub_type_from_string(*nts_value);
    if (!nts) {
        LOG_CPP_DEBUG("%s Unknown NTS value: %s", logger_prefix_.c_str(), nts_value->c_str());
        return;
    }

    SsdpHeaders tagged = headers;
    set_source(tagged, SsdpSource::ADVERTISEMENT);

    switch (*nts) {
        case NotificationSubType::ALIVE:
            if (on_alive_) {
                on_alive_(tagged);
            }
            break;
        case NotificationSubType::BYEBYE:
            if (on_byebye_) {
                on_byebye_(tagged);
            }
            break;
        case NotificationSubType::UPDATE:
            if (on_update_) {
                on_update_(tagged);
            }
            break;
    }
}

} // namespace ssdp
} // namespace ssdptrack
