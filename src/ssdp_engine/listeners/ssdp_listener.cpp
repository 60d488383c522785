#include "ssdp_listener.h"

#include "../utils/cpp_logger.h"

#include <stdexcept>

namespace ssdptrack {
namespace ssdp {

SsdpListener::SsdpListener(DeviceCallback callback,
                           std::optional<AddressTuple> source,
                           std::optional<AddressTuple> target,
                           std::shared_ptr<SsdpDeviceTracker> device_tracker,
                           SsdpEngineSettings settings,
                           EventLoop* loop,
                           TransportFactory transport_factory)
    : logger_prefix_("[SsdpListener]"),
      callback_(std::move(callback)),
      device_tracker_(device_tracker ? std::move(device_tracker) : std::make_shared<SsdpDeviceTracker>(settings)),
      loop_(loop) {
    settings = sanitize_settings(std::move(settings));
    if (!loop_) {
        owned_loop_ = std::make_unique<EventLoop>("[SsdpListener:loop]", settings.loop_poll_timeout_ms);
        loop_ = owned_loop_.get();
    }

    advertisement_listener_ = std::make_unique<SsdpAdvertisementListener>(
        [this](const SsdpHeaders& headers) { handle_alive(headers); },
        [this](const SsdpHeaders& headers) { handle_byebye(headers); },
        [this](const SsdpHeaders& headers) { handle_update(headers); },
        source,
        target,
        settings,
        loop_,
        transport_factory);

    search_listener_ = std::make_unique<SsdpSearchListener>(
        [this](const SsdpHeaders& headers) { handle_search(headers); },
        source,
        target,
        settings,
        loop_,
        transport_factory);
}

SsdpListener::~SsdpListener() {
    stop();
}

void SsdpListener::start() {
    LOG_CPP_INFO("%s Starting.", logger_prefix_.c_str());
    if (owned_loop_) {
        owned_loop_->start();
    }
    try {
        advertisement_listener_->start();
        search_listener_->start();
    } catch (const std::exception& e) {
        LOG_CPP_ERROR("%s Failed to start: %s", logger_prefix_.c_str(), e.what());
        stop();
        throw;
    }
}

void SsdpListener::stop() {
    advertisement_listener_->stop();
    search_listener_->stop();
    if (owned_loop_) {
        owned_loop_->stop();
    }
}

void SsdpListener::search(const std::optional<AddressTuple>& override_target) {
    search_listener_->search(override_target);
}

bool SsdpListener::is_started() const {
    return advertisement_listener_->is_started() && search_listener_->is_started();
}

void SsdpListener::handle_search(const SsdpHeaders& headers) {
    auto guard = device_tracker_->lock();
    dispatch(device_tracker_->see_search(headers));
}

void SsdpListener::handle_alive(const SsdpHeaders& headers) {
    auto guard = device_tracker_->lock();
    dispatch(device_tracker_->see_advertisement(headers));
}

void SsdpListener::handle_byebye(const SsdpHeaders& headers) {
    auto guard = device_tracker_->lock();
    dispatch(device_tracker_->unsee_advertisement(headers));
}

void SsdpListener::handle_update(const SsdpHeaders& headers) {
    auto guard = device_tracker_->lock();
    dispatch(device_tracker_->see_advertisement(headers));
}

void SsdpListener::dispatch(const TrackerResult& result) {
    if (!result.propagate || !result.device || !result.source) {
        return;
    }
    LOG_CPP_DEBUG("%s %s: %s (%s)", logger_prefix_.c_str(), to_string(*result.source),
                  result.device->udn().c_str(), result.device_or_service_type.c_str());
    if (callback_) {
        callback_(result.device, result.device_or_service_type, *result.source);
    }
}

} // namespace ssdp
} // namespace ssdptrack
