#include "description_cache.h"

#include "../utils/cpp_logger.h"

#include <exception>

namespace ssdptrack {
namespace ssdp {

DescriptionCache::DescriptionCache(std::shared_ptr<IUpnpRequester> requester)
    : logger_prefix_("[DescriptionCache]"),
      requester_(std::move(requester)) {}

std::optional<std::string> DescriptionCache::get_description_xml(const std::string& location) {
    std::shared_future<std::optional<std::string>> pending;
    std::promise<std::optional<std::string>> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(location);
        if (it != cache_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            cache_.emplace(location, pending);
            owner = true;
        }
    }

    if (owner) {
        try {
            promise.set_value(fetch_description(location));
        } catch (...) {
            // Not a fetch failure: forget the entry so the next caller asks again.
            LOG_CPP_ERROR("%s Unexpected exception fetching %s", logger_prefix_.c_str(), location.c_str());
            {
                std::lock_guard<std::mutex> lock(cache_mutex_);
                cache_.erase(location);
            }
            promise.set_exception(std::current_exception());
        }
    }
    return pending.get();
}

void DescriptionCache::uncache_description(const std::string& location) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(location);
}

bool DescriptionCache::is_cached(const std::string& location) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.count(location) != 0;
}

std::optional<std::string> DescriptionCache::fetch_description(const std::string& location) {
    if (!requester_) {
        LOG_CPP_ERROR("%s No requester configured, cannot fetch %s", logger_prefix_.c_str(), location.c_str());
        return std::nullopt;
    }

    try {
        // Some devices answer the first request with an empty document; ask twice.
        for (int attempt = 0; attempt < 2; ++attempt) {
            HttpResponse response = requester_->http_request("GET", location);
            if (response.status != 200) {
                LOG_CPP_WARNING("%s Fetching %s returned HTTP %d", logger_prefix_.c_str(), location.c_str(),
                                response.status);
                return std::nullopt;
            }
            if (!response.body.empty()) {
                return response.body;
            }
            LOG_CPP_DEBUG("%s Empty description from %s (attempt %d)", logger_prefix_.c_str(), location.c_str(),
                          attempt + 1);
        }
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("%s Failed to fetch description from %s: %s", logger_prefix_.c_str(), location.c_str(),
                        e.what());
    }
    return std::nullopt;
}

} // namespace ssdp
} // namespace ssdptrack
