/**
 * @file bindings.cpp
 * @brief Defines the Python module for the ssdptrack SSDP engine.
 * @details Exposes the listener, devices, settings and the one-shot search helper as
 *          the `ssdptrack_ssdp_engine` module. Device callbacks arrive on the engine's
 *          event loop thread; blocking calls release the GIL so those callbacks can run.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "utils/cpp_logger_bindings.h"
#include "configuration/ssdp_engine_settings.h"
#include "listeners/search_listener.h"
#include "listeners/ssdp_listener.h"
#include "net/address.h"
#include "ssdp_types.h"
#include "tracker/device_tracker.h"
#include "tracker/ssdp_device.h"

#include <chrono>
#include <stdexcept>

namespace py = pybind11;
using namespace ssdptrack;

namespace {

py::dict headers_to_dict(const ssdp::SsdpHeaders& headers) {
    py::dict result;
    for (const auto& entry : headers) {
        result[py::str(entry.first)] = py::str(entry.second);
    }
    return result;
}

py::dict headers_by_type_to_dict(const std::map<std::string, ssdp::SsdpHeaders>& by_type) {
    py::dict result;
    for (const auto& entry : by_type) {
        result[py::str(entry.first)] = headers_to_dict(entry.second);
    }
    return result;
}

double to_epoch_seconds(ssdp::TimePoint time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

ssdp::AddressTuple address_from_python(const std::string& host, uint16_t port) {
    auto parsed = ssdp::parse_ip_address(host, port);
    if (!parsed) {
        throw std::invalid_argument("Not an IP address: " + host);
    }
    return *parsed;
}

} // namespace

PYBIND11_MODULE(ssdptrack_ssdp_engine, m) {
    m.doc() = "ssdptrack SSDP discovery and device tracking engine";

    // 1. Logger has no dependencies on other bound types
    logging::bind_logger(m);

    // 2. Plain types
    py::enum_<ssdp::SsdpSource>(m, "SsdpSource")
        .value("SEARCH", ssdp::SsdpSource::SEARCH)
        .value("ADVERTISEMENT", ssdp::SsdpSource::ADVERTISEMENT)
        .value("SEARCH_ALIVE", ssdp::SsdpSource::SEARCH_ALIVE)
        .value("SEARCH_CHANGED", ssdp::SsdpSource::SEARCH_CHANGED)
        .value("ADVERTISEMENT_ALIVE", ssdp::SsdpSource::ADVERTISEMENT_ALIVE)
        .value("ADVERTISEMENT_BYEBYE", ssdp::SsdpSource::ADVERTISEMENT_BYEBYE)
        .value("ADVERTISEMENT_UPDATE", ssdp::SsdpSource::ADVERTISEMENT_UPDATE);

    py::class_<ssdp::AddressTuple>(m, "AddressTuple")
        .def(py::init(&address_from_python), py::arg("host"), py::arg("port") = 0)
        .def_readonly("host", &ssdp::AddressTuple::host)
        .def_readonly("port", &ssdp::AddressTuple::port)
        .def_readonly("flowinfo", &ssdp::AddressTuple::flowinfo)
        .def_readwrite("scope_id", &ssdp::AddressTuple::scope_id)
        .def_property_readonly("is_ipv6", &ssdp::AddressTuple::is_ipv6)
        .def("__repr__", &ssdp::AddressTuple::to_string);

    py::class_<ssdp::SsdpEngineSettings>(m, "SsdpEngineSettings")
        .def(py::init<>())
        .def_readwrite("search_mx", &ssdp::SsdpEngineSettings::search_mx)
        .def_readwrite("search_target", &ssdp::SsdpEngineSettings::search_target)
        .def_readwrite("multicast_ttl", &ssdp::SsdpEngineSettings::multicast_ttl)
        .def_readwrite("default_max_age_seconds", &ssdp::SsdpEngineSettings::default_max_age_seconds)
        .def_readwrite("receive_buffer_size", &ssdp::SsdpEngineSettings::receive_buffer_size)
        .def_readwrite("loop_poll_timeout_ms", &ssdp::SsdpEngineSettings::loop_poll_timeout_ms);

    // 3. Devices
    py::class_<ssdp::SsdpDevice, std::shared_ptr<ssdp::SsdpDevice>>(m, "SsdpDevice")
        .def_property_readonly("udn", &ssdp::SsdpDevice::udn)
        .def_property_readonly("location", &ssdp::SsdpDevice::location)
        .def_property_readonly("locations", [](const ssdp::SsdpDevice& device) {
            py::list result;
            for (const auto& location : device.locations()) {
                result.append(py::make_tuple(location.url, to_epoch_seconds(location.valid_to)));
            }
            return result;
        })
        .def_property_readonly("valid_to", [](const ssdp::SsdpDevice& device) {
            return to_epoch_seconds(device.valid_to());
        })
        .def_property_readonly("last_seen", [](const ssdp::SsdpDevice& device) -> py::object {
            auto last_seen = device.last_seen();
            if (!last_seen) {
                return py::none();
            }
            return py::float_(to_epoch_seconds(*last_seen));
        })
        .def_property_readonly("search_headers", [](const ssdp::SsdpDevice& device) {
            return headers_by_type_to_dict(device.search_headers());
        })
        .def_property_readonly("advertisement_headers", [](const ssdp::SsdpDevice& device) {
            return headers_by_type_to_dict(device.advertisement_headers());
        })
        .def("combined_headers", [](const ssdp::SsdpDevice& device, const std::string& type) {
            return headers_to_dict(device.combined_headers(type));
        }, py::arg("device_or_service_type"))
        .def("all_combined_headers", [](const ssdp::SsdpDevice& device) {
            return headers_by_type_to_dict(device.all_combined_headers());
        })
        .def("__repr__", [](const ssdp::SsdpDevice& device) {
            return "<SsdpDevice(" + device.udn() + ")>";
        });

    py::class_<ssdp::SsdpDeviceTracker, std::shared_ptr<ssdp::SsdpDeviceTracker>>(m, "SsdpDeviceTracker")
        .def(py::init([](const ssdp::SsdpEngineSettings& settings) {
            return std::make_shared<ssdp::SsdpDeviceTracker>(settings);
        }), py::arg("settings") = ssdp::SsdpEngineSettings())
        .def_property_readonly("devices", [](ssdp::SsdpDeviceTracker& tracker) {
            ssdp::SsdpDeviceTracker::DeviceMap snapshot;
            {
                py::gil_scoped_release release_gil;
                auto guard = tracker.lock();
                snapshot = tracker.devices();
            }
            return snapshot;
        })
        .def("purge_devices", [](ssdp::SsdpDeviceTracker& tracker) {
            py::gil_scoped_release release_gil;
            auto guard = tracker.lock();
            tracker.purge_devices();
        });

    // 4. Listener
    py::class_<ssdp::SsdpListener>(m, "SsdpListener")
        .def(py::init([](ssdp::SsdpListener::DeviceCallback callback,
                         std::optional<ssdp::AddressTuple> source,
                         std::optional<ssdp::AddressTuple> target,
                         std::shared_ptr<ssdp::SsdpDeviceTracker> device_tracker,
                         const ssdp::SsdpEngineSettings& settings) {
                 return std::make_unique<ssdp::SsdpListener>(std::move(callback), std::move(source), std::move(target),
                                                            std::move(device_tracker), settings);
             }),
             py::arg("callback"),
             py::arg("source") = py::none(),
             py::arg("target") = py::none(),
             py::arg("device_tracker") = py::none(),
             py::arg("settings") = ssdp::SsdpEngineSettings())
        .def("start", &ssdp::SsdpListener::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &ssdp::SsdpListener::stop, py::call_guard<py::gil_scoped_release>())
        .def("search", &ssdp::SsdpListener::search,
             py::arg("override_target") = py::none(),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("device_tracker", &ssdp::SsdpListener::device_tracker)
        .def_property_readonly("devices", [](ssdp::SsdpListener& listener) {
            auto tracker = listener.device_tracker();
            ssdp::SsdpDeviceTracker::DeviceMap snapshot;
            {
                py::gil_scoped_release release_gil;
                auto guard = tracker->lock();
                snapshot = tracker->devices();
            }
            return snapshot;
        });

    m.def("search", [](std::function<void(py::dict)> callback,
                       int timeout,
                       const std::string& search_target,
                       std::optional<ssdp::AddressTuple> source,
                       std::optional<ssdp::AddressTuple> target) {
        py::gil_scoped_release release_gil;
        ssdp::search([&callback](const ssdp::SsdpHeaders& headers) {
            py::gil_scoped_acquire acquire_gil;
            callback(headers_to_dict(headers));
        }, timeout, search_target, std::move(source), std::move(target));
    },
    py::arg("callback"),
    py::arg("timeout") = ssdp::kDefaultSearchMx,
    py::arg("search_target") = std::string(ssdp::kDefaultSearchTarget),
    py::arg("source") = py::none(),
    py::arg("target") = py::none(),
    "Searches once and calls back with the headers of every response during the timeout window.");

    // 5. Constants
    m.attr("SSDP_IP_V4") = ssdp::kSsdpIpV4;
    m.attr("SSDP_IP_V6") = ssdp::kSsdpIpV6LinkLocal;
    m.attr("SSDP_PORT") = ssdp::kSsdpPort;
    m.attr("SSDP_ALIVE") = ssdp::kSsdpAlive;
    m.attr("SSDP_BYEBYE") = ssdp::kSsdpByebye;
    m.attr("SSDP_UPDATE") = ssdp::kSsdpUpdate;
}
