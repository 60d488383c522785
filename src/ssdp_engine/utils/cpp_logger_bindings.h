/**
 * @file cpp_logger_bindings.h
 * @brief pybind11 bindings for the C++ logger.
 */
#ifndef SSDPTRACK_CPP_LOGGER_BINDINGS_H
#define SSDPTRACK_CPP_LOGGER_BINDINGS_H

#include <string>
#include <tuple>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "cpp_logger.h"

namespace ssdptrack {
namespace logging {

/**
 * @brief Binds the C++ logging components to a Python module.
 * @param m The pybind11 module to which the components will be bound.
 */
inline void bind_logger(pybind11::module_ &m) {
    namespace py = pybind11;
    py::enum_<LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARNING", LogLevel::WARNING)
        .value("ERROR", LogLevel::ERR)
        .export_values();

    m.def("get_cpp_log_messages", [](int timeout_ms) {
        std::vector<std::tuple<LogLevel, std::string, std::string, int>> entries_tuples;
        std::vector<LogEntry> cpp_entries;

        {
            py::gil_scoped_release release_gil;
            cpp_entries = retrieve_log_entries(timeout_ms);
        }

        for (const auto& entry : cpp_entries) {
            entries_tuples.emplace_back(entry.level, entry.message, entry.filename, entry.line_number);
        }
        return entries_tuples;
    }, py::arg("timeout_ms") = 100,
       "Retrieves buffered C++ log messages, blocking until messages are available or timeout occurs (in ms). Returns a list of (level, message, filename, line) tuples.");

    m.def("shutdown_cpp_logger", &shutdown_cpp_logger,
          "Signals the C++ logger to prepare for shutdown, unblocking any waiting log retrieval calls.");

    m.def("set_cpp_log_level", &set_cpp_log_level,
          py::arg("level"),
          "Sets the C++ global log level.");
}

} // namespace logging
} // namespace ssdptrack

#endif // SSDPTRACK_CPP_LOGGER_BINDINGS_H
