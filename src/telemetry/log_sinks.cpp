/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/log_sinks.hpp"

#include <iostream>
#include <system_error>

namespace gelf_relay {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    if (file_.is_open()) {
        file_ << json_line << '\n';
    }
}

void JsonFileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

}  // namespace gelf_relay
