#include "rfcat_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace redfish_catalog {

static std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return value;
}

TraceLevel TraceLevelFromString(const std::string& level_str) {
    auto upper_level = ToUpper(level_str);
    if (upper_level == "NONE") {
        return TraceLevel::NONE;
    } else if (upper_level == "ERROR") {
        return TraceLevel::ERROR;
    } else if (upper_level == "WARN") {
        return TraceLevel::WARN;
    } else if (upper_level == "INFO") {
        return TraceLevel::INFO;
    } else if (upper_level == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (upper_level == "TRACE") {
        return TraceLevel::TRACE;
    }
    throw std::invalid_argument("Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

TraceOutput TraceOutputFromString(const std::string& output_str) {
    auto upper_output = ToUpper(output_str);
    if (upper_output == "CONSOLE") {
        return TraceOutput::CONSOLE;
    } else if (upper_output == "FILE") {
        return TraceOutput::FILE;
    } else if (upper_output == "BOTH") {
        return TraceOutput::BOTH;
    }
    throw std::invalid_argument("Invalid trace output: " + output_str + ". Valid outputs are: console, file, both");
}

std::string TraceOutputToString(TraceOutput output) {
    switch (output) {
        case TraceOutput::CONSOLE: return "console";
        case TraceOutput::FILE: return "file";
        case TraceOutput::BOTH: return "both";
        default: return "unknown";
    }
}

CatalogTracer& CatalogTracer::Instance() {
    static CatalogTracer instance;
    return instance;
}

std::string CatalogTracer::GetTraceFilePath() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    std::filesystem::path trace_path = trace_directory;
    trace_path /= "redfish_catalog_trace.log";
    return trace_path.string();
}

void CatalogTracer::SetEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (enabled == this->enabled) {
        return;
    }

    if (enabled) {
        this->enabled = true;
        if (output != TraceOutput::CONSOLE) {
            OpenTraceFile();
        }
        Emit(TraceLevel::INFO, "TRACER", "Tracing enabled", nullptr);
    } else {
        Emit(TraceLevel::INFO, "TRACER", "Tracing disabled", nullptr);
        CloseTraceFile();
        this->enabled = false;
    }
}

void CatalogTracer::SetLevel(TraceLevel level) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    this->level = level;
    Emit(TraceLevel::INFO, "TRACER", "Trace level set to: " + TraceLevelToString(level), nullptr);
}

void CatalogTracer::SetTraceDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    trace_directory = directory;

    std::filesystem::path dir_path(directory);
    std::error_code ec;
    if (!std::filesystem::exists(dir_path, ec)) {
        std::filesystem::create_directories(dir_path, ec);
        if (ec) {
            std::cerr << "Failed to create trace directory: " << directory << " (" << ec.message() << ")" << std::endl;
        }
    }

    if (trace_file) {
        CloseTraceFile();
        OpenTraceFile();
    }
    Emit(TraceLevel::INFO, "TRACER", "Trace directory set to: " + directory, nullptr);
}

void CatalogTracer::SetOutput(TraceOutput output) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    this->output = output;

    if (enabled && output != TraceOutput::CONSOLE && !trace_file) {
        OpenTraceFile();
    } else if (output == TraceOutput::CONSOLE && trace_file) {
        CloseTraceFile();
    }
    Emit(TraceLevel::INFO, "TRACER", "Trace output set to: " + TraceOutputToString(output), nullptr);
}

void CatalogTracer::SetMaxFileSize(int64_t max_size) {
    if (max_size < 0) {
        throw std::invalid_argument("Trace max file size must be non-negative");
    }
    std::lock_guard<std::mutex> lock(trace_mutex);
    max_file_size = max_size;
    Emit(TraceLevel::INFO, "TRACER", "Trace max file size set to: " + std::to_string(max_size), nullptr);
}

void CatalogTracer::SetRotation(bool rotation) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    rotation_enabled = rotation;
    Emit(TraceLevel::INFO, "TRACER", "Trace rotation " + std::string(rotation ? "enabled" : "disabled"), nullptr);
}

void CatalogTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    if (!ShouldTrace(msg_level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(trace_mutex);
    Emit(msg_level, component, message, nullptr);
}

void CatalogTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!ShouldTrace(msg_level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(trace_mutex);
    Emit(msg_level, component, message, &data);
}

void CatalogTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void CatalogTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void CatalogTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void CatalogTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void CatalogTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void CatalogTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void CatalogTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void CatalogTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void CatalogTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void CatalogTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void CatalogTracer::Emit(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string* data) {
    if (!enabled || msg_level > level || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + (data ? data->length() : 0));

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (data && !data->empty()) {
        log_message += "\nData: ";
        log_message += *data;
    }

    if (output == TraceOutput::CONSOLE || output == TraceOutput::BOTH) {
        std::cout << log_message << std::endl;
    }
    if (output == TraceOutput::FILE || output == TraceOutput::BOTH) {
        RotateIfNeeded();
        if (trace_file && trace_file->is_open()) {
            *trace_file << log_message << std::endl;
            trace_file->flush();
        }
    }
}

void CatalogTracer::OpenTraceFile() {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= "redfish_catalog_trace.log";

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

void CatalogTracer::CloseTraceFile() {
    if (trace_file) {
        if (trace_file->is_open()) {
            trace_file->close();
        }
        trace_file.reset();
    }
}

void CatalogTracer::RotateIfNeeded() {
    if (!rotation_enabled || max_file_size <= 0 || !trace_file) {
        return;
    }

    std::filesystem::path trace_path = trace_directory;
    trace_path /= "redfish_catalog_trace.log";

    std::error_code ec;
    auto size = std::filesystem::file_size(trace_path, ec);
    if (ec || static_cast<int64_t>(size) < max_file_size) {
        return;
    }

    CloseTraceFile();
    auto rotated_path = trace_path;
    rotated_path += ".1";
    std::filesystem::rename(trace_path, rotated_path, ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file: " << trace_path.string() << " (" << ec.message() << ")" << std::endl;
    }
    OpenTraceFile();
}

std::string CatalogTracer::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

} // namespace redfish_catalog
