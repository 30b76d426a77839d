#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iostream>

namespace redfish_catalog {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

enum class TraceOutput {
    CONSOLE,
    FILE,
    BOTH
};

TraceLevel TraceLevelFromString(const std::string& level_str);
std::string TraceLevelToString(TraceLevel level);
TraceOutput TraceOutputFromString(const std::string& output_str);
std::string TraceOutputToString(TraceOutput output);

class CatalogTracer {
public:
    static CatalogTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutput(TraceOutput output);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    TraceOutput GetOutput() const { return output; }
    std::string GetTraceDirectory() const { return trace_directory; }
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }
    std::string GetTraceFilePath() const;

    bool ShouldTrace(TraceLevel msg_level) const { return enabled && msg_level <= level && msg_level != TraceLevel::NONE; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

private:
    CatalogTracer() = default;
    ~CatalogTracer() = default;
    CatalogTracer(const CatalogTracer&) = delete;
    CatalogTracer& operator=(const CatalogTracer&) = delete;

    // Callers hold trace_mutex.
    void Emit(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string* data);
    void OpenTraceFile();
    void CloseTraceFile();
    void RotateIfNeeded();
    std::string GetTimestamp() const;

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    TraceOutput output = TraceOutput::CONSOLE;
    std::string trace_directory = ".";
    int64_t max_file_size = 10485760; // 10MB default
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    mutable std::mutex trace_mutex;
};

#define RFCAT_TRACE_ERROR(component, message) \
    ::redfish_catalog::CatalogTracer::Instance().Error(component, message)

#define RFCAT_TRACE_ERROR_DATA(component, message, data) \
    ::redfish_catalog::CatalogTracer::Instance().Error(component, message, data)

#define RFCAT_TRACE_WARN(component, message) \
    ::redfish_catalog::CatalogTracer::Instance().Warn(component, message)

#define RFCAT_TRACE_WARN_DATA(component, message, data) \
    ::redfish_catalog::CatalogTracer::Instance().Warn(component, message, data)

#define RFCAT_TRACE_INFO(component, message) \
    ::redfish_catalog::CatalogTracer::Instance().Info(component, message)

#define RFCAT_TRACE_INFO_DATA(component, message, data) \
    ::redfish_catalog::CatalogTracer::Instance().Info(component, message, data)

#define RFCAT_TRACE_DEBUG(component, message) \
    ::redfish_catalog::CatalogTracer::Instance().Debug(component, message)

#define RFCAT_TRACE_DEBUG_DATA(component, message, data) \
    ::redfish_catalog::CatalogTracer::Instance().Debug(component, message, data)

#define RFCAT_TRACE_TRACE(component, message) \
    ::redfish_catalog::CatalogTracer::Instance().Trace(component, message)

#define RFCAT_TRACE_TRACE_DATA(component, message, data) \
    ::redfish_catalog::CatalogTracer::Instance().Trace(component, message, data)

} // namespace redfish_catalog
