#pragma once

#include <plog/Severity.h>

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace markdd::logging
{

inline constexpr std::string_view kSeverityNames[] = {"none", "fatal", "error", "warning", "info", "debug", "verbose"};

struct LogSettings
{
    std::filesystem::path file;
    plog::Severity severity = plog::info;
    std::size_t maxFileSize = 512 * 1024;
    int maxFiles = 3;
};

plog::Severity parseSeverity(std::string_view name, plog::Severity fallback = plog::info) noexcept;

// Lowercase name as accepted by parseSeverity().
std::string_view severityName(plog::Severity severity) noexcept;

// <config root>/<appId>/<appId>.log
std::filesystem::path defaultLogPath(std::string_view appId);

// Installs the rolling file appender. Safe to call once per process; later
// calls only adjust the severity.
bool initialize(const LogSettings &settings);

} // namespace markdd::logging
