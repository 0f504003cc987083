#include "markdd/logging.hpp"

#include "markdd/settings.hpp"

#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Log.h>

#include <cctype>
#include <iterator>
#include <string>
#include <system_error>

namespace markdd::logging
{
namespace
{
bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    }
    return true;
}

} // namespace

plog::Severity parseSeverity(std::string_view name, plog::Severity fallback) noexcept
{
    static constexpr plog::Severity kSeverities[] = {plog::none, plog::fatal, plog::error, plog::warning,
                                                     plog::info, plog::debug, plog::verbose};
    for (std::size_t i = 0; i < std::size(kSeverityNames); ++i)
    {
        if (equalsIgnoreCase(name, kSeverityNames[i]))
            return kSeverities[i];
    }
    if (equalsIgnoreCase(name, "warn"))
        return plog::warning;
    return fallback;
}

std::string_view severityName(plog::Severity severity) noexcept
{
    auto index = static_cast<std::size_t>(severity);
    if (index >= std::size(kSeverityNames))
        return kSeverityNames[0];
    return kSeverityNames[index];
}

std::filesystem::path defaultLogPath(std::string_view appId)
{
    std::string name(appId);
    return config::configRoot() / name / (name + ".log");
}

bool initialize(const LogSettings &settings)
{
    if (auto *logger = plog::get())
    {
        logger->setMaxSeverity(settings.severity);
        return true;
    }

    std::error_code ec;
    if (settings.file.has_parent_path())
        std::filesystem::create_directories(settings.file.parent_path(), ec);
    if (ec)
        return false;

    plog::init(settings.severity, settings.file.string().c_str(), settings.maxFileSize, settings.maxFiles);
    PLOGI << "Logging started at severity " << plog::severityToString(settings.severity);
    return true;
}

} // namespace markdd::logging
