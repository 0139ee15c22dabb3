#include "diagnostics.hpp"
#include <algorithm>

namespace psyq {

std::string_view to_string(Severity severity) noexcept
{
    switch (severity) {
        case Severity::Note:    return "note";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

void StreamDiagnostics::report(Severity severity, std::string_view message)
{
    out << to_string(severity) << ": " << message << std::endl;
}

void CollectingDiagnostics::report(Severity severity, std::string_view message)
{
    entries.emplace_back(severity, std::string(message));
}

size_t CollectingDiagnostics::count(Severity severity) const
{
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [severity](const auto& entry) { return entry.first == severity; }));
}

} // namespace psyq
