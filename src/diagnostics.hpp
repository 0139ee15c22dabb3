#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psyq {

enum class Severity
{
    Note,
    Warning,
    Error,
};

std::string_view to_string(Severity severity) noexcept;

// Receives anomalies that do not stop a parse.
class DiagnosticSink
{
public:
    virtual ~DiagnosticSink() = default;
    virtual void report(Severity severity, std::string_view message) = 0;

    void warn(std::string_view message) { report(Severity::Warning, message); }
};

class NullDiagnostics : public DiagnosticSink
{
public:
    void report(Severity, std::string_view) override {}
};

// Writes "warning: <message>" lines.
class StreamDiagnostics : public DiagnosticSink
{
    std::ostream& out;

public:
    explicit StreamDiagnostics(std::ostream& stream = std::cerr) : out(stream) {}
    void report(Severity severity, std::string_view message) override;
};

class CollectingDiagnostics : public DiagnosticSink
{
    std::vector<std::pair<Severity, std::string>> entries;

public:
    void report(Severity severity, std::string_view message) override;

    const std::vector<std::pair<Severity, std::string>>& all() const { return entries; }
    size_t count(Severity severity) const;
    bool empty() const { return entries.empty(); }
};

} // namespace psyq
