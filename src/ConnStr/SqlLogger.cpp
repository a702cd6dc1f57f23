// SPDX-License-Identifier: Apache-2.0

#include "SqlLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <memory>
#include <print>
#include <string>

namespace
{

bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

// `password` and its SQL Server alias `pwd`.
bool IsPasswordKey(std::string_view key) noexcept
{
    using namespace std::string_view_literals;
    return EqualsIgnoreCase(key, "password"sv) || EqualsIgnoreCase(key, "pwd"sv);
}

} // namespace

void SqlStandardLogger::Tick()
{
    _currentTime = std::chrono::system_clock::now();
    auto const nowMs = time_point_cast<std::chrono::milliseconds>(_currentTime);
    _currentTimeStr = std::format("{:%F %X}.{:03}",
                                  std::chrono::floor<std::chrono::seconds>(_currentTime),
                                  nowMs.time_since_epoch().count() % 1'000);
}

void SqlStandardLogger::WriteLine(std::string_view line)
{
    std::println("{}", line);
}

void SqlStandardLogger::OnWarning(std::string_view const& message)
{
    Tick();
    WriteMessage("Warning: {}", message);
}

void SqlStandardLogger::OnParameterSet(SqlConnectionDialect /*dialect*/,
                                       std::string_view const& /*key*/,
                                       std::string_view const& /*value*/)
{
}

void SqlStandardLogger::OnParameterRemoved(SqlConnectionDialect /*dialect*/, std::string_view const& /*key*/)
{
}

void SqlStandardLogger::OnRender(SqlConnectionDialect /*dialect*/, SqlConnectionString const& /*connectionString*/)
{
}

void SqlTraceLogger::OnParameterSet(SqlConnectionDialect dialect,
                                    std::string_view const& key,
                                    std::string_view const& value)
{
    Tick();
    if (IsPasswordKey(key))
        WriteMessage("[{}] Set {}=***", dialect, key);
    else
        WriteMessage("[{}] Set {}={}", dialect, key, value);
}

void SqlTraceLogger::OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key)
{
    Tick();
    WriteMessage("[{}] Removed {}", dialect, key);
}

void SqlTraceLogger::OnRender(SqlConnectionDialect dialect, SqlConnectionString const& connectionString)
{
    Tick();
    WriteMessage("[{}] Rendered: {}", dialect, connectionString.Sanitized());
}

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

static std::unique_ptr<SqlStandardLogger> theStdLogger {};

SqlLogger& SqlLogger::StandardLogger()
{
    if (!theStdLogger)
        theStdLogger = std::make_unique<SqlStandardLogger>();

    return *theStdLogger;
}

static std::unique_ptr<SqlTraceLogger> theTraceLogger {};

SqlLogger& SqlLogger::TraceLogger()
{
    if (!theTraceLogger)
        theTraceLogger = std::make_unique<SqlTraceLogger>();

    return *theTraceLogger;
}

static SqlLogger* theDefaultLogger = &SqlLogger::NullLogger();

SqlLogger& SqlLogger::GetLogger()
{
    return *theDefaultLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theDefaultLogger = &logger;
}
