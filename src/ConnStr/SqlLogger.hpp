// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnectInfo.hpp"

#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <utility>

/// Represents a logger for connection string building operations.
class CONNSTR_API SqlLogger
{
  public:
    SqlLogger() = default;
    SqlLogger(SqlLogger const& /*other*/) = default;
    SqlLogger(SqlLogger&& /*other*/) = default;
    SqlLogger& operator=(SqlLogger const& /*other*/) = default;
    SqlLogger& operator=(SqlLogger&& /*other*/) = default;
    virtual ~SqlLogger() = default;

    /// Invoked on a warning, e.g. when a setting was ignored or adjusted to fit its valid range.
    virtual void OnWarning(std::string_view const& message) = 0;

    /// Invoked when a parameter was stored, with its already encoded value.
    virtual void OnParameterSet(SqlConnectionDialect dialect, std::string_view const& key, std::string_view const& value) = 0;

    /// Invoked when a parameter was removed.
    virtual void OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key) = 0;

    /// Invoked when a connection string was rendered.
    virtual void OnRender(SqlConnectionDialect dialect, SqlConnectionString const& connectionString) = 0;

    /// Formats and forwards a warning to OnWarning().
    template <typename... Args>
    void Warn(std::format_string<Args...> const& fmt, Args&&... args)
    {
        OnWarning(std::format(fmt, std::forward<Args>(args)...));
    }

    class Null;

    /// Retrieves a null logger that does nothing.
    static Null& NullLogger() noexcept;

    /// Retrieves a logger that logs warnings to standard output.
    static SqlLogger& StandardLogger();

    /// Retrieves a logger that logs every operation to standard output.
    static SqlLogger& TraceLogger();

    /// Retrieves the currently configured logger.
    static SqlLogger& GetLogger();

    /// Sets the current logger.
    ///
    /// The ownership of the logger is not transferred and remains with the caller.
    static void SetLogger(SqlLogger& logger);
};

class SqlLogger::Null: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& /*message*/) override {}
    void OnParameterSet(SqlConnectionDialect /*dialect*/,
                        std::string_view const& /*key*/,
                        std::string_view const& /*value*/) override
    {
    }
    void OnParameterRemoved(SqlConnectionDialect /*dialect*/, std::string_view const& /*key*/) override {}
    void OnRender(SqlConnectionDialect /*dialect*/, SqlConnectionString const& /*connectionString*/) override {}
};

/// Logs warnings to standard output, each line prefixed with a timestamp.
class CONNSTR_API SqlStandardLogger: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& message) override;
    void OnParameterSet(SqlConnectionDialect dialect,
                        std::string_view const& key,
                        std::string_view const& value) override;
    void OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key) override;
    void OnRender(SqlConnectionDialect dialect, SqlConnectionString const& connectionString) override;

  protected:
    void Tick();

    template <typename... Args>
    void WriteMessage(std::format_string<Args...> const& fmt, Args&&... args)
    {
        WriteLine(std::format("[{}] {}", _currentTimeStr, std::format(fmt, std::forward<Args>(args)...)));
    }

    /// Writes a single, fully formatted log line. Defaults to standard output.
    virtual void WriteLine(std::string_view line);

  private:
    std::chrono::time_point<std::chrono::system_clock> _currentTime;
    std::string _currentTimeStr;
};

/// Logs every parameter change and every rendered connection string, with passwords masked.
class CONNSTR_API SqlTraceLogger: public SqlStandardLogger
{
  public:
    void OnParameterSet(SqlConnectionDialect dialect,
                        std::string_view const& key,
                        std::string_view const& value) override;
    void OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key) override;
    void OnRender(SqlConnectionDialect dialect, SqlConnectionString const& connectionString) override;
};
