// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ConnStr/SqlConnectInfo.hpp>
#include <ConnStr/SqlLogger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <ostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

inline std::ostream& operator<<(std::ostream& os, SqlConnectionString const& connectionString)
{
    return os << std::format("SqlConnectionString{{\"{}\"}}", connectionString.value);
}

// Splits a rendered list of parameters into its entries, sorted,
// so that assertions do not depend on the (unspecified) parameter order.
inline std::vector<std::string> SortedEntries(std::string_view input, char delimiter)
{
    auto entries = std::vector<std::string> {};
    if (input.empty())
        return entries;

    for (auto const entry: input | std::views::split(delimiter))
        entries.emplace_back(entry.begin(), entry.end());

    std::ranges::sort(entries);
    return entries;
}

// Splits a PostgreSQL connection string into the part before the `?` and its sorted parameters.
inline std::tuple<std::string, std::vector<std::string>> SplitPostgresConnectionString(std::string_view input)
{
    auto const separator = input.find('?');
    if (separator == std::string_view::npos)
        return { std::string { input }, {} };

    return { std::string { input.substr(0, separator) }, SortedEntries(input.substr(separator + 1), '&') };
}

class TestSuiteSqlLogger: public SqlLogger
{
  private:
    template <typename... Args>
    void WriteInfo(std::format_string<Args...> const& fmt, Args&&... args)
    {
        UNSCOPED_INFO(std::format("[{}] {}", "ConnStr", std::format(fmt, std::forward<Args>(args)...)));
    }

  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnWarning(std::string_view const& message) override
    {
        WriteInfo("Warning: {}", message);
    }

    void OnParameterSet(SqlConnectionDialect dialect,
                        std::string_view const& key,
                        std::string_view const& value) override
    {
        WriteInfo("[{}] Set {}={}", dialect, key, value);
    }

    void OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key) override
    {
        WriteInfo("[{}] Removed {}", dialect, key);
    }

    void OnRender(SqlConnectionDialect /*dialect*/, SqlConnectionString const& /*connectionString*/) override {}
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlNullLogger: public SqlLogger::Null
{
  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();

  public:
    ScopedSqlNullLogger()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlNullLogger() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }
};

// Records every logged event, while being installed as the current logger.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlRecordingLogger: public SqlLogger
{
  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();

  public:
    std::vector<std::string> warnings;
    std::vector<std::string> events;
    std::vector<SqlConnectionString> rendered;

    ScopedSqlRecordingLogger()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlRecordingLogger() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }

    void OnWarning(std::string_view const& message) override
    {
        warnings.emplace_back(message);
    }

    void OnParameterSet(SqlConnectionDialect dialect,
                        std::string_view const& key,
                        std::string_view const& value) override
    {
        events.emplace_back(std::format("{}: set {}={}", dialect, key, value));
    }

    void OnParameterRemoved(SqlConnectionDialect dialect, std::string_view const& key) override
    {
        events.emplace_back(std::format("{}: removed {}", dialect, key));
    }

    void OnRender(SqlConnectionDialect /*dialect*/, SqlConnectionString const& connectionString) override
    {
        rendered.emplace_back(connectionString);
    }
};

// Installs a standard or trace logger as the current logger, capturing its lines instead of printing them.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
template <typename BaseLogger>
class ScopedSqlCapturingLogger: public BaseLogger
{
  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();

  public:
    std::vector<std::string> lines;

    ScopedSqlCapturingLogger()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlCapturingLogger() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }

  protected:
    void WriteLine(std::string_view line) override
    {
        lines.emplace_back(line);
    }
};

using CapturingSqlStandardLogger = ScopedSqlCapturingLogger<SqlStandardLogger>;
using CapturingSqlTraceLogger = ScopedSqlCapturingLogger<SqlTraceLogger>;

class ConnStrTestFixture
{
  public:
    using MainProgramArgs = std::tuple<int, char**>;

    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        SqlLogger::SetLogger(TestSuiteSqlLogger::GetLogger());

        using namespace std::string_view_literals;
        int i = 1;
        for (; i < argc; ++i)
        {
            if (argv[i] == "--trace-connstr"sv)
                SqlLogger::SetLogger(SqlLogger::TraceLogger());
            else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
            {
                std::println("{} [--trace-connstr] [[--] [Catch2 flags ...]]", argv[0]);
                return { EXIT_SUCCESS };
            }
            else if (argv[i] == "--"sv)
            {
                ++i;
                break;
            }
            else
                break;
        }

        if (i < argc)
            argv[i - 1] = argv[0];

        return MainProgramArgs { argc - (i - 1), argv + (i - 1) };
    }
};
