// SPDX-License-Identifier: Apache-2.0

#include "SqlEncoding.hpp"
#include "SqlLogger.hpp"
#include "SqlServerConnectionString.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <limits>
#include <string>
#include <utility>

namespace
{

constexpr auto Dialect = SqlConnectionDialect::SqlServer;

} // end namespace

SqlServerConnectionString SqlServerConnectionString::FromSettings(SqlConnectionSettings const& settings)
{
    auto result = SqlServerConnectionString {};

    if (!settings.username.empty())
    {
        if (settings.password.has_value())
            result = result.SetUsernameAndPassword(settings.username, *settings.password);
        else
            result = result.SetUsernameWithoutPassword(settings.username);
    }

    if (!settings.host.empty())
    {
        if (settings.port.has_value())
            result = result.SetHostWithPort(settings.host, *settings.port);
        else
            result = result.SetHostWithDefaultPort(settings.host);
    }

    if (!settings.database.empty())
        result = result.SetDatabaseName(settings.database);

    auto const timeout = std::clamp<std::chrono::seconds::rep>(
        settings.timeout.count(), std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());

    return result.SetConnectTimeout(static_cast<int32_t>(timeout));
}

SqlServerConnectionString SqlServerConnectionString::DangerouslySetParameter(std::string_view key,
                                                                             std::string_view value) const
{
    auto quotedValue = QuoteConnectionStringValue(value);
    SqlLogger::GetLogger().OnParameterSet(Dialect, key, quotedValue);

    auto result = *this;
    result._parameters.insert_or_assign(std::string { key }, std::move(quotedValue));
    return result;
}

SqlServerConnectionString SqlServerConnectionString::WithoutParameter(std::string_view key) const
{
    auto result = *this;
    if (auto const i = result._parameters.find(std::string { key }); i != result._parameters.end())
    {
        result._parameters.erase(i);
        SqlLogger::GetLogger().OnParameterRemoved(Dialect, key);
    }
    return result;
}

SqlServerConnectionString SqlServerConnectionString::SetUsernameWithoutPassword(std::string_view username) const
{
    return DangerouslySetParameter("user", username).WithoutParameter("password");
}

SqlServerConnectionString SqlServerConnectionString::SetUsernameAndPassword(std::string_view username,
                                                                            std::string_view password) const
{
    return DangerouslySetParameter("user", username).DangerouslySetParameter("password", password);
}

SqlServerConnectionString SqlServerConnectionString::SetUsernameAndPassword(
    SqlUsernamePassword const& credentials) const
{
    return SetUsernameAndPassword(credentials.username, credentials.password);
}

SqlServerConnectionString SqlServerConnectionString::SetHostWithDefaultPort(std::string_view host) const
{
    return DangerouslySetParameter("server", host);
}

SqlServerConnectionString SqlServerConnectionString::SetHostWithPort(std::string_view host, std::size_t port) const
{
    return DangerouslySetParameter("server", std::format("{},{}", host, port));
}

SqlServerConnectionString SqlServerConnectionString::SetHostWithPort(SqlHostPort const& hostPort) const
{
    return SetHostWithPort(hostPort.host, hostPort.port);
}

SqlServerConnectionString SqlServerConnectionString::EnableEncryption() const
{
    return DangerouslySetParameter("encrypt", "true");
}

SqlServerConnectionString SqlServerConnectionString::EnableEncryptionAndTrustServerCertificate() const
{
    return EnableEncryption().DangerouslySetParameter("trustServerCertificate", "true");
}

SqlServerConnectionString SqlServerConnectionString::SetDatabaseName(std::string_view databaseName) const
{
    return DangerouslySetParameter("database", databaseName);
}

SqlServerConnectionString SqlServerConnectionString::SetConnectTimeout(int32_t timeout) const
{
    if (timeout < 0)
    {
        SqlLogger::GetLogger().Warn("Ignoring negative connect timeout ({}).", timeout);
        return *this;
    }

    return DangerouslySetParameter("timeout", std::to_string(timeout));
}

SqlServerConnectionString SqlServerConnectionString::SetCommandTimeout(int32_t timeout) const
{
    if (timeout < 0)
    {
        SqlLogger::GetLogger().Warn("Ignoring negative command timeout ({}).", timeout);
        return *this;
    }

    return DangerouslySetParameter("command timeout", std::to_string(timeout));
}

SqlServerConnectionString SqlServerConnectionString::SetConnectRetryCount(uint8_t count) const
{
    return DangerouslySetParameter("connectRetryCount", std::to_string(count));
}

SqlServerConnectionString SqlServerConnectionString::SetConnectRetryInterval(uint8_t interval) const
{
    auto const clampedInterval = std::clamp(interval, MinConnectRetryInterval, MaxConnectRetryInterval);
    if (clampedInterval != interval)
        SqlLogger::GetLogger().Warn("Connect retry interval {} clamped to {}.", interval, clampedInterval);

    return DangerouslySetParameter("connectRetryInterval", std::to_string(clampedInterval));
}

SqlConnectionString SqlServerConnectionString::ToConnectionString() const
{
    SqlConnectionString result;

    for (auto const& [key, value]: _parameters)
    {
        std::string_view const delimiter = result.value.empty() ? "" : ";";
        result.value += std::format("{}{}={}", delimiter, key, value);
    }

    SqlLogger::GetLogger().OnRender(Dialect, result);
    return result;
}

std::string SqlServerConnectionString::ToString() const
{
    return ToConnectionString().value;
}
