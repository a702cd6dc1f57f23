// SPDX-License-Identifier: Apache-2.0

#include "SqlEncoding.hpp"
#include "SqlLogger.hpp"
#include "SqlPostgresConnectionString.hpp"

#include <format>
#include <string>
#include <utility>

namespace
{

constexpr auto Dialect = SqlConnectionDialect::Postgres;

std::string RenderUserSpec(SqlPostgresConnectionString::UserSpec const& userSpec)
{
    if (auto const* username = std::get_if<SqlPostgresConnectionString::Username>(&userSpec))
        return std::format("{}@", username->username);

    auto const& credentials = std::get<SqlUsernamePassword>(userSpec);
    return std::format("{}:{}@", credentials.username, credentials.password);
}

std::string RenderHostSpec(SqlPostgresConnectionString::HostSpec const& hostSpec)
{
    if (auto const* host = std::get_if<SqlPostgresConnectionString::Host>(&hostSpec))
        return host->host;

    auto const& hostPort = std::get<SqlHostPort>(hostSpec);
    return std::format("{}:{}", hostPort.host, hostPort.port);
}

} // end namespace

SqlPostgresConnectionString SqlPostgresConnectionString::FromSettings(SqlConnectionSettings const& settings)
{
    auto result = SqlPostgresConnectionString {};

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

    if (settings.timeout.count() >= 0)
        result = result.SetConnectTimeout(static_cast<std::size_t>(settings.timeout.count()));
    else
        SqlLogger::GetLogger().Warn("Ignoring negative connect timeout ({}).", settings.timeout);

    return result;
}

SqlPostgresConnectionString SqlPostgresConnectionString::WithUserSpec(UserSpec userSpec) const
{
    auto& logger = SqlLogger::GetLogger();

    if (auto const* username = std::get_if<Username>(&userSpec))
    {
        logger.OnParameterSet(Dialect, "user", username->username);
        if (_userSpec.has_value() && std::holds_alternative<SqlUsernamePassword>(*_userSpec))
            logger.OnParameterRemoved(Dialect, "password");
    }
    else
    {
        auto const& credentials = std::get<SqlUsernamePassword>(userSpec);
        logger.OnParameterSet(Dialect, "user", credentials.username);
        logger.OnParameterSet(Dialect, "password", credentials.password);
    }

    auto result = *this;
    result._userSpec = std::move(userSpec);
    return result;
}

SqlPostgresConnectionString SqlPostgresConnectionString::WithHostSpec(HostSpec hostSpec) const
{
    auto& logger = SqlLogger::GetLogger();

    if (auto const* host = std::get_if<Host>(&hostSpec))
        logger.OnParameterSet(Dialect, "host", host->host);
    else
    {
        auto const& hostPort = std::get<SqlHostPort>(hostSpec);
        logger.OnParameterSet(Dialect, "host", hostPort.host);
        logger.OnParameterSet(Dialect, "port", std::to_string(hostPort.port));
    }

    auto result = *this;
    result._hostSpec = std::move(hostSpec);
    return result;
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetUsernameWithoutPassword(std::string_view username) const
{
    return WithUserSpec(Username { .username = PercentEncode(username) });
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetUsernameAndPassword(std::string_view username,
                                                                                std::string_view password) const
{
    return WithUserSpec(SqlUsernamePassword {
        .username = PercentEncode(username),
        .password = PercentEncode(password),
    });
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetUsernameAndPassword(
    SqlUsernamePassword const& credentials) const
{
    return SetUsernameAndPassword(credentials.username, credentials.password);
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetHostWithDefaultPort(std::string_view host) const
{
    return WithHostSpec(Host { .host = PercentEncode(host) });
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetHostWithPort(std::string_view host, std::size_t port) const
{
    return WithHostSpec(SqlHostPort { .host = PercentEncode(host), .port = port });
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetHostWithPort(SqlHostPort const& hostPort) const
{
    return SetHostWithPort(hostPort.host, hostPort.port);
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetDatabaseName(std::string_view databaseName) const
{
    auto result = *this;
    result._databaseName = PercentEncode(databaseName);
    SqlLogger::GetLogger().OnParameterSet(Dialect, "dbname", *result._databaseName);
    return result;
}

SqlPostgresConnectionString SqlPostgresConnectionString::SetConnectTimeout(std::size_t timeout) const
{
    return DangerouslySetParameter("connect_timeout", std::to_string(timeout));
}

SqlPostgresConnectionString SqlPostgresConnectionString::DangerouslySetParameter(std::string_view key,
                                                                                 std::string_view value) const
{
    auto encodedKey = PercentEncode(key);
    auto encodedValue = PercentEncode(value);
    SqlLogger::GetLogger().OnParameterSet(Dialect, encodedKey, encodedValue);

    auto result = *this;
    result._parameters.insert_or_assign(std::move(encodedKey), std::move(encodedValue));
    return result;
}

SqlConnectionString SqlPostgresConnectionString::ToConnectionString() const
{
    auto result = SqlConnectionString { .value = std::string(Scheme) };

    if (_userSpec.has_value())
        result.value += RenderUserSpec(*_userSpec);

    if (_hostSpec.has_value())
        result.value += RenderHostSpec(*_hostSpec);

    if (_databaseName.has_value())
        result.value += std::format("/{}", *_databaseName);

    if (!_parameters.empty())
    {
        std::string_view delimiter = "?";
        for (auto const& [key, value]: _parameters)
        {
            result.value += std::format("{}{}={}", delimiter, key, value);
            delimiter = "&";
        }
    }

    SqlLogger::GetLogger().OnRender(Dialect, result);
    return result;
}

std::string SqlPostgresConnectionString::ToString() const
{
    return ToConnectionString().value;
}
