// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnectInfo.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>

/// Builds a Microsoft SQL Server connection string, `key1=value1;key2=value2;...`.
///
/// All parameter values are automatically quoted as required by SQL Server
/// (see QuoteConnectionStringValue()), keys are stored verbatim.
/// Objects of this type are immutable values: each setter returns an updated copy.
///
/// @code
/// auto const connectionString = SqlServerConnectionString {}
///                                   .SetUsernameAndPassword("user", "password")
///                                   .SetHostWithPort("localhost", 1433)
///                                   .SetDatabaseName("db_name")
///                                   .SetConnectTimeout(30)
///                                   .EnableEncryptionAndTrustServerCertificate()
///                                   .ToString();
/// @endcode
///
/// @see https://learn.microsoft.com/en-us/sql/connect/ado-net/connection-strings
class CONNSTR_API SqlServerConnectionString
{
  public:
    using ParameterMap = std::unordered_map<std::string, std::string>;

    static constexpr uint8_t MinConnectRetryInterval = 1;
    static constexpr uint8_t MaxConnectRetryInterval = 60;

    /// Constructs an empty connection string, rendering to an empty string.
    SqlServerConnectionString() = default;

    /// Constructs a connection string from dialect independent settings.
    ///
    /// Empty host, username or database are left unset. A negative timeout is ignored.
    [[nodiscard]] static SqlServerConnectionString FromSettings(SqlConnectionSettings const& settings);

    /// Sets/replaces ANY parameter, even if it is not known to this builder.
    ///
    /// The value is quoted if required, the key is stored as-is.
    [[nodiscard]] SqlServerConnectionString DangerouslySetParameter(std::string_view key, std::string_view value) const;

    /// Sets/replaces the username and removes the password parameter, if previously set.
    ///
    /// Parameters: `user=<username>`
    [[nodiscard]] SqlServerConnectionString SetUsernameWithoutPassword(std::string_view username) const;

    /// Parameters: `user=<username>;password=<password>`
    [[nodiscard]] SqlServerConnectionString SetUsernameAndPassword(std::string_view username,
                                                                   std::string_view password) const;

    [[nodiscard]] SqlServerConnectionString SetUsernameAndPassword(SqlUsernamePassword const& credentials) const;

    /// Sets/replaces the host and omits the port, usually resulting in the default port being used.
    ///
    /// Parameters: `server=<host>`
    [[nodiscard]] SqlServerConnectionString SetHostWithDefaultPort(std::string_view host) const;

    /// Parameters: `server=<host>,<port>`
    [[nodiscard]] SqlServerConnectionString SetHostWithPort(std::string_view host, std::size_t port) const;

    [[nodiscard]] SqlServerConnectionString SetHostWithPort(SqlHostPort const& hostPort) const;

    /// Parameters: `encrypt=true`
    [[nodiscard]] SqlServerConnectionString EnableEncryption() const;

    /// Enables encryption and trusts the server certificate,
    /// even if it is not normally trusted (e.g. self-signed or issued by an untrusted root CA).
    ///
    /// Parameters: `encrypt=true;trustServerCertificate=true`
    [[nodiscard]] SqlServerConnectionString EnableEncryptionAndTrustServerCertificate() const;

    /// Parameters: `database=<databaseName>`
    [[nodiscard]] SqlServerConnectionString SetDatabaseName(std::string_view databaseName) const;

    /// Sets/replaces the connect timeout, in seconds. Negative values are ignored.
    ///
    /// Parameters: `timeout=<timeout>`
    [[nodiscard]] SqlServerConnectionString SetConnectTimeout(int32_t timeout) const;

    /// Sets/replaces the command timeout, in seconds. Negative values are ignored.
    ///
    /// Parameters: `command timeout=<timeout>`
    [[nodiscard]] SqlServerConnectionString SetCommandTimeout(int32_t timeout) const;

    /// Parameters: `connectRetryCount=<count>`
    [[nodiscard]] SqlServerConnectionString SetConnectRetryCount(uint8_t count) const;

    /// Sets/replaces the connect retry interval, in seconds.
    ///
    /// The value is clamped to the range [MinConnectRetryInterval, MaxConnectRetryInterval].
    ///
    /// Parameters: `connectRetryInterval=<interval>`
    [[nodiscard]] SqlServerConnectionString SetConnectRetryInterval(uint8_t interval) const;

    /// Retrieves the (already quoted) parameters, in no particular order.
    [[nodiscard]] ParameterMap const& Parameters() const noexcept
    {
        return _parameters;
    }

    /// Renders the connection string.
    ///
    /// The order of the parameters is unspecified.
    [[nodiscard]] SqlConnectionString ToConnectionString() const;

    [[nodiscard]] std::string ToString() const;

    bool operator==(SqlServerConnectionString const&) const = default;

  private:
    [[nodiscard]] SqlServerConnectionString WithoutParameter(std::string_view key) const;

    ParameterMap _parameters;
};

template <>
struct std::formatter<SqlServerConnectionString>: std::formatter<std::string>
{
    auto format(SqlServerConnectionString const& connectionString, format_context& ctx) const
        -> format_context::iterator
    {
        return formatter<string>::format(connectionString.ToString(), ctx);
    }
};
