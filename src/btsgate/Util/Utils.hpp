#pragma once

#include <stdexcept>
#include <string>

namespace Btsgate
{

class BtsgateError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Missing or malformed configuration, fatal at startup.
class ConfigurationError : public BtsgateError
{
    using BtsgateError::BtsgateError;
};

// Endpoint unreachable, handshake failure, timeout or dropped connection.
class ConnectivityError : public BtsgateError
{
    using BtsgateError::BtsgateError;
};

// The remote end rejected or errored on a specific call.
class RemoteCallError : public BtsgateError
{
    using BtsgateError::BtsgateError;
};

// The endpoint did not grant the API a call requires.
class ApiUnavailableError : public BtsgateError
{
    using BtsgateError::BtsgateError;
};

// Malformed or missing caller input, raised before any network activity.
class ValidationError : public BtsgateError
{
    using BtsgateError::BtsgateError;
};

} // namespace Btsgate
