#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

struct NasError: public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Device unreachable or connect timed out
struct ApiConnectError: public NasError {
    using NasError::NasError;
};

// Credentials rejected, challenge-response mismatch
struct ApiAuthError: public NasError {
    using NasError::NasError;
};

// Malformed length prefix, short read, I/O timeout, !fatal.
// The connection framing can't be trusted after this.
struct ApiProtocolError: public NasError {
    using NasError::NasError;
};

// Router answered with !trap
struct ApiTrapError: public NasError {
    explicit ApiTrapError( const std::string &msg ):
        NasError( "router error: " + msg ),
        message( msg )
    {}

    std::string message;
};

struct PoolTimeoutError: public NasError {
    using NasError::NasError;
};

struct NotFoundError: public NasError {
    using NasError::NasError;
};

struct CoAError: public NasError {
    using NasError::NasError;
};

// NAS answered with CoA-NAK or Disconnect-NAK
struct CoANakError: public CoAError {
    using CoAError::CoAError;
};

#endif
