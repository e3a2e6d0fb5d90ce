#ifndef REQUEST_RESPONSE_HPP
#define REQUEST_RESPONSE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

template<typename T>
std::vector<uint8_t> serializeAttributes( const T &v );

template<typename T>
T deserializeAttributes( const std::vector<uint8_t> &v );

// Value of Acct-Status-Type, Acct-Delay-Time and Acct-Input-Octets in a CoA-Request
constexpr uint32_t COA_ACCT_SENTINEL = 48;

struct CoARequest {
    std::string username;
    std::string session_id;
    std::string rate_limit;
};

struct DisconnectRequest {
    std::string username;
    std::string session_id;
};

// Both ACK and NAK answers, only Error-Cause is of interest
struct CoAResponse {
    std::optional<uint32_t> error_cause;
    std::string reply_message;
};

#endif
