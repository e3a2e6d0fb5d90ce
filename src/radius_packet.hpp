#ifndef RADIUS_PACKET_HPP
#define RADIUS_PACKET_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "net_integer.hpp"
#include "utils.hpp"

enum class RADIUS_CODE : uint8_t {
    DISCONNECT_REQUEST = 40,
    DISCONNECT_ACK = 41,
    DISCONNECT_NAK = 42,
    COA_REQUEST = 43,
    COA_ACK = 44,
    COA_NAK = 45,
    RESERVED = 255
};

// Attribute types used by the control client
enum class RADIUS_ATTR : uint8_t {
    USER_NAME = 1,
    REPLY_MESSAGE = 18,
    VENDOR_SPECIFIC = 26,
    ACCT_STATUS_TYPE = 40,
    ACCT_DELAY_TIME = 41,
    ACCT_INPUT_OCTETS = 42,
    ACCT_SESSION_ID = 44,
    ERROR_CAUSE = 101
};

// Error-Cause values, RFC 5176 section 3.5
enum class ERROR_CAUSE : uint32_t {
    UNSUPPORTED_EXTENSION = 406,
    SESSION_CONTEXT_NOT_FOUND = 503
};

struct RadiusPacket {
    RADIUS_CODE code;
    uint8_t id;
    BE16 length;
    authenticator_t authenticator;
}__attribute__((__packed__));

static_assert( sizeof( RadiusPacket ) == 20, "RADIUS header is not 20 bytes long" );

// MD5( code + id + length + 16 zero bytes + attributes + secret )
authenticator_t requestAuthenticator( RADIUS_CODE code, uint8_t id, const std::vector<uint8_t> &attrs, const std::string &secret );

// MD5( code + id + length + request authenticator + attributes + secret )
authenticator_t responseAuthenticator( RADIUS_CODE code, uint8_t id, const authenticator_t &req_auth, const std::vector<uint8_t> &attrs, const std::string &secret );

// Header + attributes with the authenticator already placed
std::vector<uint8_t> buildRadiusPacket( RADIUS_CODE code, uint8_t id, const authenticator_t &auth, const std::vector<uint8_t> &attrs );

#endif
