#ifndef API_AUTH_HPP
#define API_AUTH_HPP

#include <chrono>
#include <string>

#include "api_word.hpp"

using deadline_t = std::chrono::steady_clock::time_point;

// One request/reply exchange on an established router socket
class ApiTransport {
public:
    virtual ~ApiTransport() = default;

    // Writes the sentence and reads sentences up to !done or !fatal.
    // Throws ApiProtocolError on I/O failure or when the deadline passes.
    virtual ApiReply roundTrip( const api_sentence_t &sentence, deadline_t deadline ) = 0;
};

// "00" + hex( MD5( 0x00 + password + challenge ) )
std::string challengeResponse( const std::string &password, const std::string &challenge_hex );

// Plain /login, falls back to challenge-response when the router answers =ret=.
// Throws ApiAuthError when the router refuses.
void apiLogin( ApiTransport &transport, const std::string &username, const std::string &password, std::chrono::milliseconds timeout );

#endif
