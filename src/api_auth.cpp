#include <stdexcept>

#include "api_auth.hpp"
#include "errors.hpp"
#include "utils.hpp"

std::string challengeResponse( const std::string &password, const std::string &challenge_hex ) {
    std::string challenge;
    try {
        challenge = from_hex( challenge_hex );
    } catch( const std::invalid_argument &e ) {
        throw ApiAuthError( std::string( "invalid login challenge: " ) + e.what() );
    }

    std::string check;
    check.reserve( 1 + password.size() + challenge.size() );
    check.push_back( '\0' );
    check += password;
    check += challenge;
    return "00" + md5_hex( check );
}

void apiLogin( ApiTransport &transport, const std::string &username, const std::string &password, std::chrono::milliseconds timeout ) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    auto reply = transport.roundTrip( { "/login", "=name=" + username, "=password=" + password }, deadline );
    if( reply.trap || reply.fatal ) {
        throw ApiAuthError( "login failed: " + reply.message );
    }

    auto const &it = reply.done.find( "ret" );
    if( it == reply.done.end() ) {
        return;
    }

    auto response = challengeResponse( password, it->second );
    reply = transport.roundTrip( { "/login", "=name=" + username, "=response=" + response }, deadline );
    if( reply.trap || reply.fatal ) {
        throw ApiAuthError( "login failed: " + reply.message );
    }
}
