#include <cctype>
#include <deque>

#include <gtest/gtest.h>

#include "api_auth.hpp"
#include "errors.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

class ScriptedTransport: public ApiTransport {
public:
    ApiReply roundTrip( const api_sentence_t &sentence, deadline_t deadline ) override {
        sent.push_back( sentence );
        if( replies.empty() ) {
            throw ApiProtocolError( "no more replies" );
        }
        auto r = replies.front();
        replies.pop_front();
        return parseReply( r );
    }

    std::deque<std::vector<std::string>> replies;
    std::vector<api_sentence_t> sent;
};

TEST( ApiAuthTest, PlainLogin ) {
    ScriptedTransport t;
    t.replies.push_back( { "!done" } );

    apiLogin( t, "admin", "secret", 1s );

    ASSERT_EQ( t.sent.size(), 1 );
    EXPECT_EQ( t.sent[ 0 ], api_sentence_t( { "/login", "=name=admin", "=password=secret" } ) );
}

TEST( ApiAuthTest, ChallengeLogin ) {
    ScriptedTransport t;
    t.replies.push_back( { "!done", "=ret=0123456789abcdef0123456789abcdef" } );
    t.replies.push_back( { "!done" } );

    apiLogin( t, "admin", "secret", 1s );

    ASSERT_EQ( t.sent.size(), 2 );
    auto expected = "00" + md5_hex( std::string( 1, '\0' ) + "secret" + from_hex( "0123456789abcdef0123456789abcdef" ) );
    EXPECT_EQ( t.sent[ 1 ], api_sentence_t( { "/login", "=name=admin", "=response=" + expected } ) );
}

TEST( ApiAuthTest, ChallengeResponseFormat ) {
    auto resp = challengeResponse( "", "00000000000000000000000000000000" );
    ASSERT_EQ( resp.size(), 34 );
    EXPECT_EQ( resp.substr( 0, 2 ), "00" );
    // lowercase hex digest
    for( auto c: resp ) {
        EXPECT_TRUE( std::isdigit( static_cast<unsigned char>( c ) ) || ( c >= 'a' && c <= 'f' ) );
    }
}

TEST( ApiAuthTest, RejectedCredentials ) {
    ScriptedTransport t;
    t.replies.push_back( { "!trap", "=message=invalid user name or password (6)", "!done" } );

    try {
        apiLogin( t, "admin", "wrong", 1s );
        FAIL() << "login must fail";
    } catch( const ApiAuthError &e ) {
        EXPECT_EQ( std::string( e.what() ), "login failed: invalid user name or password (6)" );
    }
}

TEST( ApiAuthTest, RejectedChallengeResponse ) {
    ScriptedTransport t;
    t.replies.push_back( { "!done", "=ret=0123456789abcdef0123456789abcdef" } );
    t.replies.push_back( { "!trap", "=message=cannot log in", "!done" } );

    EXPECT_THROW( apiLogin( t, "admin", "wrong", 1s ), ApiAuthError );
}

TEST( ApiAuthTest, InvalidChallenge ) {
    ScriptedTransport t;
    t.replies.push_back( { "!done", "=ret=not-hex" } );

    EXPECT_THROW( apiLogin( t, "admin", "secret", 1s ), ApiAuthError );
    EXPECT_EQ( t.sent.size(), 1 );
}
