#include <thread>

#include <gtest/gtest.h>

#include "api_connection.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "fake_router.hpp"

using namespace std::chrono_literals;

class ApiConnectionTest: public ::testing::Test {
protected:
    ApiConnectionTest():
        logger( log_os )
    {
        conf.connect_timeout = 500ms;
        conf.login_timeout = 500ms;
        conf.command_timeout = 300ms;
        conf.probe_timeout = 20ms;
    }

    std::ostringstream log_os;
    Logger logger;
    PoolConfig conf;
    FakeRouter router;
};

TEST_F( ApiConnectionTest, PlainLoginAndExecute ) {
    router.setHandler( []( const api_sentence_t &s ) -> std::vector<api_sentence_t> {
        return {
            reSentence( { { ".id", "*1" }, { "name", "alice" } } ),
            reSentence( { { ".id", "*2" }, { "name", "bob" } } ),
            { "!done" }
        };
    });

    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    auto records = pc->execute( "/ppp/active/print" );

    ASSERT_EQ( records.size(), 2 );
    EXPECT_EQ( records[ 1 ].at( "name" ), "bob" );
    EXPECT_EQ( router.commands(), std::vector<std::string>( { "/ppp/active/print" } ) );
}

TEST_F( ApiConnectionTest, ChallengeLogin ) {
    router.setChallenge( true );
    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    EXPECT_NO_THROW( pc->execute( "/system/identity/print" ) );
}

TEST_F( ApiConnectionTest, WrongPassword ) {
    EXPECT_THROW( ApiConnection::open( logger, router.address(), "admin", "wrong", conf ), ApiAuthError );
}

TEST_F( ApiConnectionTest, ConnectRefused ) {
    std::string address;
    {
        FakeRouter gone;
        address = gone.address();
    }
    EXPECT_THROW( ApiConnection::open( logger, address, "admin", "secret", conf ), ApiConnectError );
}

TEST_F( ApiConnectionTest, ArgumentsAreSentAsWords ) {
    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    pc->execute( "/ppp/active/set", { "=.id=*5", "=rate-limit=2048k/4096k" } );

    auto sentences = router.sentences();
    ASSERT_EQ( sentences.size(), 1 );
    EXPECT_EQ( sentences[ 0 ], api_sentence_t( { "/ppp/active/set", "=.id=*5", "=rate-limit=2048k/4096k" } ) );
}

TEST_F( ApiConnectionTest, TrapKeepsConnectionUsable ) {
    router.setHandler( []( const api_sentence_t &s ) -> std::vector<api_sentence_t> {
        if( s.front() == "/bad" ) {
            return { trapSentence( "no such command" ), { "!done" } };
        }
        return { { "!done" } };
    });

    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    try {
        pc->execute( "/bad" );
        FAIL() << "trap must throw";
    } catch( const ApiTrapError &e ) {
        EXPECT_EQ( e.message, "no such command" );
        EXPECT_EQ( std::string( e.what() ), "router error: no such command" );
    }
    EXPECT_FALSE( pc->isClosed() );
    EXPECT_NO_THROW( pc->execute( "/good" ) );
}

TEST_F( ApiConnectionTest, FatalClosesConnection ) {
    router.setHandler( []( const api_sentence_t &s ) -> std::vector<api_sentence_t> {
        return { { "!fatal", "session terminated" } };
    });

    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    EXPECT_THROW( pc->execute( "/quit" ), ApiProtocolError );
    EXPECT_TRUE( pc->isClosed() );
    EXPECT_FALSE( pc->isAlive() );
}

TEST_F( ApiConnectionTest, CommandTimeout ) {
    router.setHandler( []( const api_sentence_t &s ) -> std::vector<api_sentence_t> {
        return {};
    });

    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW( pc->execute( "/hang" ), ApiProtocolError );
    EXPECT_GE( std::chrono::steady_clock::now() - start, conf.command_timeout );
    EXPECT_TRUE( pc->isClosed() );
}

TEST_F( ApiConnectionTest, ProbeSeesPeerClose ) {
    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    EXPECT_TRUE( pc->isAlive() );

    router.dropAll();
    std::this_thread::sleep_for( 50ms );
    EXPECT_FALSE( pc->isAlive() );
}

TEST_F( ApiConnectionTest, InUseFlags ) {
    auto pc = ApiConnection::open( logger, router.address(), "admin", "secret", conf );
    EXPECT_FALSE( pc->inUse() );
    EXPECT_TRUE( pc->markInUse() );
    EXPECT_FALSE( pc->markInUse() );
    EXPECT_TRUE( pc->inUse() );

    auto before = pc->lastUsedAt();
    std::this_thread::sleep_for( 5ms );
    pc->release();
    EXPECT_FALSE( pc->inUse() );
    EXPECT_GT( pc->lastUsedAt(), before );
    EXPECT_LE( pc->createdAt(), before );

    pc->close();
    EXPECT_TRUE( pc->isClosed() );
    EXPECT_FALSE( pc->markInUse() );
    EXPECT_THROW( pc->execute( "/any" ), ApiProtocolError );
}
