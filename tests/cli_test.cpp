#include <gtest/gtest.h>

#include "cli.hpp"
#include "runtime.hpp"
#include "connection_pool.hpp"
#include "fake_router.hpp"
#include "fake_nas.hpp"

using namespace std::chrono_literals;

static std::vector<api_sentence_t> one_session( const api_sentence_t &s ) {
    if( s.front() == "/ppp/active/print" ) {
        return {
            reSentence( { { ".id", "*A1" }, { "name", "alice" }, { "address", "10.0.0.5" }, { "session-id", "0x81A00001" } } ),
            { "!done" }
        };
    }
    if( s.front() == "/system/identity/print" ) {
        return { reSentence( { { "name", "core-router" } } ), { "!done" } };
    }
    return { { "!done" } };
}

class CLITest: public ::testing::Test {
protected:
    CLITest():
        nas( "testing123" ),
        runtime( "", make_conf(), log_os )
    {
        router.setHandler( one_session );
    }

    NASCPGlobalConf make_conf() {
        NASCPGlobalConf conf;
        conf.pool.connect_timeout = 500ms;
        conf.pool.login_timeout = 500ms;
        conf.pool.command_timeout = 500ms;
        conf.pool.probe_timeout = 10ms;

        conf.devices.emplace( "core1", DeviceConf { router.address(), "admin", "secret", CoAConf { nas.port(), "testing123", COA_METHOD::NATIVE, 500ms } } );
        conf.devices.emplace( "edge1", DeviceConf { router.address(), "admin", "secret", std::nullopt } );
        return conf;
    }

    CLI_MSG call( CLI_CMD cmd, std::string data = {} ) {
        CLI_MSG msg;
        msg.type = CLI_CMD_TYPE::REQUEST;
        msg.cmd = cmd;
        msg.data = std::move( data );
        // goes through the archive like a socket request
        return deserialize<CLI_MSG>( serialize( processCLIRequest( runtime, deserialize<CLI_MSG>( serialize( msg ) ) ) ) );
    }

    std::ostringstream log_os;
    FakeRouter router;
    FakeNas nas;
    NASCPRuntime runtime;
};

TEST_F( CLITest, Version ) {
    auto resp = call( CLI_CMD::GET_VERSION );
    EXPECT_EQ( resp.type, CLI_CMD_TYPE::RESPONSE );
    EXPECT_TRUE( resp.error.empty() );
    EXPECT_EQ( deserialize<GET_VERSION_RESP>( resp.data ).version_string, NASCPD_VERSION );
}

TEST_F( CLITest, Devices ) {
    auto resp = deserialize<GET_DEVICES_RESP>( call( CLI_CMD::GET_DEVICES ).data );
    ASSERT_EQ( resp.devices.size(), 2 );
    EXPECT_EQ( resp.devices[ 0 ].name, "core1" );
    EXPECT_FALSE( resp.devices[ 0 ].coa.empty() );
    EXPECT_EQ( resp.devices[ 1 ].name, "edge1" );
    EXPECT_TRUE( resp.devices[ 1 ].coa.empty() );
}

TEST_F( CLITest, SessionsAndPoolStats ) {
    auto resp = call( CLI_CMD::GET_SESSIONS, serialize( DEVICE_REQ { "core1" } ) );
    ASSERT_TRUE( resp.error.empty() ) << resp.error;
    auto sessions = deserialize<GET_SESSIONS_RESP>( resp.data );
    EXPECT_EQ( sessions.device, "core1" );
    ASSERT_EQ( sessions.sessions.size(), 1 );
    EXPECT_EQ( sessions.sessions[ 0 ].name, "alice" );

    auto stats = deserialize<GET_POOL_STATS_RESP>( call( CLI_CMD::GET_POOL_STATS ).data );
    EXPECT_EQ( stats.total_pools, 1 );
    EXPECT_EQ( stats.total_connections, 1 );
    EXPECT_EQ( stats.active_connections, 0 );
    ASSERT_EQ( stats.pools.size(), 1 );
    EXPECT_EQ( stats.pools[ 0 ].address, router.address() );
}

TEST_F( CLITest, Identity ) {
    auto resp = deserialize<GET_IDENTITY_RESP>( call( CLI_CMD::GET_IDENTITY, serialize( DEVICE_REQ { "edge1" } ) ).data );
    EXPECT_EQ( resp.identity, "core-router" );
}

TEST_F( CLITest, UnknownDevice ) {
    auto resp = call( CLI_CMD::GET_SESSIONS, serialize( DEVICE_REQ { "nope" } ) );
    EXPECT_EQ( resp.error, "unknown device nope" );
    EXPECT_TRUE( resp.data.empty() );
}

TEST_F( CLITest, DisconnectThroughApi ) {
    DISCONNECT_REQ req;
    req.device = "core1";
    req.username = "alice";
    auto resp = call( CLI_CMD::DISCONNECT, serialize( req ) );
    EXPECT_TRUE( resp.error.empty() ) << resp.error;
    EXPECT_EQ( router.sentences().back(), api_sentence_t( { "/ppp/active/remove", "=.id=*A1" } ) );
}

TEST_F( CLITest, DisconnectWithoutCoA ) {
    DISCONNECT_REQ req;
    req.device = "edge1";
    req.username = "alice";
    req.session_id = "81a00001";
    req.via_radius = true;
    auto resp = call( CLI_CMD::DISCONNECT, serialize( req ) );
    EXPECT_EQ( resp.error, "no CoA configured for device edge1" );
}

TEST_F( CLITest, RateLimitThroughCoALooksUpSession ) {
    SET_RATE_LIMIT_REQ req;
    req.device = "core1";
    req.username = "alice";
    req.download_kbps = 4096;
    req.upload_kbps = 1024;
    req.via_radius = true;
    auto resp = call( CLI_CMD::SET_RATE_LIMIT, serialize( req ) );
    ASSERT_TRUE( resp.error.empty() ) << resp.error;

    auto requests = nas.requests();
    ASSERT_EQ( requests.size(), 1 );
    EXPECT_EQ( requests[ 0 ].code, RADIUS_CODE::COA_REQUEST );
    EXPECT_EQ( router.commands(), std::vector<std::string>( { "/ppp/active/print" } ) );
}

TEST_F( CLITest, RateLimitThroughApi ) {
    SET_RATE_LIMIT_REQ req;
    req.device = "core1";
    req.username = "alice";
    req.download_kbps = 4096;
    req.upload_kbps = 1024;
    auto resp = call( CLI_CMD::SET_RATE_LIMIT, serialize( req ) );
    ASSERT_TRUE( resp.error.empty() ) << resp.error;
    EXPECT_EQ( router.sentences().back(), api_sentence_t( { "/ppp/active/set", "=.id=*A1", "=rate-limit=1024k/4096k" } ) );
}

TEST_F( CLITest, CleanupPool ) {
    call( CLI_CMD::GET_IDENTITY, serialize( DEVICE_REQ { "core1" } ) );
    auto stats = deserialize<GET_POOL_STATS_RESP>( call( CLI_CMD::CLEANUP_POOL ).data );
    EXPECT_EQ( stats.total_connections, 1 );
}
