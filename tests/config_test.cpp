#include <filesystem>
#include <fstream>
#include <unistd.h>

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include "config.hpp"
#include "yaml.hpp"
#include "runtime.hpp"
#include "errors.hpp"

using namespace std::chrono_literals;

TEST( ConfigTest, FullConfig ) {
    auto conf = YAML::Load(
        "log_level: DEBUG\n"
        "socket_path: /tmp/nascpd.sock\n"
        "pool:\n"
        "  max_connections: 4\n"
        "  idle_timeout: 60\n"
        "  connect_timeout: 3\n"
        "  max_age: 600\n"
        "  cleanup_interval: 30\n"
        "  command_timeout: 7\n"
        "  login_timeout: 2\n"
        "devices:\n"
        "  core1:\n"
        "    address: 10.0.0.1:8729\n"
        "    username: api\n"
        "    password: pass\n"
        "    coa:\n"
        "      port: 1700\n"
        "      secret: testing123\n"
        "      method: RADCLIENT\n"
        "      timeout: 3\n"
        "  edge1:\n"
        "    address: 10.0.1.1\n"
        "    username: api\n"
        "    password: pass\n"
    ).as<NASCPGlobalConf>();

    EXPECT_EQ( conf.log_level, LOGL::DEBUG );
    EXPECT_EQ( conf.socket_path, "/tmp/nascpd.sock" );
    EXPECT_EQ( conf.pool.max_connections, 4 );
    EXPECT_EQ( conf.pool.idle_timeout, 60s );
    EXPECT_EQ( conf.pool.connect_timeout, 3s );
    EXPECT_EQ( conf.pool.max_age, 600s );
    EXPECT_EQ( conf.pool.cleanup_interval, 30s );
    EXPECT_EQ( conf.pool.command_timeout, 7s );
    EXPECT_EQ( conf.pool.login_timeout, 2s );

    ASSERT_EQ( conf.devices.size(), 2 );
    auto const &core = conf.devices.at( "core1" );
    EXPECT_EQ( core.address, "10.0.0.1:8729" );
    ASSERT_TRUE( core.coa.has_value() );
    EXPECT_EQ( core.coa->port, 1700 );
    EXPECT_EQ( core.coa->secret, "testing123" );
    EXPECT_EQ( core.coa->method, COA_METHOD::RADCLIENT );
    EXPECT_EQ( core.coa->timeout, 3s );
    EXPECT_FALSE( conf.devices.at( "edge1" ).coa.has_value() );
}

TEST( ConfigTest, Defaults ) {
    auto conf = YAML::Load(
        "devices:\n"
        "  core1:\n"
        "    address: 10.0.0.1\n"
        "    username: api\n"
        "    password: pass\n"
        "    coa:\n"
        "      secret: s\n"
    ).as<NASCPGlobalConf>();

    EXPECT_EQ( conf.log_level, LOGL::INFO );
    EXPECT_EQ( conf.pool.max_connections, 10 );
    EXPECT_EQ( conf.pool.idle_timeout, 5min );
    EXPECT_EQ( conf.pool.connect_timeout, 5s );
    EXPECT_EQ( conf.pool.max_age, 30min );
    EXPECT_EQ( conf.pool.cleanup_interval, 1min );
    EXPECT_EQ( conf.pool.command_timeout, 10s );

    auto const &coa = conf.devices.at( "core1" ).coa;
    ASSERT_TRUE( coa.has_value() );
    EXPECT_EQ( coa->port, COA_DEFAULT_PORT );
    EXPECT_EQ( coa->method, COA_METHOD::NATIVE );
    EXPECT_EQ( coa->timeout, 5s );
}

TEST( ConfigTest, InvalidValues ) {
    EXPECT_THROW( YAML::Load( "pool:\n  max_connections: 0\n" ).as<NASCPGlobalConf>(), YAML::BadConversion );
    EXPECT_THROW( YAML::Load( "pool:\n  cleanup_interval: 0\n" ).as<NASCPGlobalConf>(), YAML::BadConversion );
    EXPECT_THROW( YAML::Load( "{max_connections: 2, cleanup_interval: 0}" ).as<PoolConfig>(), YAML::BadConversion );
    EXPECT_THROW( YAML::Load( "log_level: LOUD\n" ).as<NASCPGlobalConf>(), YAML::BadConversion );
    EXPECT_THROW( YAML::Load(
        "devices:\n"
        "  core1:\n"
        "    address: 10.0.0.1\n"
        "    username: api\n"
        "    password: pass\n"
        "    coa:\n"
        "      secret: s\n"
        "      method: CARRIER_PIGEON\n"
    ).as<NASCPGlobalConf>(), YAML::BadConversion );
}

TEST( ConfigTest, EncodeDecode ) {
    NASCPGlobalConf conf;
    conf.log_level = LOGL::WARN;
    conf.pool.max_connections = 3;
    DeviceConf dev { "10.0.0.1", "api", "pass", CoAConf { 1700, "s", COA_METHOD::RADCLIENT, 2s } };
    conf.devices.emplace( "core1", dev );

    YAML::Node node;
    node = conf;
    auto back = YAML::Load( YAML::Dump( node ) ).as<NASCPGlobalConf>();

    EXPECT_EQ( back.log_level, LOGL::WARN );
    EXPECT_EQ( back.pool.max_connections, 3 );
    EXPECT_EQ( back.devices.at( "core1" ).coa->port, 1700 );
    EXPECT_EQ( back.devices.at( "core1" ).coa->method, COA_METHOD::RADCLIENT );
}

TEST( RuntimeTest, ReloadReplacesDevices ) {
    auto path = std::filesystem::temp_directory_path() / ( "nascp_reload_" + std::to_string( ::getpid() ) + ".yaml" );
    {
        std::ofstream f( path );
        f << "devices:\n"
             "  core1:\n"
             "    address: 10.0.0.1\n"
             "    username: api\n"
             "    password: pass\n";
    }

    std::ostringstream log_os;
    auto conf = YAML::LoadFile( path.string() ).as<NASCPGlobalConf>();
    NASCPRuntime runtime { path.string(), conf, log_os };
    EXPECT_EQ( runtime.getDevices().size(), 1 );
    EXPECT_EQ( runtime.getDevice( "core1" )->coa, nullptr );
    EXPECT_THROW( runtime.getDevice( "edge1" ), NotFoundError );

    {
        std::ofstream f( path );
        f << "log_level: DEBUG\n"
             "devices:\n"
             "  edge1:\n"
             "    address: 10.0.1.1\n"
             "    username: api\n"
             "    password: pass\n"
             "    coa:\n"
             "      secret: s\n";
    }
    runtime.reloadConfig();

    EXPECT_EQ( runtime.logger->getLevel(), LOGL::DEBUG );
    EXPECT_THROW( runtime.getDevice( "core1" ), NotFoundError );
    EXPECT_NE( runtime.getDevice( "edge1" )->coa, nullptr );

    // a broken file keeps the running devices
    {
        std::ofstream f( path );
        f << "devices: [ unterminated\n";
    }
    runtime.reloadConfig();
    EXPECT_NO_THROW( runtime.getDevice( "edge1" ) );

    runtime.stop();
    std::filesystem::remove( path );
}
