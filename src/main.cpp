#include <memory>
#include <string>
#include <fstream>
#include <cstdio>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>
#include "yaml.hpp"

#include "main.hpp"
#include "runtime.hpp"
#include "evloop.hpp"
#include "cli.hpp"

NASCPGlobalConf sampleConfig() {
    NASCPGlobalConf global_conf;

    global_conf.log_level = LOGL::INFO;
    global_conf.socket_path = "/var/run/nascpd.sock";

    {
        DeviceConf dev;
        dev.address = "10.0.0.1:8728";
        dev.username = "api";
        dev.password = "secret";

        CoAConf coa;
        coa.port = COA_DEFAULT_PORT;
        coa.secret = "testing123";
        coa.method = COA_METHOD::NATIVE;
        dev.coa.emplace( std::move( coa ) );

        global_conf.devices.emplace( "core1", std::move( dev ) );
    }

    {
        DeviceConf dev;
        dev.address = "10.0.1.1";
        dev.username = "api";
        dev.password = "secret";

        CoAConf coa;
        coa.secret = "testing123";
        coa.method = COA_METHOD::RADCLIENT;
        dev.coa.emplace( std::move( coa ) );

        global_conf.devices.emplace( "edge1", std::move( dev ) );
    }

    return global_conf;
}

static void conf_init() {
    YAML::Node config;
    config = sampleConfig();

    std::ofstream fout("config.yaml");
    fout << config << std::endl;
}

int main( int argc, char *argv[] ) {
    std::string path_config { "config.yaml" };

    boost::program_options::options_description desc {
        "NAS control plane daemon.\n"
        "This daemon keeps pooled API connections to the NAS routers and pushes CoA/Disconnect requests to them. All configuration is available through config file. You can generate sample configuration to see all the parameters.\n"
        "\n"
        "Arguments"
    };
    desc.add_options()
    ( "path,p", boost::program_options::value( &path_config ), "Path to config: default is \"config.yaml\"" )
    ( "genconf,g", "Generate a sample configuration" )
    ( "help,h", "Print this message" )
    ;

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store( boost::program_options::parse_command_line( argc, argv, desc ), vm );
        boost::program_options::notify( vm );
    } catch( const boost::program_options::error &e ) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if( vm.count( "help" ) ) {
        std::cout << desc << "\n";
        return 0;
    }

    if( vm.count( "genconf" ) ) {
        conf_init();
        return 0;
    }

    NASCPGlobalConf conf;
    try {
        YAML::Node config = YAML::LoadFile( path_config );
        conf = config.as<NASCPGlobalConf>();
    } catch( const YAML::Exception &e ) {
        std::cerr << "Cannot load config " << path_config << ": " << e.what() << std::endl;
        return 1;
    }

    boost::asio::io_context io;
    auto runtime = std::make_shared<NASCPRuntime>( path_config, conf );

    EVLoop loop( io, *runtime );
    std::remove( runtime->conf.socket_path.c_str() );
    CLIServer cli { io, runtime->conf.socket_path, *runtime };

    while( !interrupted ) {
        io.run();
    }

    runtime->stop();
    std::remove( runtime->conf.socket_path.c_str() );
    return 0;
}
