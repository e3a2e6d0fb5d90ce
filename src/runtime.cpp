#include <yaml-cpp/yaml.h>

#include "runtime.hpp"
#include "connection_pool.hpp"
#include "nas_client.hpp"
#include "coa_client.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "yaml.hpp"

NASCPRuntime::NASCPRuntime( std::string cp, NASCPGlobalConf c, std::ostream &log_os ):
    conf( std::move( c ) ),
    conf_path( std::move( cp ) )
{
    logger = std::make_unique<Logger>( log_os );
    logger->setLevel( conf.log_level );
    logger->logInfo() << LOGS::MAIN << "Starting NAS control plane daemon..." << std::endl;

    pool = std::make_unique<ConnectionPool>( *logger, conf.pool );
    applyDevices( conf.devices );
    pool->start();
}

NASCPRuntime::~NASCPRuntime() {
    stop();
}

void NASCPRuntime::stop() {
    workers.join();
    pool->stop();
}

void NASCPRuntime::applyDevices( const std::map<std::string,DeviceConf> &devs ) {
    std::map<std::string,std::shared_ptr<NasDevice>> fresh;

    for( auto const &[ name, dconf ]: devs ) {
        auto dev = std::make_shared<NasDevice>();
        dev->name = name;
        dev->conf = dconf;
        dev->client = std::make_shared<NasClient>( *logger, *pool, DeviceTarget{ dconf.address, dconf.username, dconf.password } );
        if( dconf.coa.has_value() ) {
            auto [ host, port ] = splitHostPort( dconf.address, API_DEFAULT_PORT );
            dev->coa = makeControlChannel( *logger, host, *dconf.coa );
        }
        logger->logInfo() << LOGS::MAIN << "Device " << name << " at " << dconf.address << ( dev->coa ? " with CoA" : "" ) << std::endl;
        fresh.emplace( name, std::move( dev ) );
    }

    std::unique_lock lg { devices_mutex };
    devices.swap( fresh );
}

std::shared_ptr<NasDevice> NASCPRuntime::getDevice( const std::string &name ) const {
    std::shared_lock lg { devices_mutex };
    if( auto const &it = devices.find( name ); it != devices.end() ) {
        return it->second;
    }
    throw NotFoundError( "unknown device " + name );
}

std::vector<std::shared_ptr<NasDevice>> NASCPRuntime::getDevices() const {
    std::vector<std::shared_ptr<NasDevice>> ret;

    std::shared_lock lg { devices_mutex };
    for( auto const &[ name, dev ]: devices ) {
        ret.push_back( dev );
    }
    return ret;
}

void NASCPRuntime::reloadConfig() {
    try {
        YAML::Node config = YAML::LoadFile( conf_path );
        auto fresh = config.as<NASCPGlobalConf>();
        logger->setLevel( fresh.log_level );
        applyDevices( fresh.devices );
        conf.log_level = fresh.log_level;
        conf.devices = std::move( fresh.devices );
    } catch( std::exception &e ) {
        logger->logError() << LOGS::MAIN << "Error on reloading config: " << e.what() << std::endl;
    }
}
