#ifndef RUNTIME_HPP
#define RUNTIME_HPP

#include <iostream>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "config.hpp"
#include "log.hpp"

class ConnectionPool;
class NasClient;
class ControlChannel;

struct NasDevice {
    std::string name;
    DeviceConf conf;
    std::shared_ptr<NasClient> client;
    // empty when the device has no coa section
    std::shared_ptr<ControlChannel> coa;
};

class NASCPRuntime {
public:
    NASCPRuntime() = delete;
    NASCPRuntime( const NASCPRuntime& ) = delete;
    NASCPRuntime( std::string cp, NASCPGlobalConf c, std::ostream &log_os = std::cout );
    ~NASCPRuntime();

    NASCPRuntime& operator=( const NASCPRuntime& ) = delete;

    NASCPGlobalConf conf;
    std::unique_ptr<Logger> logger;
    std::unique_ptr<ConnectionPool> pool;
    // blocking router and RADIUS calls run here, off the event loop
    boost::asio::thread_pool workers { 4 };

    // Throws NotFoundError for an unknown device
    std::shared_ptr<NasDevice> getDevice( const std::string &name ) const;
    std::vector<std::shared_ptr<NasDevice>> getDevices() const;

    // Rereads the device table from conf_path, pool settings stay as they are
    void reloadConfig();
    void stop();

private:
    void applyDevices( const std::map<std::string,DeviceConf> &devs );

    mutable std::shared_mutex devices_mutex;
    std::map<std::string,std::shared_ptr<NasDevice>> devices;
    std::string conf_path;
};

#endif
