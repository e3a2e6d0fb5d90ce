#ifndef CONNECTION_POOL_HPP
#define CONNECTION_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "api_connection.hpp"
#include "config.hpp"

class Logger;

struct PoolDeviceStats {
    uint32_t total { 0 };
    uint32_t active { 0 };
};

struct PoolStats {
    uint32_t total_pools { 0 };
    uint32_t total_connections { 0 };
    uint32_t active_connections { 0 };
    std::map<std::string,PoolDeviceStats> per_pool;
};

// Connections to one router address
struct NasPool {
    std::string address;
    std::string username;
    std::string password;
    std::vector<api_connection_ptr> connections;
    // slots reserved by connections being opened
    uint32_t pending { 0 };

    std::mutex mutex;
    std::condition_variable cv;

    NasPool( std::string a, std::string u, std::string p ):
        address( std::move( a ) ),
        username( std::move( u ) ),
        password( std::move( p ) )
    {}
};

class ConnectionPool {
public:
    ConnectionPool( Logger &l, PoolConfig c );
    ~ConnectionPool();

    ConnectionPool( const ConnectionPool& ) = delete;
    ConnectionPool& operator=( const ConnectionPool& ) = delete;

    // Starts the cleanup timer thread
    void start();
    // Stops the timer, closes every connection. Idempotent.
    void stop();

    // Returns a connection marked in use. Throws PoolTimeoutError when the
    // device stays at capacity for 2 x connect_timeout, and whatever opening
    // a new connection throws.
    api_connection_ptr get( const std::string &address, const std::string &username, const std::string &password );
    void put( const api_connection_ptr &pc );
    void remove( const api_connection_ptr &pc );

    // One eviction pass over idle, expired and closed connections
    void cleanup();

    PoolStats stats() const;

private:
    std::shared_ptr<NasPool> findPool( const std::string &address ) const;
    std::shared_ptr<NasPool> getPool( const std::string &address, const std::string &username, const std::string &password );
    void schedule_cleanup();
    void on_cleanup_timer( const boost::system::error_code &ec );

    Logger &logger;
    PoolConfig conf;

    mutable std::shared_mutex pools_mutex;
    std::map<std::string,std::shared_ptr<NasPool>> pools;

    boost::asio::io_context io;
    boost::asio::steady_timer cleanup_timer;
    std::thread cleanup_thread;
    std::mutex state_mutex;
    bool started { false };
    std::atomic<bool> stopped { false };
};

#endif
