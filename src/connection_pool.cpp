#include <algorithm>
#include <functional>

#include "connection_pool.hpp"
#include "errors.hpp"
#include "log.hpp"

ConnectionPool::ConnectionPool( Logger &l, PoolConfig c ):
    logger( l ),
    conf( std::move( c ) ),
    cleanup_timer( io )
{}

ConnectionPool::~ConnectionPool() {
    stop();
}

void ConnectionPool::start() {
    std::lock_guard lg { state_mutex };
    if( started || stopped ) {
        return;
    }
    started = true;
    schedule_cleanup();
    cleanup_thread = std::thread( [ this ]() {
        io.run();
    });
    logger.logInfo() << LOGS::POOL << "Connection pool started, max " << conf.max_connections << " connections per device" << std::endl;
}

void ConnectionPool::stop() {
    {
        std::lock_guard lg { state_mutex };
        if( stopped ) {
            return;
        }
        stopped = true;
    }

    io.stop();
    if( cleanup_thread.joinable() ) {
        cleanup_thread.join();
    }

    std::map<std::string,std::shared_ptr<NasPool>> victims;
    {
        std::unique_lock lg { pools_mutex };
        victims.swap( pools );
    }

    for( auto &[ address, np ]: victims ) {
        std::vector<api_connection_ptr> conns;
        {
            std::lock_guard lg { np->mutex };
            conns.swap( np->connections );
        }
        np->cv.notify_all();
        // waits for commands in flight
        for( auto &pc: conns ) {
            pc->close();
        }
    }
    logger.logInfo() << LOGS::POOL << "Connection pool stopped" << std::endl;
}

void ConnectionPool::schedule_cleanup() {
    cleanup_timer.expires_after( conf.cleanup_interval );
    cleanup_timer.async_wait( std::bind( &ConnectionPool::on_cleanup_timer, this, std::placeholders::_1 ) );
}

void ConnectionPool::on_cleanup_timer( const boost::system::error_code &ec ) {
    if( ec ) {
        if( ec != boost::asio::error::operation_aborted ) {
            logger.logError() << LOGS::POOL << "Error on cleanup timer: " << ec.message() << std::endl;
        }
        return;
    }
    cleanup();
    schedule_cleanup();
}

std::shared_ptr<NasPool> ConnectionPool::findPool( const std::string &address ) const {
    std::shared_lock lg { pools_mutex };
    if( auto const &it = pools.find( address ); it != pools.end() ) {
        return it->second;
    }
    return nullptr;
}

std::shared_ptr<NasPool> ConnectionPool::getPool( const std::string &address, const std::string &username, const std::string &password ) {
    if( auto np = findPool( address ); np ) {
        return np;
    }

    std::unique_lock lg { pools_mutex };
    if( auto const &it = pools.find( address ); it != pools.end() ) {
        return it->second;
    }
    auto np = std::make_shared<NasPool>( address, username, password );
    pools.emplace( address, np );
    logger.logDebug() << LOGS::POOL << "Created pool for " << address << std::endl;
    return np;
}

api_connection_ptr ConnectionPool::get( const std::string &address, const std::string &username, const std::string &password ) {
    if( stopped ) {
        throw NasError( "connection pool is stopped" );
    }

    auto np = getPool( address, username, password );
    auto deadline = std::chrono::steady_clock::now() + 2 * conf.connect_timeout;

    std::unique_lock lg { np->mutex };
    while( true ) {
        if( stopped ) {
            throw NasError( "connection pool is stopped" );
        }

        for( auto &pc: np->connections ) {
            if( pc->inUse() || pc->isClosed() ) {
                continue;
            }
            // stays in the list until the next cleanup pass
            if( !pc->isAlive() ) {
                logger.logDebug() << LOGS::POOL << "Dropping dead connection to " << address << std::endl;
                pc->close();
                continue;
            }
            if( pc->markInUse() ) {
                return pc;
            }
        }

        if( np->connections.size() + np->pending < conf.max_connections ) {
            np->pending++;
            np->username = username;
            np->password = password;
            lg.unlock();

            api_connection_ptr pc;
            try {
                pc = ApiConnection::open( logger, address, username, password, conf );
            } catch( ... ) {
                lg.lock();
                np->pending--;
                lg.unlock();
                np->cv.notify_one();
                throw;
            }
            pc->markInUse();

            lg.lock();
            np->pending--;
            if( stopped ) {
                lg.unlock();
                pc->close();
                throw NasError( "connection pool is stopped" );
            }
            np->connections.push_back( pc );
            logger.logDebug() << LOGS::POOL << "Opened connection to " << address << ", " << np->connections.size() << " in pool" << std::endl;
            return pc;
        }

        if( np->cv.wait_until( lg, deadline ) == std::cv_status::timeout ) {
            throw PoolTimeoutError( "timeout waiting for connection to " + address );
        }
    }
}

void ConnectionPool::put( const api_connection_ptr &pc ) {
    pc->release();

    auto np = findPool( pc->getAddress() );
    if( !np ) {
        pc->close();
        return;
    }
    {
        std::lock_guard lg { np->mutex };
    }
    np->cv.notify_all();
}

void ConnectionPool::remove( const api_connection_ptr &pc ) {
    pc->close();

    auto np = findPool( pc->getAddress() );
    if( !np ) {
        return;
    }
    {
        std::lock_guard lg { np->mutex };
        auto &conns = np->connections;
        conns.erase( std::remove( conns.begin(), conns.end(), pc ), conns.end() );
    }
    np->cv.notify_all();
}

void ConnectionPool::cleanup() {
    std::vector<std::shared_ptr<NasPool>> snapshot;
    {
        std::shared_lock lg { pools_mutex };
        for( auto const &[ address, np ]: pools ) {
            snapshot.push_back( np );
        }
    }

    auto now = std::chrono::steady_clock::now();
    for( auto &np: snapshot ) {
        std::vector<api_connection_ptr> victims;
        {
            std::lock_guard lg { np->mutex };
            auto &conns = np->connections;
            auto it = std::stable_partition( conns.begin(), conns.end(), [ & ]( const api_connection_ptr &pc ) {
                if( pc->inUse() ) {
                    return true;
                }
                return !( pc->isClosed() ||
                    now - pc->lastUsedAt() > conf.idle_timeout ||
                    now - pc->createdAt() > conf.max_age );
            });
            victims.assign( it, conns.end() );
            conns.erase( it, conns.end() );
        }
        if( victims.empty() ) {
            continue;
        }
        np->cv.notify_all();
        for( auto &pc: victims ) {
            pc->close();
        }
        logger.logDebug() << LOGS::POOL << "Cleanup removed " << victims.size() << " connections to " << np->address << std::endl;
    }
}

PoolStats ConnectionPool::stats() const {
    PoolStats ret;

    std::shared_lock lg { pools_mutex };
    ret.total_pools = pools.size();
    for( auto const &[ address, np ]: pools ) {
        PoolDeviceStats dev;
        std::lock_guard nlg { np->mutex };
        for( auto const &pc: np->connections ) {
            dev.total++;
            if( pc->inUse() ) {
                dev.active++;
            }
        }
        ret.total_connections += dev.total;
        ret.active_connections += dev.active;
        ret.per_pool.emplace( address, dev );
    }
    return ret;
}
