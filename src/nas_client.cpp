#include <stdexcept>

#include "nas_client.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

std::string formatRateLimit( int64_t download_kbps, int64_t upload_kbps ) {
    return std::to_string( upload_kbps ) + "k/" + std::to_string( download_kbps ) + "k";
}

static std::string field( const api_record_t &r, const std::string &key ) {
    if( auto const &it = r.find( key ); it != r.end() ) {
        return it->second;
    }
    return {};
}

NasClient::NasClient( Logger &l, ConnectionPool &p, DeviceTarget t ):
    logger( l ),
    pool( p ),
    target( std::move( t ) )
{}

ApiReply NasClient::query( const std::string &command, const std::vector<std::string> &args ) {
    auto pc = pool.get( target.address, target.username, target.password );

    ApiReply reply;
    try {
        reply = pc->query( command, args );
    } catch( const NasError &e ) {
        logger.logDebug() << LOGS::CLIENT << command << " on " << target.address << " failed: " << e.what() << std::endl;
        pool.remove( pc );
        throw;
    }
    pool.put( pc );
    return reply;
}

std::vector<api_record_t> NasClient::execute( const std::string &command, const std::vector<std::string> &args ) {
    return query( command, args ).records;
}

std::vector<ActiveSession> NasClient::getActiveSessions() {
    std::vector<ActiveSession> sessions;

    for( auto const &r: execute( "/ppp/active/print" ) ) {
        ActiveSession s;
        s.id = field( r, ".id" );
        s.name = field( r, "name" );
        s.service = field( r, "service" );
        s.caller_id = field( r, "caller-id" );
        s.address = field( r, "address" );
        s.uptime = field( r, "uptime" );
        s.encoding = field( r, "encoding" );
        s.session_id = field( r, "session-id" );
        s.limit_bytes_in = parseInt64( field( r, "limit-bytes-in" ) );
        s.limit_bytes_out = parseInt64( field( r, "limit-bytes-out" ) );
        sessions.push_back( std::move( s ) );
    }
    return sessions;
}

ActiveSession NasClient::getActiveSession( const std::string &username ) {
    for( auto &s: getActiveSessions() ) {
        if( s.name == username ) {
            return s;
        }
    }
    throw NotFoundError( "session not found for " + username );
}

void NasClient::disconnectUser( const std::string &username ) {
    for( auto const &s: getActiveSessions() ) {
        if( s.name == username ) {
            execute( "/ppp/active/remove", { "=.id=" + s.id } );
            logger.logInfo() << LOGS::CLIENT << "Disconnected " << username << " from " << target.address << std::endl;
            return;
        }
    }
    throw NotFoundError( "user " + username + " not found in active sessions" );
}

void NasClient::updateUserRateLimit( const std::string &username, int64_t download_kbps, int64_t upload_kbps ) {
    updateUserRateLimitWithIp( username, {}, download_kbps, upload_kbps );
}

void NasClient::updateUserRateLimitWithIp( const std::string &username, const std::string &ip, int64_t download_kbps, int64_t upload_kbps ) {
    auto rate_limit = formatRateLimit( download_kbps, upload_kbps );

    for( auto const &s: getActiveSessions() ) {
        if( s.name != username ) {
            continue;
        }
        try {
            execute( "/ppp/active/set", { "=.id=" + s.id, "=rate-limit=" + rate_limit } );
            logger.logInfo() << LOGS::CLIENT << "Rate limit of " << username << " set to " << rate_limit << std::endl;
            return;
        } catch( const NasError &e ) {
            logger.logInfo() << LOGS::CLIENT << "Session rate limit for " << username << " failed (" << e.what() << "), trying queue" << std::endl;
        }
        updateQueueRateLimit( username, s.address.empty() ? ip : s.address, rate_limit );
        return;
    }
    throw NotFoundError( "user " + username + " not found" );
}

bool NasClient::setQueueLimit( const std::string &filter, const std::string &rate_limit ) {
    auto queues = execute( "/queue/simple/print", { filter } );
    if( queues.empty() ) {
        return false;
    }
    execute( "/queue/simple/set", { "=.id=" + field( queues.front(), ".id" ), "=max-limit=" + rate_limit } );
    return true;
}

void NasClient::updateQueueRateLimit( const std::string &username, const std::string &ip, const std::string &rate_limit ) {
    if( setQueueLimit( "?name=" + username, rate_limit ) ) {
        logger.logInfo() << LOGS::CLIENT << "Queue limit of " << username << " set to " << rate_limit << std::endl;
        return;
    }

    if( !ip.empty() ) {
        bool found = false;
        try {
            found = setQueueLimit( "?target=" + ip + "/32", rate_limit );
        } catch( const NasError &e ) {
            logger.logDebug() << LOGS::CLIENT << "Queue lookup by target " << ip << " failed: " << e.what() << std::endl;
        }
        if( found ) {
            logger.logInfo() << LOGS::CLIENT << "Queue limit of " << ip << " set to " << rate_limit << std::endl;
            return;
        }
    }
    throw NotFoundError( "queue not found for " + username );
}

void NasClient::restoreUserSpeed( const std::string &username, int64_t download_mbps, int64_t upload_mbps ) {
    updateUserRateLimit( username, download_mbps * 1000, upload_mbps * 1000 );
}

SystemResource NasClient::getSystemResource() {
    auto results = execute( "/system/resource/print" );
    if( results.empty() ) {
        throw NotFoundError( "no resource data" );
    }

    auto const &r = results.front();
    SystemResource res;
    res.uptime = field( r, "uptime" );
    res.version = field( r, "version" );
    res.build_time = field( r, "build-time" );
    res.factory_software = field( r, "factory-software" );
    res.free_memory = parseInt64( field( r, "free-memory" ) );
    res.total_memory = parseInt64( field( r, "total-memory" ) );
    res.cpu_count = parseInt64( field( r, "cpu-count" ) );
    res.cpu_frequency = parseInt64( field( r, "cpu-frequency" ) );
    res.cpu_load = parseInt64( field( r, "cpu-load" ) );
    res.free_hdd = parseInt64( field( r, "free-hdd-space" ) );
    res.total_hdd = parseInt64( field( r, "total-hdd-space" ) );
    res.architecture = field( r, "architecture-name" );
    res.board_name = field( r, "board-name" );
    res.platform = field( r, "platform" );
    return res;
}

std::string NasClient::getIdentity() {
    auto results = execute( "/system/identity/print" );
    if( results.empty() ) {
        throw NotFoundError( "identity not found" );
    }
    return field( results.front(), "name" );
}

std::map<std::string,uint32_t> NasClient::getAllConnectionCounts() {
    std::map<std::string,uint32_t> counts;

    for( auto const &r: execute( "/ip/firewall/connection/print" ) ) {
        auto src = field( r, "src-address" );
        if( src.empty() ) {
            continue;
        }
        if( auto idx = src.find( ':' ); idx != std::string::npos && idx > 0 ) {
            src.erase( idx );
        }
        counts[ src ]++;
    }
    return counts;
}

int64_t NasClient::getConnectionCount( const std::string &ip ) {
    if( ip.empty() ) {
        throw std::invalid_argument( "IP address is required" );
    }
    auto reply = query( "/ip/firewall/connection/print", { "?src-address=" + ip, "=count-only=" } );
    return parseInt64( field( reply.done, "ret" ) );
}

std::vector<IpPool> NasClient::getIpPools() {
    std::vector<IpPool> ret;

    for( auto const &r: execute( "/ip/pool/print" ) ) {
        IpPool p { field( r, ".id" ), field( r, "name" ), field( r, "ranges" ) };
        if( p.name.empty() ) {
            continue;
        }
        ret.push_back( std::move( p ) );
    }
    return ret;
}
