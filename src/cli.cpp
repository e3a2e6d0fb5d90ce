#include <memory>

#include "cli.hpp"
#include "runtime.hpp"
#include "connection_pool.hpp"
#include "nas_client.hpp"
#include "coa_client.hpp"
#include "errors.hpp"
#include "string_helpers.hpp"

static GET_POOL_STATS_RESP dump_stats( const PoolStats &stats ) {
    GET_POOL_STATS_RESP resp;
    resp.total_pools = stats.total_pools;
    resp.total_connections = stats.total_connections;
    resp.active_connections = stats.active_connections;
    for( auto const &[ address, s ]: stats.per_pool ) {
        resp.pools.push_back( { address, s.total, s.active } );
    }
    return resp;
}

static std::shared_ptr<ControlChannel> control_channel( const NasDevice &dev ) {
    if( !dev.coa ) {
        throw NotFoundError( "no CoA configured for device " + dev.name );
    }
    return dev.coa;
}

static std::string process( NASCPRuntime &rt, const CLI_MSG &in_msg ) {
    switch( in_msg.cmd ) {
    case CLI_CMD::GET_VERSION: {
        GET_VERSION_RESP resp { NASCPD_VERSION };
        return serialize( resp );
    }
    case CLI_CMD::GET_POOL_STATS:
        return serialize( dump_stats( rt.pool->stats() ) );
    case CLI_CMD::CLEANUP_POOL:
        rt.pool->cleanup();
        return serialize( dump_stats( rt.pool->stats() ) );
    case CLI_CMD::GET_DEVICES: {
        GET_DEVICES_RESP resp;
        for( auto const &dev: rt.getDevices() ) {
            std::string coa;
            if( dev->conf.coa.has_value() ) {
                std::ostringstream ss;
                ss << dev->conf.coa->method << " port " << dev->conf.coa->port;
                coa = ss.str();
            }
            resp.devices.push_back( { dev->name, dev->conf.address, dev->conf.username, coa } );
        }
        return serialize( resp );
    }
    case CLI_CMD::GET_SESSIONS: {
        auto req = deserialize<DEVICE_REQ>( in_msg.data );
        GET_SESSIONS_RESP resp;
        resp.device = req.device;
        for( auto const &s: rt.getDevice( req.device )->client->getActiveSessions() ) {
            resp.sessions.push_back( { s.id, s.name, s.service, s.caller_id, s.address, s.uptime, s.session_id } );
        }
        return serialize( resp );
    }
    case CLI_CMD::GET_IDENTITY: {
        auto req = deserialize<DEVICE_REQ>( in_msg.data );
        GET_IDENTITY_RESP resp { req.device, rt.getDevice( req.device )->client->getIdentity() };
        return serialize( resp );
    }
    case CLI_CMD::GET_RESOURCES: {
        auto req = deserialize<DEVICE_REQ>( in_msg.data );
        auto res = rt.getDevice( req.device )->client->getSystemResource();
        GET_RESOURCES_RESP resp;
        resp.device = req.device;
        resp.version = res.version;
        resp.uptime = res.uptime;
        resp.board_name = res.board_name;
        resp.architecture = res.architecture;
        resp.cpu_load = res.cpu_load;
        resp.free_memory = res.free_memory;
        resp.total_memory = res.total_memory;
        resp.free_hdd = res.free_hdd;
        resp.total_hdd = res.total_hdd;
        return serialize( resp );
    }
    case CLI_CMD::DISCONNECT: {
        auto req = deserialize<DISCONNECT_REQ>( in_msg.data );
        auto dev = rt.getDevice( req.device );
        if( req.via_radius ) {
            control_channel( *dev )->sendDisconnect( req.username, req.session_id );
        } else {
            dev->client->disconnectUser( req.username );
        }
        return {};
    }
    case CLI_CMD::SET_RATE_LIMIT: {
        auto req = deserialize<SET_RATE_LIMIT_REQ>( in_msg.data );
        auto dev = rt.getDevice( req.device );
        if( req.via_radius ) {
            auto session_id = req.session_id;
            if( session_id.empty() ) {
                session_id = dev->client->getActiveSession( req.username ).session_id;
            }
            control_channel( *dev )->sendRateLimitChange( req.username, session_id, formatRateLimit( req.download_kbps, req.upload_kbps ) );
        } else {
            dev->client->updateUserRateLimit( req.username, req.download_kbps, req.upload_kbps );
        }
        return {};
    }
    }
    throw std::runtime_error( "Can't process this command" );
}

CLI_MSG processCLIRequest( NASCPRuntime &rt, const CLI_MSG &in_msg ) {
    CLI_MSG out_msg;
    out_msg.type = CLI_CMD_TYPE::RESPONSE;
    out_msg.cmd = in_msg.cmd;

    try {
        out_msg.data = process( rt, in_msg );
    } catch( const std::exception &e ) {
        rt.logger->logError() << LOGS::CLI << "Command " << in_msg.cmd << " failed: " << e.what() << std::endl;
        out_msg.error = e.what();
    }
    return out_msg;
}

CLIServer::CLIServer( boost::asio::io_context &io_context, const std::string &path, NASCPRuntime &rt ):
    acceptor_( io_context, stream_protocol::endpoint( path ) ),
    runtime( rt )
{
    do_accept();
}

void CLIServer::do_accept() {
    acceptor_.async_accept(
        [ this ]( boost::system::error_code ec, stream_protocol::socket socket ) {
            if( !ec ) {
                runtime.logger->logInfo() << LOGS::CLI << "CLI new connection" << std::endl;
                std::make_shared<CLISession>( std::move( socket ), runtime )->start();
            }
        do_accept();
    });
}

void CLISession::start() {
    do_read();
}

void CLISession::do_read() {
    auto self( shared_from_this() );
    boost::asio::async_read_until(
        socket_,
        request,
        "\r\n\r\n",
        [ this, self ]( const boost::system::error_code &ec, std::size_t length ) {
            if( !ec ) {
                boost::asio::streambuf::const_buffers_type bufs = request.data();
                std::string cmd { boost::asio::buffers_begin( bufs ), boost::asio::buffers_begin( bufs ) + ( length - 4 ) };
                request.consume( length );
                run_cmd( cmd );
            }
        }
    );
}

void CLISession::do_write( std::shared_ptr<std::string> &out ) {
    auto self( shared_from_this() );
    boost::asio::async_write(
        socket_,
        boost::asio::buffer( out->data(), out->size() ),
        [ this, self, out ]( boost::system::error_code ec, std::size_t ) {
            if( !ec ) {
                do_read();
            }
        }
    );
}

void CLISession::run_cmd( const std::string &cmd ) {
    CLI_MSG in_msg;
    try {
        in_msg = deserialize<CLI_MSG>( cmd );
    } catch( const std::exception &e ) {
        runtime.logger->logError() << LOGS::CLI << "Malformed CLI request: " << e.what() << std::endl;
        return;
    }

    auto self( shared_from_this() );
    boost::asio::post( runtime.workers, [ this, self, in_msg ]() {
        auto out_string { serialize( processCLIRequest( runtime, in_msg ) ) };
        out_string += "\r\n\r\n";
        auto output = std::make_shared<std::string>( std::move( out_string ) );
        boost::asio::post( socket_.get_executor(), [ this, self, output ]() mutable {
            do_write( output );
        });
    });
}
