#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/process.hpp>

#include "coa_client.hpp"
#include "request_response.hpp"
#include "radius_avp.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "string_helpers.hpp"

namespace bp = boost::process;
using udp = boost::asio::ip::udp;

std::string normalizeSessionId( const std::string &session_id ) {
    std::string ret = session_id;
    if( ret.size() >= 2 && ret[ 0 ] == '0' && ( ret[ 1 ] == 'x' || ret[ 1 ] == 'X' ) ) {
        ret.erase( 0, 2 );
    }
    std::transform( ret.begin(), ret.end(), ret.begin(), []( unsigned char c ) { return std::tolower( c ); } );
    return ret;
}

static std::string endpoint_string( const std::string &host, uint16_t port ) {
    if( host.find( ':' ) != std::string::npos ) {
        return "[" + host + "]:" + std::to_string( port );
    }
    return host + ":" + std::to_string( port );
}

void checkCoAAnswer( RADIUS_CODE request, RADIUS_CODE answer, const CoAResponse &res ) {
    bool coa = request == RADIUS_CODE::COA_REQUEST;
    auto ack = coa ? RADIUS_CODE::COA_ACK : RADIUS_CODE::DISCONNECT_ACK;
    auto nak = coa ? RADIUS_CODE::COA_NAK : RADIUS_CODE::DISCONNECT_NAK;
    std::string prefix = coa ? "CoA NAK" : "Disconnect NAK";

    if( answer == ack ) {
        return;
    }
    if( answer != nak ) {
        throw CoAError( "unexpected response code " + std::to_string( static_cast<int>( answer ) ) );
    }

    if( !res.error_cause.has_value() ) {
        throw CoANakError( prefix + " received - NAS rejected the request" );
    }
    switch( static_cast<ERROR_CAUSE>( *res.error_cause ) ) {
    case ERROR_CAUSE::SESSION_CONTEXT_NOT_FOUND:
        throw CoANakError( prefix + ": session not found on NAS" );
    case ERROR_CAUSE::UNSUPPORTED_EXTENSION:
        throw CoANakError( prefix + ": unsupported extension" );
    default:
        throw CoANakError( prefix + " received, Error-Cause " + std::to_string( *res.error_cause ) );
    }
}

void classifyRadclientOutput( RADIUS_CODE request, const std::string &output, int exit_code ) {
    bool coa = request == RADIUS_CODE::COA_REQUEST;
    std::string ack = coa ? "CoA-ACK" : "Disconnect-ACK";
    std::string nak = coa ? "CoA-NAK" : "Disconnect-NAK";
    std::string prefix = coa ? "CoA NAK" : "Disconnect NAK";

    if( output.find( ack ) != std::string::npos ) {
        return;
    }
    if( output.find( nak ) != std::string::npos ) {
        if( output.find( "Session-Context-Not-Found" ) != std::string::npos ) {
            throw CoANakError( prefix + ": session not found on NAS" );
        }
        if( output.find( "Unsupported-Extension" ) != std::string::npos ) {
            throw CoANakError( prefix + ": unsupported extension (check session ID)" );
        }
        throw CoANakError( prefix + " received: " + output );
    }
    if( exit_code != 0 ) {
        throw CoAError( "radclient failed: exit code " + std::to_string( exit_code ) + " - " + output );
    }
    throw CoAError( "unexpected radclient output: " + output );
}

RadiusCoAClient::RadiusCoAClient( Logger &l, std::string h, CoAConf c ):
    logger( l ),
    host( std::move( h ) ),
    conf( std::move( c ) )
{}

template<typename T>
static std::vector<uint8_t> encode_request( const T &req ) {
    try {
        return serializeAttributes( req );
    } catch( const std::invalid_argument &e ) {
        throw CoAError( std::string( "cannot encode request: " ) + e.what() );
    }
}

std::pair<RADIUS_CODE,CoAResponse> RadiusCoAClient::exchange( RADIUS_CODE code, const std::vector<uint8_t> &attrs ) {
    boost::asio::io_context io;
    boost::system::error_code ec;

    udp::resolver resolver { io };
    auto endpoints = resolver.resolve( host, std::to_string( conf.port ), ec );
    if( ec || endpoints.empty() ) {
        throw CoAError( "failed to resolve NAS " + host + ": " + ec.message() );
    }
    udp::endpoint endpoint = *endpoints.begin();

    udp::socket socket { io };
    socket.open( endpoint.protocol(), ec );
    if( ec ) {
        throw CoAError( "failed to open socket: " + ec.message() );
    }

    auto id = random_uint8_t();
    auto auth = requestAuthenticator( code, id, attrs, conf.secret );
    auto pkt = buildRadiusPacket( code, id, auth, attrs );

    logger.logDebug() << LOGS::COA << "Sending " << reinterpret_cast<const RadiusPacket*>( pkt.data() ) << " to " << endpoint << std::endl;
    socket.send_to( boost::asio::buffer( pkt ), endpoint, 0, ec );
    if( ec ) {
        throw CoAError( "failed to send request to " + endpoint_string( host, conf.port ) + ": " + ec.message() );
    }

    std::array<uint8_t,4096> buf;
    udp::endpoint sender;
    size_t size = 0;
    auto deadline = std::chrono::steady_clock::now() + conf.timeout;
    while( true ) {
        std::optional<boost::system::error_code> result;
        socket.async_receive_from( boost::asio::buffer( buf ), sender, [ &result, &size ]( boost::system::error_code e, size_t s ) {
            result = e;
            size = s;
        });
        io.restart();
        io.run_until( deadline );
        if( !result.has_value() ) {
            socket.close( ec );
            io.restart();
            io.run();
            throw CoAError( "timeout waiting for answer from " + endpoint_string( host, conf.port ) );
        }
        if( *result ) {
            throw CoAError( "failed to read answer: " + result->message() );
        }

        // Stray datagrams are dropped, the wait goes on until the deadline
        if( sender != endpoint ) {
            logger.logDebug() << LOGS::COA << "Dropping datagram from unknown sender " << sender << std::endl;
            continue;
        }
        if( size < sizeof( RadiusPacket ) ) {
            logger.logDebug() << LOGS::COA << "Dropping short datagram of " << size << " bytes" << std::endl;
            continue;
        }
        if( auto rid = reinterpret_cast<const RadiusPacket*>( buf.data() )->id; rid != id ) {
            logger.logDebug() << LOGS::COA << "Dropping answer with id " << static_cast<int>( rid ) << ", waiting for " << static_cast<int>( id ) << std::endl;
            continue;
        }
        break;
    }

    auto pkt_hdr = reinterpret_cast<const RadiusPacket*>( buf.data() );
    logger.logDebug() << LOGS::COA << "Received " << pkt_hdr << " from " << sender << std::endl;

    size_t len = pkt_hdr->length.native();
    if( len < sizeof( RadiusPacket ) || len > size ) {
        throw CoAError( "answer length " + std::to_string( len ) + " does not match datagram" );
    }
    std::vector<uint8_t> avp_buf { buf.begin() + sizeof( RadiusPacket ), buf.begin() + len };
    auto expected = responseAuthenticator( pkt_hdr->code, pkt_hdr->id, auth, avp_buf, conf.secret );
    if( !std::equal( expected.begin(), expected.end(), pkt_hdr->authenticator.begin() ) ) {
        throw CoAError( "answer is not correct, check the RADIUS secret" );
    }

    try {
        return { pkt_hdr->code, deserializeAttributes<CoAResponse>( avp_buf ) };
    } catch( const std::runtime_error &e ) {
        throw CoAError( std::string( "malformed answer attributes: " ) + e.what() );
    }
}

void RadiusCoAClient::sendRateLimitChange( const std::string &username, const std::string &session_id, const std::string &rate_limit ) {
    CoARequest req { username, normalizeSessionId( session_id ), rate_limit };

    logger.logInfo() << LOGS::COA << "Sending rate-limit change to " << endpoint_string( host, conf.port )
        << " for user=" << req.username << ", session=" << req.session_id << ", rate=" << req.rate_limit << std::endl;

    auto const &[ code, res ] = exchange( RADIUS_CODE::COA_REQUEST, encode_request( req ) );
    checkCoAAnswer( RADIUS_CODE::COA_REQUEST, code, res );

    logger.logInfo() << LOGS::COA << "Rate limit updated for " << username << " to " << rate_limit << std::endl;
}

void RadiusCoAClient::sendDisconnect( const std::string &username, const std::string &session_id ) {
    DisconnectRequest req { username, normalizeSessionId( session_id ) };

    logger.logInfo() << LOGS::COA << "Sending Disconnect-Request to " << endpoint_string( host, conf.port )
        << " for user=" << req.username << ", session=" << req.session_id << std::endl;

    auto const &[ code, res ] = exchange( RADIUS_CODE::DISCONNECT_REQUEST, encode_request( req ) );
    checkCoAAnswer( RADIUS_CODE::DISCONNECT_REQUEST, code, res );

    logger.logInfo() << LOGS::COA << "User " << username << " disconnected" << std::endl;
}

static std::string quote( const std::string &v ) {
    std::string ret = "\"";
    for( auto c: v ) {
        if( std::iscntrl( static_cast<unsigned char>( c ) ) ) {
            throw CoAError( "control character in radclient attribute value" );
        }
        if( c == '"' || c == '\\' ) {
            ret.push_back( '\\' );
        }
        ret.push_back( c );
    }
    ret.push_back( '"' );
    return ret;
}

RadclientCoAClient::RadclientCoAClient( Logger &l, std::string h, CoAConf c, std::string b ):
    logger( l ),
    host( std::move( h ) ),
    conf( std::move( c ) ),
    binary( std::move( b ) )
{}

std::pair<std::string,int> RadclientCoAClient::run( const std::string &command, const std::string &input ) {
    auto timeout = std::max<int64_t>( 1, std::chrono::duration_cast<std::chrono::seconds>( conf.timeout ).count() );

    boost::filesystem::path exe = binary;
    if( binary.find( '/' ) == std::string::npos ) {
        exe = bp::search_path( binary );
    }
    if( exe.empty() ) {
        throw CoAError( "radclient failed: " + binary + " not found in PATH" );
    }

    try {
        bp::ipstream out;
        bp::opstream in;
        bp::child c( exe, "-x", "-r", "1", "-t", std::to_string( timeout ),
            endpoint_string( host, conf.port ), command, conf.secret,
            bp::std_in < in, ( bp::std_out & bp::std_err ) > out );

        in << input;
        in.flush();
        in.pipe().close();

        std::string output;
        std::string line;
        while( std::getline( out, line ) ) {
            output += line;
            output.push_back( '\n' );
        }
        c.wait();
        return { output, c.exit_code() };
    } catch( const bp::process_error &e ) {
        throw CoAError( std::string( "radclient failed: " ) + e.what() );
    }
}

void RadclientCoAClient::sendRateLimitChange( const std::string &username, const std::string &session_id, const std::string &rate_limit ) {
    auto clean_id = normalizeSessionId( session_id );

    logger.logInfo() << LOGS::COA << "Sending rate-limit change via radclient to " << endpoint_string( host, conf.port )
        << " for user=" << username << ", session=" << clean_id << ", rate=" << rate_limit << std::endl;

    std::string input =
        "User-Name = " + quote( username ) + "\n" +
        "Acct-Session-Id = " + quote( clean_id ) + "\n" +
        "Mikrotik-Rate-Limit = " + quote( rate_limit ) + "\n";

    auto const &[ output, code ] = run( "coa", input );
    logger.logDebug() << LOGS::COA << "radclient output: " << output << std::endl;
    classifyRadclientOutput( RADIUS_CODE::COA_REQUEST, output, code );

    logger.logInfo() << LOGS::COA << "Rate limit updated for " << username << " to " << rate_limit << std::endl;
}

void RadclientCoAClient::sendDisconnect( const std::string &username, const std::string &session_id ) {
    auto clean_id = normalizeSessionId( session_id );

    logger.logInfo() << LOGS::COA << "Sending disconnect via radclient to " << endpoint_string( host, conf.port )
        << " for user=" << username << ", session=" << clean_id << std::endl;

    std::string input =
        "User-Name = " + quote( username ) + "\n" +
        "Acct-Session-Id = " + quote( clean_id ) + "\n";

    auto const &[ output, code ] = run( "disconnect", input );
    logger.logDebug() << LOGS::COA << "radclient output: " << output << std::endl;
    classifyRadclientOutput( RADIUS_CODE::DISCONNECT_REQUEST, output, code );

    logger.logInfo() << LOGS::COA << "User " << username << " disconnected" << std::endl;
}

std::unique_ptr<ControlChannel> makeControlChannel( Logger &l, const std::string &host, const CoAConf &conf ) {
    switch( conf.method ) {
    case COA_METHOD::RADCLIENT:
        return std::make_unique<RadclientCoAClient>( l, host, conf );
    case COA_METHOD::NATIVE:
    default:
        return std::make_unique<RadiusCoAClient>( l, host, conf );
    }
}
