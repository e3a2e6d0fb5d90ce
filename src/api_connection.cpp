#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

#include "api_connection.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

using tcp = boost::asio::ip::tcp;

ApiConnection::ApiConnection( Logger &l, std::string addr, const PoolConfig &c ):
    logger( l ),
    address( std::move( addr ) ),
    conf( c ),
    socket( io ),
    created_at( std::chrono::steady_clock::now() ),
    last_used_at( created_at )
{}

ApiConnection::~ApiConnection() {
    close();
}

std::shared_ptr<ApiConnection> ApiConnection::open( Logger &l, const std::string &addr, const std::string &user, const std::string &pass, const PoolConfig &c ) {
    auto pc = std::make_shared<ApiConnection>( l, addr, c );

    std::lock_guard lg { pc->io_mutex };
    pc->connect();
    try {
        apiLogin( *pc, user, pass, c.login_timeout );
    } catch( const NasError &e ) {
        l.logError() << LOGS::API << "Login to " << addr << " as " << user << " failed: " << e.what() << std::endl;
        pc->closeSocket();
        throw;
    }
    l.logDebug() << LOGS::API << "Logged in to " << addr << " as " << user << std::endl;
    return pc;
}

bool ApiConnection::runUntil( deadline_t deadline ) {
    io.restart();
    io.run_until( deadline );
    return io.stopped();
}

void ApiConnection::connect() {
    auto [ host, port ] = splitHostPort( address, API_DEFAULT_PORT );
    auto deadline = std::chrono::steady_clock::now() + conf.connect_timeout;

    boost::system::error_code ec = boost::asio::error::would_block;
    tcp::resolver resolver { io };
    tcp::resolver::results_type endpoints;
    resolver.async_resolve( host, std::to_string( port ), [ &ec, &endpoints ]( const boost::system::error_code &e, tcp::resolver::results_type r ) {
        ec = e;
        endpoints = std::move( r );
    });
    if( !runUntil( deadline ) ) {
        resolver.cancel();
        io.run();
        throw ApiConnectError( "timeout resolving " + address );
    }
    if( ec ) {
        throw ApiConnectError( "failed to resolve " + address + ": " + ec.message() );
    }

    ec = boost::asio::error::would_block;
    boost::asio::async_connect( socket, endpoints, [ &ec ]( const boost::system::error_code &e, const tcp::endpoint& ) {
        ec = e;
    });
    if( !runUntil( deadline ) ) {
        closeSocket();
        io.run();
        throw ApiConnectError( "timeout connecting to " + address );
    }
    if( ec ) {
        closeSocket();
        throw ApiConnectError( "failed to connect to " + address + ": " + ec.message() );
    }
    socket.set_option( tcp::no_delay( true ), ec );
}

void ApiConnection::writeAll( const std::vector<uint8_t> &data, deadline_t deadline ) {
    boost::system::error_code ec = boost::asio::error::would_block;
    boost::asio::async_write( socket, boost::asio::buffer( data ), [ &ec ]( const boost::system::error_code &e, size_t ) {
        ec = e;
    });
    if( !runUntil( deadline ) ) {
        closeSocket();
        io.run();
        throw ApiProtocolError( "timeout writing to " + address );
    }
    if( ec ) {
        closeSocket();
        throw ApiProtocolError( "write to " + address + " failed: " + ec.message() );
    }
}

void ApiConnection::readSome( deadline_t deadline ) {
    boost::system::error_code ec = boost::asio::error::would_block;
    size_t len = 0;
    socket.async_read_some( boost::asio::buffer( rbuf ), [ &ec, &len ]( const boost::system::error_code &e, size_t l ) {
        ec = e;
        len = l;
    });
    if( !runUntil( deadline ) ) {
        closeSocket();
        io.run();
        throw ApiProtocolError( "timeout reading from " + address );
    }
    if( ec ) {
        closeSocket();
        if( ec == boost::asio::error::eof ) {
            throw ApiProtocolError( "connection to " + address + " closed by peer" );
        }
        throw ApiProtocolError( "read from " + address + " failed: " + ec.message() );
    }
    decoder.feed( rbuf.data(), len );
}

ApiReply ApiConnection::roundTrip( const api_sentence_t &sentence, deadline_t deadline ) {
    writeAll( encodeSentence( sentence ), deadline );

    std::vector<std::string> words;
    while( true ) {
        try {
            while( auto s = decoder.next() ) {
                bool last = isFinalSentence( *s );
                words.insert( words.end(), s->begin(), s->end() );
                if( last ) {
                    return parseReply( words );
                }
            }
        } catch( const ApiProtocolError & ) {
            closeSocket();
            throw;
        }
        readSome( deadline );
    }
}

ApiReply ApiConnection::query( const std::string &command, const std::vector<std::string> &args ) {
    std::lock_guard lg { io_mutex };
    if( isClosed() ) {
        throw ApiProtocolError( "connection to " + address + " is closed" );
    }

    api_sentence_t sentence;
    sentence.reserve( args.size() + 1 );
    sentence.push_back( command );
    sentence.insert( sentence.end(), args.begin(), args.end() );

    logger.logTrace() << LOGS::API << address << " <- " << command << std::endl;
    auto reply = roundTrip( sentence, std::chrono::steady_clock::now() + conf.command_timeout );
    if( reply.fatal ) {
        closeSocket();
        throw ApiProtocolError( "router closed the session: " + reply.message );
    }
    if( reply.trap ) {
        throw ApiTrapError( reply.message );
    }
    return reply;
}

std::vector<api_record_t> ApiConnection::execute( const std::string &command, const std::vector<std::string> &args ) {
    return query( command, args ).records;
}

bool ApiConnection::isAlive() {
    std::lock_guard lg { io_mutex };
    if( isClosed() ) {
        return false;
    }
    // unsolicited bytes mean the framing is out of step
    if( !decoder.empty() ) {
        return false;
    }

    std::array<uint8_t,1> probe;
    boost::system::error_code ec = boost::asio::error::would_block;
    size_t len = 0;
    socket.async_receive( boost::asio::buffer( probe ), tcp::socket::message_peek, [ &ec, &len ]( const boost::system::error_code &e, size_t l ) {
        ec = e;
        len = l;
    });
    if( !runUntil( std::chrono::steady_clock::now() + conf.probe_timeout ) ) {
        boost::system::error_code ignored;
        socket.cancel( ignored );
        io.run();
    }
    if( ec == boost::asio::error::operation_aborted ) {
        return true;
    }
    return false;
}

void ApiConnection::closeSocket() {
    std::lock_guard lg { mutex };
    closed = true;
    boost::system::error_code ec;
    socket.close( ec );
}

void ApiConnection::close() {
    std::lock_guard lg { io_mutex };
    closeSocket();
}

bool ApiConnection::markInUse() {
    std::lock_guard lg { mutex };
    if( in_use || closed ) {
        return false;
    }
    in_use = true;
    last_used_at = std::chrono::steady_clock::now();
    return true;
}

void ApiConnection::release() {
    std::lock_guard lg { mutex };
    in_use = false;
    last_used_at = std::chrono::steady_clock::now();
}

bool ApiConnection::inUse() const {
    std::lock_guard lg { mutex };
    return in_use;
}

bool ApiConnection::isClosed() const {
    std::lock_guard lg { mutex };
    return closed;
}

std::chrono::steady_clock::time_point ApiConnection::createdAt() const {
    return created_at;
}

std::chrono::steady_clock::time_point ApiConnection::lastUsedAt() const {
    std::lock_guard lg { mutex };
    return last_used_at;
}
