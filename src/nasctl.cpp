#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <cstring>
#include <charconv>
#include <termios.h>
#include <unistd.h>
#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include <boost/algorithm/string.hpp>

#include "nasctl.hpp"
#include "cli.hpp"
#include "string_helpers.hpp"

inline constexpr char greeting[] { "nasctl# " };
inline constexpr char unix_socket_path[] { "/var/run/nascpd.sock" };
termios orig_tio;
bool tty_changed { false };

static void restore_tty() {
    if( tty_changed ) {
        tcsetattr( STDIN_FILENO, TCSAFLUSH, &orig_tio );
    }
}

static std::vector<std::string> split( const std::string &input ) {
    std::vector<std::string> tokens;
    boost::split( tokens, input, boost::is_any_of( " " ) );

    tokens.erase(
        std::remove_if(
            tokens.begin(),
            tokens.end(),
            []( const std::string &i ) {
                return i.empty();
            }
        ),
        tokens.end()
    );

    return tokens;
}

static bool is_argument( const std::string &token ) {
    return token.size() > 2 && token.front() == '<' && token.back() == '>';
}

static void signal_handler_term( const boost::system::error_code &ec, int signum ) {
    restore_tty();
    exit( 0 );
}

static std::string request( CLI_CMD cmd, std::string data = {} ) {
    CLI_MSG out_msg;
    out_msg.type = CLI_CMD_TYPE::REQUEST;
    out_msg.cmd = cmd;
    out_msg.data = std::move( data );
    return serialize( out_msg );
}

static int64_t kbps( const cmd_args_t &args, const std::string &name ) {
    auto const &val = args.at( name );
    int64_t ret = 0;
    if( auto const &[ ptr, ec ] = std::from_chars( val.data(), val.data() + val.size(), ret ); ec != std::errc() || ptr != val.data() + val.size() || ret < 0 ) {
        throw std::runtime_error( "Wrong value for " + name + ": " + val );
    }
    return ret;
}

std::string get_version( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_VERSION );
}

std::string get_pool_stats( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_POOL_STATS );
}

std::string cleanup_pool( const cmd_args_t &args ) {
    return request( CLI_CMD::CLEANUP_POOL );
}

std::string get_devices( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_DEVICES );
}

std::string get_sessions( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_SESSIONS, serialize( DEVICE_REQ { args.at( "device" ) } ) );
}

std::string get_identity( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_IDENTITY, serialize( DEVICE_REQ { args.at( "device" ) } ) );
}

std::string get_resources( const cmd_args_t &args ) {
    return request( CLI_CMD::GET_RESOURCES, serialize( DEVICE_REQ { args.at( "device" ) } ) );
}

std::string disconnect( const cmd_args_t &args ) {
    DISCONNECT_REQ req;
    req.device = args.at( "device" );
    req.username = args.at( "user" );
    return request( CLI_CMD::DISCONNECT, serialize( req ) );
}

std::string coa_disconnect( const cmd_args_t &args ) {
    DISCONNECT_REQ req;
    req.device = args.at( "device" );
    req.username = args.at( "user" );
    req.session_id = args.at( "session" );
    req.via_radius = true;
    return request( CLI_CMD::DISCONNECT, serialize( req ) );
}

std::string set_rate_limit( const cmd_args_t &args ) {
    SET_RATE_LIMIT_REQ req;
    req.device = args.at( "device" );
    req.username = args.at( "user" );
    req.download_kbps = kbps( args, "down" );
    req.upload_kbps = kbps( args, "up" );
    return request( CLI_CMD::SET_RATE_LIMIT, serialize( req ) );
}

std::string coa_rate_limit( const cmd_args_t &args ) {
    SET_RATE_LIMIT_REQ req;
    req.device = args.at( "device" );
    req.username = args.at( "user" );
    req.session_id = args.at( "session" );
    req.download_kbps = kbps( args, "down" );
    req.upload_kbps = kbps( args, "up" );
    req.via_radius = true;
    return request( CLI_CMD::SET_RATE_LIMIT, serialize( req ) );
}

std::string exit_cb( const cmd_args_t &args ) {
    restore_tty();
    exit( 0 );
    return {};
}

CLICMD::CLICMD():
    start_node( std::make_shared<CLINode>( CLINodeType::BEGIN ) )
{
    add_cmd( "show version", get_version );
    add_cmd( "show pool", get_pool_stats );
    add_cmd( "show devices", get_devices );
    add_cmd( "show sessions <device>", get_sessions );
    add_cmd( "show identity <device>", get_identity );
    add_cmd( "show resources <device>", get_resources );
    add_cmd( "disconnect <device> <user>", disconnect );
    add_cmd( "coa disconnect <device> <user> <session>", coa_disconnect );
    add_cmd( "set rate-limit <device> <user> <down> <up>", set_rate_limit );
    add_cmd( "coa rate-limit <device> <user> <session> <down> <up>", coa_rate_limit );
    add_cmd( "cleanup pool", cleanup_pool );
    add_cmd( "exit", exit_cb );
}

void CLICMD::add_cmd( const std::string &full_command, cmd_callback callback ) {
    auto node = start_node;
    auto tokens = split( full_command );

    while( !tokens.empty() ) {
        auto ntoken = tokens.front();
        tokens.erase( tokens.begin() );

        auto type = CLINodeType::STATIC;
        if( is_argument( ntoken ) ) {
            type = CLINodeType::ARGUMENT;
            ntoken = ntoken.substr( 1, ntoken.size() - 2 );
        }

        if( auto nnode = std::find_if(
            node->next_nodes.begin(),
            node->next_nodes.end(),
            [ ntoken, type ]( const std::shared_ptr<CLINode> v ) -> bool {
                return v->type == type && v->token == ntoken;
            }
        ); nnode != node->next_nodes.end() ) {
            node = *nnode;
            continue;
        } else {
            node->next_nodes.push_back( std::make_shared<CLINode>( type, ntoken ) );
            node = node->next_nodes.back();
        }
    }
    node->next_nodes.push_back( std::make_shared<CLINode>( CLINodeType::END, callback ) );
}

std::string CLICMD::call_cmd( const std::string &cmd ) {
    auto node = start_node;
    auto tokens = split( cmd );

    cmd_args_t arguments;

    while( !tokens.empty() ) {
        auto ntoken = tokens.front();
        tokens.erase( tokens.begin() );

        // static keywords win over arguments
        if( auto nnode = std::find_if(
            node->next_nodes.begin(),
            node->next_nodes.end(),
            [ ntoken ]( const std::shared_ptr<CLINode> v ) -> bool {
                return v->type == CLINodeType::STATIC && v->token == ntoken;
            }
        ); nnode != node->next_nodes.end() ) {
            node = *nnode;
            continue;
        }

        if( auto nnode = std::find_if(
            node->next_nodes.begin(),
            node->next_nodes.end(),
            []( const std::shared_ptr<CLINode> v ) -> bool {
                return v->type == CLINodeType::ARGUMENT;
            }
        ); nnode != node->next_nodes.end() ) {
            node = *nnode;
            arguments.emplace( node->token, ntoken );
            continue;
        }

        throw std::runtime_error( "Wrong command" );
    }

    // we need to get forward to callback node
    if( auto nnode = std::find_if(
        node->next_nodes.begin(),
        node->next_nodes.end(),
        []( const std::shared_ptr<CLINode> v ) -> bool {
            return v->type == CLINodeType::END;
        }
    ); nnode != node->next_nodes.end() ) {
        return ( *nnode )->callback( arguments );
    }
    throw std::runtime_error( "Wrong command" );
}

CLIClient::CLIClient( boost::asio::io_context &i, const std::string &path, bool interactive ):
    io( i ),
    endpoint( path ),
    socket( i ),
    stdio( i )
{
    socket.connect( endpoint );
    if( !socket.is_open() ) {
        throw std::runtime_error( "Can't connect to unix socket" );
    }
    if( !interactive ) {
        return;
    }
    stdio.assign( ::dup( STDIN_FILENO ) );
    read_input();
    std::cout << "\033[2K" << greeting;
    std::cout.flush();
}

void CLIClient::read_input() {
    boost::asio::async_read( stdio, input, boost::asio::transfer_at_least( 1 ), std::bind( &CLIClient::on_read, this, std::placeholders::_1, std::placeholders::_2 ) );
}

void CLIClient::on_read( const boost::system::error_code &ec, size_t len ) {
    if( ec ) {
        std::cout << std::endl;
        return;
    }
    input.commit( len );
    while( input.in_avail() > 0 ) {
        auto b = input.sgetc();
        process_char( b );
        input.consume( 1 );
    }
    std::cout << "\033[2K\r" << greeting << current_cmd;
    std::cout.flush();
    read_input();
}

void CLIClient::process_char( const char &ch ) {
    switch( ch ) {
    case '\b':
    case 0x7f:
        if( !current_cmd.empty() )
            current_cmd.erase( current_cmd.end() - 1 );
        break;
    case '\t':
        break;
    case '\n':
        std::cout << std::endl;
        if( !current_cmd.empty() ) {
            process_input( current_cmd );
            current_cmd.clear();
        }
        break;
    default:
        if( std::isgraph( static_cast<unsigned char>( ch ) ) || ch == ' ' ) {
            current_cmd += ch;
        }
    }
}

void CLIClient::process_input( const std::string &input ) {
    try {
        auto out = cmd.call_cmd( input ) + "\r\n\r\n";

        boost::asio::write( socket, boost::asio::buffer( out ) );
        std::string buf;
        auto n = boost::asio::read_until( socket, boost::asio::dynamic_buffer( buf ), "\r\n\r\n" );
        buf.resize( n - 4 );

        print_resp( buf );
    } catch( std::exception &e ) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
}

void CLIClient::print_resp( const std::string &msg ) {
    auto result = deserialize<CLI_MSG>( msg );
    if( !result.error.empty() ) {
        std::cout << "Error: " << result.error << std::endl;
        return;
    }
    switch( result.cmd ) {
    case CLI_CMD::GET_VERSION: {
        auto resp = deserialize<GET_VERSION_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_POOL_STATS:
    case CLI_CMD::CLEANUP_POOL: {
        auto resp = deserialize<GET_POOL_STATS_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_DEVICES: {
        auto resp = deserialize<GET_DEVICES_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_SESSIONS: {
        auto resp = deserialize<GET_SESSIONS_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_IDENTITY: {
        auto resp = deserialize<GET_IDENTITY_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_RESOURCES: {
        auto resp = deserialize<GET_RESOURCES_RESP>( result.data );
        std::cout << resp << std::endl;
        break;
    }
    case CLI_CMD::DISCONNECT:
    case CLI_CMD::SET_RATE_LIMIT:
        std::cout << "OK" << std::endl;
        break;
    }
}

int main( int argc, char *argv[] ) {
    std::string socket_path { unix_socket_path };
    std::vector<std::string> command;

    boost::program_options::options_description desc { "Control utility of NAS control plane daemon" };
    desc.add_options()
    ( "socket,s", boost::program_options::value( &socket_path ), "Path to the daemon socket" )
    ( "command", boost::program_options::value( &command ), "Run a single command and exit" )
    ( "help,h", "Print this message" )
    ;
    boost::program_options::positional_options_description pos;
    pos.add( "command", -1 );

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store( boost::program_options::command_line_parser( argc, argv ).options( desc ).positional( pos ).run(), vm );
        boost::program_options::notify( vm );
    } catch( const boost::program_options::error &e ) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if( vm.count( "help" ) ) {
        std::cout << desc << std::endl;
        return 0;
    }

    if( !command.empty() ) {
        try {
            boost::asio::io_context io;
            CLIClient cli { io, socket_path, false };
            cli.process_input( boost::algorithm::join( command, " " ) );
        } catch( std::exception &e ) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    std::cout << "Control utility of NAS control plane daemon" << std::endl;

    termios tio;
    std::memset( &tio, 0, sizeof( tio ) );

    /* Save the original tty state so we can restore it later */
    if( tcgetattr( STDIN_FILENO, &orig_tio ) < 0 ) {
        std::cerr << "Cannot get terminal settings" << std::endl;
        exit( -1 );
    }

    /* Tweak the tty settings */
    tio = orig_tio;
    /* echo off, canonical mode off, ext'd input processing off */
    tio.c_lflag &= ~(ECHO | ICANON | IEXTEN);
    tio.c_cc[VMIN] = 1;       /* 1 byte at a time */
    tio.c_cc[VTIME] = 0;      /* no timer */

    if( tcsetattr( STDIN_FILENO, TCSAFLUSH, &tio ) < 0 ) {
        std::cerr << "Cannot set terminal settings" << std::endl;
        exit( -1 );
    }
    tty_changed = true;

    try {
        boost::asio::io_context io;

        boost::asio::signal_set signals{ io, SIGTERM, SIGINT };
        signals.async_wait( signal_handler_term );

        CLIClient cli { io, socket_path };

        io.run();
    } catch( std::exception &e ) {
        restore_tty();
        std::cerr << e.what() << std::endl;
        return 1;
    }

    restore_tty();
    return 0;
}
