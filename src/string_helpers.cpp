#include <iostream>
#include <iomanip>

#include "string_helpers.hpp"
#include "radius_packet.hpp"
#include "config.hpp"
#include "cli.hpp"

std::ostream& operator<<( std::ostream &stream, const RADIUS_CODE &code ) {
    switch( code ) {
    case RADIUS_CODE::DISCONNECT_REQUEST: stream << "DISCONNECT_REQUEST"; break;
    case RADIUS_CODE::DISCONNECT_ACK: stream << "DISCONNECT_ACK"; break;
    case RADIUS_CODE::DISCONNECT_NAK: stream << "DISCONNECT_NAK"; break;
    case RADIUS_CODE::COA_REQUEST: stream << "COA_REQUEST"; break;
    case RADIUS_CODE::COA_ACK: stream << "COA_ACK"; break;
    case RADIUS_CODE::COA_NAK: stream << "COA_NAK"; break;
    case RADIUS_CODE::RESERVED: stream << "RESERVED"; break;
    default: stream << "CODE " << static_cast<int>( code ); break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const RadiusPacket *pkt ) {
    stream << "Code: " << pkt->code;
    stream << " Id: " << static_cast<int>( pkt->id );
    stream << " Length: " << pkt->length.native();
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const COA_METHOD &method ) {
    switch( method ) {
    case COA_METHOD::NATIVE: stream << "NATIVE"; break;
    case COA_METHOD::RADCLIENT: stream << "RADCLIENT"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const CLI_CMD &cmd ) {
    switch( cmd ) {
    case CLI_CMD::GET_VERSION: stream << "GET_VERSION"; break;
    case CLI_CMD::GET_POOL_STATS: stream << "GET_POOL_STATS"; break;
    case CLI_CMD::GET_DEVICES: stream << "GET_DEVICES"; break;
    case CLI_CMD::GET_SESSIONS: stream << "GET_SESSIONS"; break;
    case CLI_CMD::GET_IDENTITY: stream << "GET_IDENTITY"; break;
    case CLI_CMD::GET_RESOURCES: stream << "GET_RESOURCES"; break;
    case CLI_CMD::DISCONNECT: stream << "DISCONNECT"; break;
    case CLI_CMD::SET_RATE_LIMIT: stream << "SET_RATE_LIMIT"; break;
    case CLI_CMD::CLEANUP_POOL: stream << "CLEANUP_POOL"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &os, const GET_VERSION_RESP &resp ) {
    os << "Version: " << resp.version_string;
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_POOL_STATS_RESP &resp ) {
    auto flags = os.flags();
    os << "Pools: " << resp.total_pools;
    os << " Connections: " << resp.total_connections;
    os << " Active: " << resp.active_connections;
    os << std::endl;
    os << std::left;
    os << " ";
    os << std::setw( 30 ) << "Address";
    os << std::setw( 10 ) << "Total";
    os << std::setw( 10 ) << "Active";
    os << std::endl;
    for( auto const &p: resp.pools ) {
        os << std::setw( 30 ) << p.address;
        os << std::setw( 10 ) << p.total;
        os << std::setw( 10 ) << p.active;
        os << std::endl;
    }

    os.flags( flags );
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_DEVICES_RESP &resp ) {
    auto flags = os.flags();
    os << std::left;
    os << " ";
    os << std::setw( 16 ) << "Name";
    os << std::setw( 30 ) << "Address";
    os << std::setw( 16 ) << "Username";
    os << std::setw( 20 ) << "CoA";
    os << std::endl;
    for( auto const &dev: resp.devices ) {
        os << std::setw( 16 ) << dev.name;
        os << std::setw( 30 ) << dev.address;
        os << std::setw( 16 ) << dev.username;
        os << std::setw( 20 ) << ( dev.coa.empty() ? "-" : dev.coa );
        os << std::endl;
    }

    os.flags( flags );
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_SESSIONS_RESP &resp ) {
    auto flags = os.flags();
    os << "Device: " << resp.device << std::endl;
    os << std::left;
    os << " ";
    os << std::setw( 10 ) << "ID";
    os << std::setw( 20 ) << "Username";
    os << std::setw( 10 ) << "Service";
    os << std::setw( 20 ) << "Caller ID";
    os << std::setw( 16 ) << "Address";
    os << std::setw( 12 ) << "Uptime";
    os << std::setw( 12 ) << "Session";
    os << std::endl;
    for( auto const &sess: resp.sessions ) {
        os << std::setw( 10 ) << sess.id;
        os << std::setw( 20 ) << sess.name;
        os << std::setw( 10 ) << sess.service;
        os << std::setw( 20 ) << sess.caller_id;
        os << std::setw( 16 ) << sess.address;
        os << std::setw( 12 ) << sess.uptime;
        os << std::setw( 12 ) << sess.session_id;
        os << std::endl;
    }

    os.flags( flags );
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_IDENTITY_RESP &resp ) {
    os << "Device: " << resp.device << " identity: " << resp.identity;
    return os;
}

std::ostream& operator<<( std::ostream &os, const GET_RESOURCES_RESP &resp ) {
    os << "Device: " << resp.device << std::endl;
    os << "Version: " << resp.version << " (" << resp.architecture << ", " << resp.board_name << ")" << std::endl;
    os << "Uptime: " << resp.uptime << std::endl;
    os << "CPU load: " << resp.cpu_load << "%" << std::endl;
    os << "Memory: " << resp.free_memory << " free of " << resp.total_memory << std::endl;
    os << "HDD: " << resp.free_hdd << " free of " << resp.total_hdd;
    return os;
}
