#include <string>
#include <algorithm>
#include <charconv>
#include <stdexcept>

#define BOOST_UUID_COMPAT_PRE_1_71_MD5

#include <boost/random/random_device.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <boost/algorithm/hex.hpp>

#include "utils.hpp"

using md5_t = boost::uuids::detail::md5;

uint8_t random_uint8_t() {
    boost::random::random_device rng;
    return static_cast<uint8_t>( rng() );
}

std::string md5( const std::string &v ) {
    md5_t hash;
    md5_t::digest_type digest;

    hash.process_bytes( v.data(), v.size() );
    hash.get_digest( digest );
    const auto charDigest = reinterpret_cast<const char *>( &digest );

    return { charDigest, charDigest + sizeof( md5_t::digest_type ) };
}

std::string md5_hex( const std::string &v ) {
    return to_hex( md5( v ) );
}

std::string to_hex( const std::string &v ) {
    std::string result;
    boost::algorithm::hex_lower( v.begin(), v.end(), std::back_inserter( result ) );
    return result;
}

std::string from_hex( const std::string &v ) {
    std::string result;
    try {
        boost::algorithm::unhex( v.begin(), v.end(), std::back_inserter( result ) );
    } catch( const boost::algorithm::hex_decode_error & ) {
        throw std::invalid_argument( "invalid hex string: " + v );
    }
    return result;
}

std::pair<std::string,uint16_t> splitHostPort( const std::string &address, uint16_t def ) {
    if( !address.empty() && address.front() == '[' ) {
        auto end = address.find( ']' );
        if( end == std::string::npos ) {
            throw std::invalid_argument( "malformed address: " + address );
        }
        auto host = address.substr( 1, end - 1 );
        if( end + 1 < address.size() && address[ end + 1 ] == ':' ) {
            return { host, static_cast<uint16_t>( std::stoul( address.substr( end + 2 ) ) ) };
        }
        return { host, def };
    }

    auto colon = address.find( ':' );
    // bare IPv6 address, no port
    if( colon == std::string::npos || address.find( ':', colon + 1 ) != std::string::npos ) {
        return { address, def };
    }
    return { address.substr( 0, colon ), static_cast<uint16_t>( std::stoul( address.substr( colon + 1 ) ) ) };
}

int64_t parseInt64( const std::string &s ) {
    int64_t ret = 0;
    if( auto const &[ ptr, ec ] = std::from_chars( s.data(), s.data() + s.size(), ret ); ec != std::errc() ) {
        return 0;
    }
    return ret;
}
