#include <stdexcept>

#include "radius_avp.hpp"

AVP::AVP( RADIUS_ATTR attr, BE32 v ):
    type( static_cast<uint8_t>( attr ) )
{
    auto bytes = v.bytes();
    value = { bytes.begin(), bytes.end() };
    wire_len = 2 + value.size();
}

AVP::AVP( RADIUS_ATTR attr, const std::string &s ):
    type( static_cast<uint8_t>( attr ) ),
    value( s.begin(), s.end() )
{
    if( value.size() > 253 ) {
        throw std::invalid_argument( "attribute value is too long" );
    }
    wire_len = 2 + value.size();
}

AVP::AVP( uint32_t vendorid, uint8_t vendor_type, const std::string &s ):
    type( vendor_type ),
    vendor( vendorid ),
    value( s.begin(), s.end() )
{
    if( value.size() > 247 ) {
        throw std::invalid_argument( "vendor attribute value is too long" );
    }
    wire_len = 2 + sizeof( vendor ) + 2 + value.size();
}

AVP::AVP( std::vector<uint8_t>::const_iterator it, std::vector<uint8_t>::const_iterator end ) {
    if( ( end - it ) < 2 ) {
        throw std::runtime_error( "No room for parsing attribute" );
    }

    type = *it;
    wire_len = *( it + 1 );
    if( wire_len < 2 || static_cast<size_t>( end - it ) < wire_len ) {
        throw std::runtime_error( "Attribute length " + std::to_string( wire_len ) + " is out of packet bounds" );
    }

    if( type != RADIUS_VSA ) {
        value = { it + 2, it + wire_len };
        return;
    }

    if( wire_len < 8 ) {
        throw std::runtime_error( "No room for parsing VSA" );
    }
    vendor = BE32::fromBytes( &*( it + 2 ) ).native();
    type = *( it + 6 );
    size_t sub_len = *( it + 7 );
    if( sub_len < 2 || sub_len + 6 > wire_len ) {
        throw std::runtime_error( "VSA length " + std::to_string( sub_len ) + " is out of attribute bounds" );
    }
    value = { it + 8, it + 6 + sub_len };
}

size_t AVP::getSize() const {
    return wire_len;
}

std::vector<uint8_t> AVP::serialize() const {
    std::vector<uint8_t> ret;
    ret.reserve( wire_len );
    if( vendor == 0 ) {
        ret.push_back( type );
        ret.push_back( static_cast<uint8_t>( wire_len ) );
    } else {
        ret.push_back( RADIUS_VSA );
        ret.push_back( static_cast<uint8_t>( wire_len ) );
        auto vend_buf = BE32( vendor ).bytes();
        ret.insert( ret.end(), vend_buf.begin(), vend_buf.end() );
        ret.push_back( type );
        ret.push_back( static_cast<uint8_t>( 2 + value.size() ) );
    }
    ret.insert( ret.end(), value.begin(), value.end() );
    return ret;
}

template<>
std::tuple<std::string, bool> AVP::getVal<std::string>() const {
    return { { value.begin(), value.end() }, true };
}

template<>
std::tuple<BE32, bool> AVP::getVal<BE32>() const {
    if( value.size() != 4 ) {
        return { BE32( 0 ), false };
    }
    return { BE32::fromBytes( value.data() ), true };
}

std::vector<AVP> parseAVP( const std::vector<uint8_t> &v ) {
    std::vector<AVP> ret;
    auto it = v.cbegin();
    while( it != v.cend() ) {
        ret.emplace_back( it, v.cend() );
        it += ret.back().getSize();
    }
    return ret;
}

std::vector<uint8_t> serializeAVP( const std::vector<AVP> &avp ) {
    std::vector<uint8_t> ret;

    for( auto const &a: avp ) {
        auto temp = a.serialize();
        ret.insert( ret.end(), temp.begin(), temp.end() );
    }
    return ret;
}
