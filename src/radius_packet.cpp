#include <algorithm>

#include "radius_packet.hpp"

static std::string authenticator_input( RADIUS_CODE code, uint8_t id, const authenticator_t &auth, const std::vector<uint8_t> &attrs, const std::string &secret ) {
    BE16 len { static_cast<uint16_t>( sizeof( RadiusPacket ) + attrs.size() ) };
    auto len_bytes = len.bytes();

    std::string check;
    check.reserve( sizeof( RadiusPacket ) + attrs.size() + secret.size() );
    check.push_back( static_cast<char>( code ) );
    check.push_back( static_cast<char>( id ) );
    check.insert( check.end(), len_bytes.begin(), len_bytes.end() );
    check.insert( check.end(), auth.begin(), auth.end() );
    check.insert( check.end(), attrs.begin(), attrs.end() );
    check.insert( check.end(), secret.begin(), secret.end() );
    return check;
}

static authenticator_t to_authenticator( const std::string &hash ) {
    authenticator_t ret;
    std::copy_n( hash.begin(), ret.size(), ret.begin() );
    return ret;
}

authenticator_t requestAuthenticator( RADIUS_CODE code, uint8_t id, const std::vector<uint8_t> &attrs, const std::string &secret ) {
    authenticator_t zero {};
    return to_authenticator( md5( authenticator_input( code, id, zero, attrs, secret ) ) );
}

authenticator_t responseAuthenticator( RADIUS_CODE code, uint8_t id, const authenticator_t &req_auth, const std::vector<uint8_t> &attrs, const std::string &secret ) {
    return to_authenticator( md5( authenticator_input( code, id, req_auth, attrs, secret ) ) );
}

std::vector<uint8_t> buildRadiusPacket( RADIUS_CODE code, uint8_t id, const authenticator_t &auth, const std::vector<uint8_t> &attrs ) {
    std::vector<uint8_t> pkt;
    pkt.resize( sizeof( RadiusPacket ) );
    auto pkt_hdr = reinterpret_cast<RadiusPacket*>( pkt.data() );
    pkt_hdr->code = code;
    pkt_hdr->id = id;
    pkt_hdr->length = static_cast<uint16_t>( sizeof( RadiusPacket ) + attrs.size() );
    pkt_hdr->authenticator = auth;

    pkt.insert( pkt.end(), attrs.begin(), attrs.end() );
    return pkt;
}
