#ifndef RADIUS_AVP_HPP
#define RADIUS_AVP_HPP

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include "net_integer.hpp"
#include "radius_packet.hpp"

#define RADIUS_VSA 26
#define MIKROTIK_VENDOR_ID 14988
#define MIKROTIK_RATE_LIMIT 8

struct AVP {
    uint8_t type;
    uint32_t vendor { 0 };
    std::vector<uint8_t> value;

    explicit AVP( RADIUS_ATTR attr, BE32 v );
    explicit AVP( RADIUS_ATTR attr, const std::string &s );
    // Vendor-Specific attribute with a single sub-attribute
    explicit AVP( uint32_t vendorid, uint8_t vendor_type, const std::string &s );
    // Parses one attribute at `it`, throws std::runtime_error when it runs past `end`
    explicit AVP( std::vector<uint8_t>::const_iterator it, std::vector<uint8_t>::const_iterator end );

    // Bytes occupied on the wire, VSA envelope included
    size_t getSize() const;

    template<typename T>
    std::tuple<T, bool> getVal() const;

    std::vector<uint8_t> serialize() const;

private:
    size_t wire_len { 0 };
};

template<>
std::tuple<std::string, bool> AVP::getVal<std::string>() const;

template<>
std::tuple<BE32, bool> AVP::getVal<BE32>() const;

std::vector<AVP> parseAVP( const std::vector<uint8_t> &v );

// Attribute order is kept as given
std::vector<uint8_t> serializeAVP( const std::vector<AVP> &avp );

#endif
