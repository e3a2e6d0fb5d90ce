#ifndef UTILS_HPP
#define UTILS_HPP

#include <array>
#include <vector>
#include <string>
#include <cstdint>

using authenticator_t = std::array<uint8_t,16>;

uint8_t random_uint8_t();
std::string md5( const std::string &v );
std::string md5_hex( const std::string &v );
std::string to_hex( const std::string &v );

// Throws std::invalid_argument on odd length or non-hex characters
std::string from_hex( const std::string &v );

// "host:port" -> { host, port }; port is `def` when absent
std::pair<std::string,uint16_t> splitHostPort( const std::string &address, uint16_t def );

int64_t parseInt64( const std::string &s );

#endif
