#ifndef STRING_HELPERS_HPP_
#define STRING_HELPERS_HPP_

#include <cstdint>
#include <iosfwd>

enum class RADIUS_CODE : uint8_t;
struct RadiusPacket;
enum class COA_METHOD: uint8_t;
enum class CLI_CMD: uint8_t;

// CLI types
struct GET_VERSION_RESP;
struct GET_POOL_STATS_RESP;
struct GET_DEVICES_RESP;
struct GET_SESSIONS_RESP;
struct GET_IDENTITY_RESP;
struct GET_RESOURCES_RESP;

std::ostream& operator<<( std::ostream &stream, const RADIUS_CODE &code );
std::ostream& operator<<( std::ostream &stream, const RadiusPacket *pkt );
std::ostream& operator<<( std::ostream &stream, const COA_METHOD &method );
std::ostream& operator<<( std::ostream &stream, const CLI_CMD &cmd );

std::ostream& operator<<( std::ostream &stream, const GET_VERSION_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_POOL_STATS_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_DEVICES_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_SESSIONS_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_IDENTITY_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_RESOURCES_RESP &resp );

#endif
