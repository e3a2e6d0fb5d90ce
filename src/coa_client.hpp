#ifndef COA_CLIENT_HPP
#define COA_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "radius_packet.hpp"

class Logger;
struct CoAResponse;

// Pushes policy changes to a NAS out of band. Every failure is reported by
// throwing CoAError (CoANakError when the NAS refused the request).
class ControlChannel {
public:
    virtual ~ControlChannel() = default;

    virtual void sendRateLimitChange( const std::string &username, const std::string &session_id, const std::string &rate_limit ) = 0;
    virtual void sendDisconnect( const std::string &username, const std::string &session_id ) = 0;
};

// Strips 0x/0X and lowercases, the NAS ignores the request otherwise
std::string normalizeSessionId( const std::string &session_id );

// RFC 5176 CoA-Request / Disconnect-Request over UDP
class RadiusCoAClient: public ControlChannel {
public:
    RadiusCoAClient( Logger &l, std::string host, CoAConf c );

    void sendRateLimitChange( const std::string &username, const std::string &session_id, const std::string &rate_limit ) override;
    void sendDisconnect( const std::string &username, const std::string &session_id ) override;

private:
    // Sends the packet and waits for an answer with the same id and a valid authenticator
    std::pair<RADIUS_CODE,CoAResponse> exchange( RADIUS_CODE code, const std::vector<uint8_t> &attrs );

    Logger &logger;
    std::string host;
    CoAConf conf;
};

// Same requests through FreeRADIUS radclient
class RadclientCoAClient: public ControlChannel {
public:
    RadclientCoAClient( Logger &l, std::string host, CoAConf c, std::string binary = "radclient" );

    void sendRateLimitChange( const std::string &username, const std::string &session_id, const std::string &rate_limit ) override;
    void sendDisconnect( const std::string &username, const std::string &session_id ) override;

private:
    // Returns combined stdout/stderr and the exit code
    std::pair<std::string,int> run( const std::string &command, const std::string &input );

    Logger &logger;
    std::string host;
    CoAConf conf;
    std::string binary;
};

// Throws unless the answer is the ACK for `request`
void checkCoAAnswer( RADIUS_CODE request, RADIUS_CODE answer, const CoAResponse &res );

// Throws unless radclient printed the ACK for `request`
void classifyRadclientOutput( RADIUS_CODE request, const std::string &output, int exit_code );

std::unique_ptr<ControlChannel> makeControlChannel( Logger &l, const std::string &host, const CoAConf &conf );

#endif
