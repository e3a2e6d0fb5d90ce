#ifndef NAS_CLIENT_HPP
#define NAS_CLIENT_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "api_word.hpp"

class Logger;
class ConnectionPool;

struct DeviceTarget {
    std::string address;
    std::string username;
    std::string password;
};

struct ActiveSession {
    std::string id;
    std::string name;
    std::string service;
    std::string caller_id;
    std::string address;
    std::string uptime;
    std::string encoding;
    std::string session_id;
    int64_t limit_bytes_in { 0 };
    int64_t limit_bytes_out { 0 };
};

struct SystemResource {
    std::string uptime;
    std::string version;
    std::string build_time;
    std::string factory_software;
    int64_t free_memory { 0 };
    int64_t total_memory { 0 };
    int64_t cpu_count { 0 };
    int64_t cpu_frequency { 0 };
    int64_t cpu_load { 0 };
    int64_t free_hdd { 0 };
    int64_t total_hdd { 0 };
    std::string architecture;
    std::string board_name;
    std::string platform;
};

struct IpPool {
    std::string id;
    std::string name;
    std::string ranges;
};

// Router operations on top of the pool. Every call takes a connection, puts
// it back on success and removes it from the pool on any error.
class NasClient {
public:
    NasClient( Logger &l, ConnectionPool &p, DeviceTarget t );

    std::vector<api_record_t> execute( const std::string &command, const std::vector<std::string> &args = {} );

    std::vector<ActiveSession> getActiveSessions();
    // Throws NotFoundError when the user has no session
    ActiveSession getActiveSession( const std::string &username );
    void disconnectUser( const std::string &username );

    // Tries the live session first, then a simple queue by name, then by target address
    void updateUserRateLimit( const std::string &username, int64_t download_kbps, int64_t upload_kbps );
    // Same, `ip` is used for the queue lookup when the session has no address
    void updateUserRateLimitWithIp( const std::string &username, const std::string &ip, int64_t download_kbps, int64_t upload_kbps );
    void restoreUserSpeed( const std::string &username, int64_t download_mbps, int64_t upload_mbps );

    SystemResource getSystemResource();
    std::string getIdentity();
    // Tracked connections per source address
    std::map<std::string,uint32_t> getAllConnectionCounts();
    int64_t getConnectionCount( const std::string &ip );
    std::vector<IpPool> getIpPools();

    const DeviceTarget& getTarget() const {
        return target;
    }

private:
    ApiReply query( const std::string &command, const std::vector<std::string> &args );
    void updateQueueRateLimit( const std::string &username, const std::string &ip, const std::string &rate_limit );
    bool setQueueLimit( const std::string &filter, const std::string &rate_limit );

    Logger &logger;
    ConnectionPool &pool;
    DeviceTarget target;
};

// "<upload>k/<download>k"
std::string formatRateLimit( int64_t download_kbps, int64_t upload_kbps );

#endif
