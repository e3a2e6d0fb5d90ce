#ifndef CLI_HPP
#define CLI_HPP

#include <array>
#include <iostream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <boost/asio.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

using stream_protocol = boost::asio::local::stream_protocol;

class NASCPRuntime;

enum class CLI_CMD_TYPE: uint8_t {
    REQUEST = 0,
    RESPONSE = 1,
};

enum class CLI_CMD: uint8_t {
    GET_VERSION,
    GET_POOL_STATS,
    GET_DEVICES,
    GET_SESSIONS,
    GET_IDENTITY,
    GET_RESOURCES,
    DISCONNECT,
    SET_RATE_LIMIT,
    CLEANUP_POOL,
};

struct CLI_MSG {
    CLI_CMD_TYPE type;
    CLI_CMD cmd;
    std::string data;
    std::string error;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & type;
        archive & cmd;
        archive & data;
        archive & error;
    }
};

struct DEVICE_REQ {
    std::string device;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
    }
};

// via_radius selects the device control channel instead of the router API
struct DISCONNECT_REQ {
    std::string device;
    std::string username;
    std::string session_id;
    bool via_radius { false };

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
        archive & username;
        archive & session_id;
        archive & via_radius;
    }
};

struct SET_RATE_LIMIT_REQ {
    std::string device;
    std::string username;
    std::string session_id;
    int64_t download_kbps { 0 };
    int64_t upload_kbps { 0 };
    bool via_radius { false };

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
        archive & username;
        archive & session_id;
        archive & download_kbps;
        archive & upload_kbps;
        archive & via_radius;
    }
};

struct POOL_DUMP {
    std::string address;
    uint32_t total;
    uint32_t active;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & address;
        archive & total;
        archive & active;
    }
};

struct GET_POOL_STATS_RESP {
    uint32_t total_pools;
    uint32_t total_connections;
    uint32_t active_connections;
    std::vector<POOL_DUMP> pools;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & total_pools;
        archive & total_connections;
        archive & active_connections;
        archive & pools;
    }
};

struct DEVICE_DUMP {
    std::string name;
    std::string address;
    std::string username;
    std::string coa;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & name;
        archive & address;
        archive & username;
        archive & coa;
    }
};

struct GET_DEVICES_RESP {
    std::vector<DEVICE_DUMP> devices;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & devices;
    }
};

struct SESSION_DUMP {
    std::string id;
    std::string name;
    std::string service;
    std::string caller_id;
    std::string address;
    std::string uptime;
    std::string session_id;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & id;
        archive & name;
        archive & service;
        archive & caller_id;
        archive & address;
        archive & uptime;
        archive & session_id;
    }
};

struct GET_SESSIONS_RESP {
    std::string device;
    std::vector<SESSION_DUMP> sessions;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
        archive & sessions;
    }
};

struct GET_IDENTITY_RESP {
    std::string device;
    std::string identity;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
        archive & identity;
    }
};

struct GET_RESOURCES_RESP {
    std::string device;
    std::string version;
    std::string uptime;
    std::string board_name;
    std::string architecture;
    int64_t cpu_load;
    int64_t free_memory;
    int64_t total_memory;
    int64_t free_hdd;
    int64_t total_hdd;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & device;
        archive & this->version;
        archive & uptime;
        archive & board_name;
        archive & architecture;
        archive & cpu_load;
        archive & free_memory;
        archive & total_memory;
        archive & free_hdd;
        archive & total_hdd;
    }
};

struct GET_VERSION_RESP {
    std::string version_string;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & version_string;
    }
};

template<typename T>
std::string serialize( const T &val ) {
    static auto const ser_flags = boost::archive::no_header | boost::archive::no_tracking;
    std::stringstream ss;
    boost::archive::binary_oarchive ser( ss, ser_flags );
    ser << val;
    return ss.str();
}

template<typename T>
T deserialize( const std::string &val ) {
    static auto const ser_flags = boost::archive::no_header | boost::archive::no_tracking;
    T out;
    std::istringstream ss( val );
    boost::archive::binary_iarchive deser{ ss, ser_flags };
    deser >> out;
    return out;
}

// Runs one request against the runtime. Blocking, call it off the event loop.
// Failures come back in the `error` field.
CLI_MSG processCLIRequest( NASCPRuntime &rt, const CLI_MSG &in_msg );

class CLIServer {
public:
    CLIServer( boost::asio::io_context &io_context, const std::string &path, NASCPRuntime &rt );

private:
    void do_accept();
    stream_protocol::acceptor acceptor_;
    NASCPRuntime &runtime;
};

class CLISession: public std::enable_shared_from_this<CLISession> {
public:
    CLISession( stream_protocol::socket sock, NASCPRuntime &rt ):
        socket_( std::move( sock ) ),
        runtime( rt )
    {}

    void start();

private:
    void do_read();
    void do_write( std::shared_ptr<std::string> &out );
    void run_cmd( const std::string &cmd );

    stream_protocol::socket socket_;
    NASCPRuntime &runtime;
    boost::asio::streambuf request;
};

#endif
