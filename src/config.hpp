#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "log.hpp"

using namespace std::chrono_literals;

#define API_DEFAULT_PORT 8728
#define COA_DEFAULT_PORT 3799
#define NASCPD_VERSION "1.0.0"

// Immutable once the pool is constructed
struct PoolConfig {
    uint32_t max_connections { 10 };
    std::chrono::milliseconds idle_timeout { 5min };
    std::chrono::milliseconds connect_timeout { 5s };
    std::chrono::milliseconds max_age { 30min };
    std::chrono::milliseconds cleanup_interval { 1min };
    std::chrono::milliseconds command_timeout { 10s };
    std::chrono::milliseconds login_timeout { 5s };
    std::chrono::milliseconds probe_timeout { 1ms };
};

enum class COA_METHOD: uint8_t {
    NATIVE,
    RADCLIENT
};

struct CoAConf {
    uint16_t port { COA_DEFAULT_PORT };
    std::string secret;
    COA_METHOD method { COA_METHOD::NATIVE };
    std::chrono::milliseconds timeout { 5s };
};

struct DeviceConf {
    // host[:port], API port defaults to 8728
    std::string address;
    std::string username;
    std::string password;
    std::optional<CoAConf> coa;
};

struct NASCPGlobalConf {
    LOGL log_level { LOGL::INFO };
    std::string socket_path { "/var/run/nascpd.sock" };
    PoolConfig pool;
    std::map<std::string,DeviceConf> devices;
};

#endif
