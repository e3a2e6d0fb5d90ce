#include "yaml.hpp"

#include "config.hpp"
#include "log.hpp"

// Durations are written in seconds
static std::chrono::milliseconds seconds_of( const YAML::Node &node ) {
    return std::chrono::seconds( node.as<uint32_t>() );
}

static uint32_t to_seconds( std::chrono::milliseconds ms ) {
    return std::chrono::duration_cast<std::chrono::seconds>( ms ).count();
}

YAML::Node YAML::convert<PoolConfig>::encode( const PoolConfig &rhs ) {
    Node node;
    node[ "max_connections" ] = rhs.max_connections;
    node[ "idle_timeout" ] = to_seconds( rhs.idle_timeout );
    node[ "connect_timeout" ] = to_seconds( rhs.connect_timeout );
    node[ "max_age" ] = to_seconds( rhs.max_age );
    node[ "cleanup_interval" ] = to_seconds( rhs.cleanup_interval );
    node[ "command_timeout" ] = to_seconds( rhs.command_timeout );
    node[ "login_timeout" ] = to_seconds( rhs.login_timeout );
    return node;
}

bool YAML::convert<PoolConfig>::decode( const YAML::Node &node, PoolConfig &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    if( node[ "max_connections" ].IsDefined() ) {
        rhs.max_connections = node[ "max_connections" ].as<uint32_t>();
        if( rhs.max_connections == 0 ) {
            return false;
        }
    }
    if( node[ "idle_timeout" ].IsDefined() ) {
        rhs.idle_timeout = seconds_of( node[ "idle_timeout" ] );
    }
    if( node[ "connect_timeout" ].IsDefined() ) {
        rhs.connect_timeout = seconds_of( node[ "connect_timeout" ] );
    }
    if( node[ "max_age" ].IsDefined() ) {
        rhs.max_age = seconds_of( node[ "max_age" ] );
    }
    if( node[ "cleanup_interval" ].IsDefined() ) {
        rhs.cleanup_interval = seconds_of( node[ "cleanup_interval" ] );
        if( rhs.cleanup_interval.count() <= 0 ) {
            return false;
        }
    }
    if( node[ "command_timeout" ].IsDefined() ) {
        rhs.command_timeout = seconds_of( node[ "command_timeout" ] );
    }
    if( node[ "login_timeout" ].IsDefined() ) {
        rhs.login_timeout = seconds_of( node[ "login_timeout" ] );
    }
    return true;
}

YAML::Node YAML::convert<COA_METHOD>::encode( const COA_METHOD &rhs ) {
    Node node;
    switch( rhs ) {
    case COA_METHOD::NATIVE:
        node = "NATIVE"; break;
    case COA_METHOD::RADCLIENT:
        node = "RADCLIENT"; break;
    }
    return node;
}

bool YAML::convert<COA_METHOD>::decode( const YAML::Node &node, COA_METHOD &rhs ) {
    auto t = node.as<std::string>();
    if( t == "NATIVE" ) {
        rhs = COA_METHOD::NATIVE;
    } else if( t == "RADCLIENT" ) {
        rhs = COA_METHOD::RADCLIENT;
    } else {
        return false;
    }
    return true;
}

YAML::Node YAML::convert<LOGL>::encode( const LOGL &rhs ) {
    Node node;
    switch( rhs ) {
    case LOGL::TRACE:
        node = "TRACE"; break;
    case LOGL::DEBUG:
        node = "DEBUG"; break;
    case LOGL::INFO:
        node = "INFO"; break;
    case LOGL::WARN:
        node = "WARN"; break;
    case LOGL::ERROR:
        node = "ERROR"; break;
    case LOGL::ALERT:
        node = "ALERT"; break;
    }
    return node;
}

bool YAML::convert<LOGL>::decode( const YAML::Node &node, LOGL &rhs ) {
    auto t = node.as<std::string>();
    if( t == "TRACE" ) {
        rhs = LOGL::TRACE;
    } else if( t == "DEBUG" ) {
        rhs = LOGL::DEBUG;
    } else if( t == "INFO" ) {
        rhs = LOGL::INFO;
    } else if( t == "WARN" ) {
        rhs = LOGL::WARN;
    } else if( t == "ERROR" ) {
        rhs = LOGL::ERROR;
    } else if( t == "ALERT" ) {
        rhs = LOGL::ALERT;
    } else {
        return false;
    }
    return true;
}

YAML::Node YAML::convert<CoAConf>::encode( const CoAConf &rhs ) {
    Node node;
    node[ "port" ] = rhs.port;
    node[ "secret" ] = rhs.secret;
    node[ "method" ] = rhs.method;
    node[ "timeout" ] = to_seconds( rhs.timeout );
    return node;
}

bool YAML::convert<CoAConf>::decode( const YAML::Node &node, CoAConf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.secret = node[ "secret" ].as<std::string>();
    if( node[ "port" ].IsDefined() ) {
        rhs.port = node[ "port" ].as<uint16_t>();
    }
    if( node[ "method" ].IsDefined() ) {
        rhs.method = node[ "method" ].as<COA_METHOD>();
    }
    if( node[ "timeout" ].IsDefined() ) {
        rhs.timeout = seconds_of( node[ "timeout" ] );
    }
    return true;
}

YAML::Node YAML::convert<DeviceConf>::encode( const DeviceConf &rhs ) {
    Node node;
    node[ "address" ] = rhs.address;
    node[ "username" ] = rhs.username;
    node[ "password" ] = rhs.password;
    if( rhs.coa.has_value() ) {
        node[ "coa" ] = *rhs.coa;
    }
    return node;
}

bool YAML::convert<DeviceConf>::decode( const YAML::Node &node, DeviceConf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.address = node[ "address" ].as<std::string>();
    rhs.username = node[ "username" ].as<std::string>();
    rhs.password = node[ "password" ].as<std::string>();
    if( node[ "coa" ].IsDefined() ) {
        rhs.coa = node[ "coa" ].as<CoAConf>();
    }
    return true;
}

YAML::Node YAML::convert<NASCPGlobalConf>::encode( const NASCPGlobalConf &rhs ) {
    Node node;
    node[ "log_level" ] = rhs.log_level;
    node[ "socket_path" ] = rhs.socket_path;
    node[ "pool" ] = rhs.pool;
    node[ "devices" ] = rhs.devices;
    return node;
}

bool YAML::convert<NASCPGlobalConf>::decode( const YAML::Node &node, NASCPGlobalConf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    if( node[ "log_level" ].IsDefined() ) {
        rhs.log_level = node[ "log_level" ].as<LOGL>();
    }
    if( node[ "socket_path" ].IsDefined() ) {
        rhs.socket_path = node[ "socket_path" ].as<std::string>();
    }
    if( node[ "pool" ].IsDefined() ) {
        rhs.pool = node[ "pool" ].as<PoolConfig>();
    }
    if( node[ "devices" ].IsDefined() ) {
        rhs.devices = node[ "devices" ].as<std::map<std::string,DeviceConf>>();
    }
    return true;
}
