#include "log.hpp"

std::ostream& operator<<( std::ostream &os, const LOGL &l ) {
    switch( l ) {
    case LOGL::TRACE: return os << "[TRACE] ";
    case LOGL::DEBUG: return os << "[DEBUG] ";
    case LOGL::INFO: return os << "[INFO] ";
    case LOGL::WARN: return os << "[WARN] ";
    case LOGL::ERROR: return os << "[ERROR] ";
    case LOGL::ALERT: return os << "[ALERT] ";
    }
    return os;
}

std::ostream& operator<<( std::ostream &os, const LOGS &l ) {
    switch( l ) {
    case LOGS::MAIN: return os << "[MAIN] ";
    case LOGS::POOL: return os << "[POOL] ";
    case LOGS::API: return os << "[API] ";
    case LOGS::CLIENT: return os << "[CLIENT] ";
    case LOGS::COA: return os << "[COA] ";
    case LOGS::CLI: return os << "[CLI] ";
    }
    return os;
}

LogLine::LogLine( Logger *l, LOGL lvl ):
    logger( l ),
    level( lvl )
{}

LogLine::~LogLine() {
    flush();
}

LogLine& LogLine::operator<<( std::ostream& (*fun)( std::ostream& ) ) {
    flush();
    return *this;
}

void LogLine::flush() {
    if( logger == nullptr ) {
        return;
    }
    auto msg = line.str();
    if( msg.empty() ) {
        return;
    }
    logger->write( level, msg );
    line.str( std::string() );
}

void Logger::write( LOGL level, const std::string &msg ) {
    auto in_time_t = std::chrono::system_clock::to_time_t( std::chrono::system_clock::now() );
    std::tm tm;
    localtime_r( &in_time_t, &tm );

    std::lock_guard<std::mutex> lg{ mutex };
    os << std::put_time( &tm, "%Y-%m-%d %X: " ) << level << msg << std::endl;
}
