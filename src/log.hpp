#ifndef LOG_HPP
#define LOG_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <mutex>
#include <atomic>

enum class LOGL: uint8_t {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    ALERT
};

enum class LOGS: uint8_t {
    MAIN,
    POOL,
    API,
    CLIENT,
    COA,
    CLI
};

std::ostream& operator<<( std::ostream &os, const LOGL &l );
std::ostream& operator<<( std::ostream &os, const LOGS &l );

class Logger;

// One log statement. Collects everything streamed into it and hands the
// finished line to the Logger on std::endl (or on destruction), so lines
// from concurrent callers never interleave.
class LogLine {
public:
    LogLine( Logger *l, LOGL lvl );
    LogLine( const LogLine& ) = delete;
    LogLine( LogLine&& ) = default;
    ~LogLine();

    LogLine& operator<<( std::ostream& (*fun)( std::ostream& ) );

    template<typename T>
    LogLine& operator<<( const T& data ) {
        if( logger != nullptr ) {
            line << data;
        }
        return *this;
    }

private:
    void flush();

    Logger *logger;
    LOGL level;
    std::ostringstream line;
};

class Logger {
private:
    std::ostream &os;
    std::atomic<LOGL> minimum;
    std::mutex mutex;

    LogLine start( LOGL level ) {
        if( level < minimum ) {
            return LogLine{ nullptr, level };
        }
        return LogLine{ this, level };
    }

public:
    Logger( std::ostream &o = std::cout ):
        os( o ),
        minimum( LOGL::INFO )
    {}

    void setLevel( const LOGL &level ) {
        minimum = level;
    }

    LOGL getLevel() const {
        return minimum;
    }

    void write( LOGL level, const std::string &msg );

    LogLine logTrace() { return start( LOGL::TRACE ); }
    LogLine logDebug() { return start( LOGL::DEBUG ); }
    LogLine logInfo() { return start( LOGL::INFO ); }
    LogLine logWarn() { return start( LOGL::WARN ); }
    LogLine logError() { return start( LOGL::ERROR ); }
    LogLine logAlert() { return start( LOGL::ALERT ); }
};

#endif
