#ifndef API_CONNECTION_HPP
#define API_CONNECTION_HPP

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "api_auth.hpp"
#include "api_word.hpp"
#include "config.hpp"

class Logger;

// Authenticated socket to one router plus the bookkeeping the pool needs.
// State flags are guarded by `mutex`, the socket by `io_mutex`; io_mutex is
// always taken first.
class ApiConnection: public ApiTransport {
public:
    ApiConnection( Logger &l, std::string addr, const PoolConfig &c );
    ~ApiConnection();

    ApiConnection( const ApiConnection& ) = delete;
    ApiConnection& operator=( const ApiConnection& ) = delete;

    // Connects and logs in, throws ApiConnectError, ApiAuthError or ApiProtocolError
    static std::shared_ptr<ApiConnection> open( Logger &l, const std::string &addr, const std::string &user, const std::string &pass, const PoolConfig &c );

    // Throws ApiTrapError on !trap, ApiProtocolError on I/O failure, timeout or !fatal
    std::vector<api_record_t> execute( const std::string &command, const std::vector<std::string> &args = {} );
    // Same as execute but keeps the !done attributes
    ApiReply query( const std::string &command, const std::vector<std::string> &args = {} );

    // Peeks the socket for probe_timeout. Advisory, never throws.
    bool isAlive();
    void close();

    bool markInUse();
    void release();

    bool inUse() const;
    bool isClosed() const;
    std::chrono::steady_clock::time_point createdAt() const;
    std::chrono::steady_clock::time_point lastUsedAt() const;

    const std::string& getAddress() const {
        return address;
    }

private:
    ApiReply roundTrip( const api_sentence_t &sentence, deadline_t deadline ) override;

    void connect();
    // Runs the io_context until the pending operation completes or the deadline
    // passes; false on timeout, the operation is still outstanding then.
    bool runUntil( deadline_t deadline );
    void writeAll( const std::vector<uint8_t> &data, deadline_t deadline );
    void readSome( deadline_t deadline );
    // io_mutex must be held
    void closeSocket();

    Logger &logger;
    std::string address;
    PoolConfig conf;

    boost::asio::io_context io;
    boost::asio::ip::tcp::socket socket;
    SentenceDecoder decoder;
    std::array<uint8_t,4096> rbuf;

    std::mutex io_mutex;
    mutable std::mutex mutex;
    bool in_use { false };
    bool closed { false };
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
};

using api_connection_ptr = std::shared_ptr<ApiConnection>;

#endif
