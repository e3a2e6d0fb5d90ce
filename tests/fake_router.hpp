#ifndef FAKE_ROUTER_HPP
#define FAKE_ROUTER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "api_word.hpp"

// Returns the sentences to send back, nothing at all leaves the command hanging
using router_handler_t = std::function<std::vector<api_sentence_t>( const api_sentence_t & )>;

class FakeRouterSession;

// Router API endpoint on 127.0.0.1 with a scriptable command handler.
// Runs its own io thread.
class FakeRouter {
public:
    FakeRouter();
    ~FakeRouter();

    std::string address() const;
    uint16_t port() const;

    void setHandler( router_handler_t h );
    void setCredentials( std::string user, std::string pass );
    // Answer the plain /login with a =ret= challenge
    void setChallenge( bool enable );

    uint32_t accepted() const {
        return accepted_count;
    }
    uint32_t connected() const {
        return connected_count;
    }
    // Commands after login, first word only
    std::vector<std::string> commands() const;
    // Full sentences after login
    std::vector<api_sentence_t> sentences() const;

    // Closes every client socket from the router side
    void dropAll();

private:
    friend class FakeRouterSession;

    void do_accept();
    std::vector<api_sentence_t> handle( const api_sentence_t &sentence, bool &authed );
    std::vector<api_sentence_t> login( const api_sentence_t &sentence, bool &authed );

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor;
    std::thread thread;

    mutable std::mutex mutex;
    router_handler_t handler;
    std::string username { "admin" };
    std::string password { "secret" };
    bool challenge { false };
    std::vector<api_sentence_t> log;
    std::vector<std::weak_ptr<FakeRouterSession>> sessions;

    std::atomic<uint32_t> accepted_count { 0 };
    std::atomic<uint32_t> connected_count { 0 };
};

api_sentence_t reSentence( const api_record_t &record );
api_sentence_t trapSentence( const std::string &message );

// Attribute value of a sentence word list, empty when absent
std::string sentenceAttr( const api_sentence_t &sentence, const std::string &key );

inline constexpr char fake_challenge[] { "0123456789abcdef0123456789abcdef" };

#endif
