#ifndef EVLOOP_HPP
#define EVLOOP_HPP

#include <atomic>

#include <boost/asio.hpp>

extern std::atomic_bool interrupted;

class NASCPRuntime;

class EVLoop {
public:
    EVLoop( boost::asio::io_context &i, NASCPRuntime &rt );
    void on_signal( const boost::system::error_code &ec, int signal );

private:
    boost::asio::io_context &io;
    NASCPRuntime &runtime;
    boost::asio::signal_set signals;
};

#endif
