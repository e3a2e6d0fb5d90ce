#include <csignal>
#include <functional>

#include "evloop.hpp"
#include "runtime.hpp"

std::atomic_bool interrupted { false };

EVLoop::EVLoop( boost::asio::io_context &i, NASCPRuntime &rt ):
    io( i ),
    runtime( rt ),
    signals( i, SIGTERM, SIGINT, SIGHUP )
{
    signals.async_wait( std::bind( &EVLoop::on_signal, this, std::placeholders::_1, std::placeholders::_2 ) );
}

void EVLoop::on_signal( const boost::system::error_code &ec, int signal ) {
    if( ec ) {
        return;
    }
    switch( signal ) {
    case SIGTERM:
    case SIGINT:
        interrupted = true;
        runtime.logger->logInfo() << LOGS::MAIN << "Got signal to exit" << std::endl;
        io.stop();
        return;
    case SIGHUP:
        runtime.logger->logInfo() << LOGS::MAIN << "Got signal to reload config" << std::endl;
        runtime.reloadConfig();
    }
    signals.async_wait( std::bind( &EVLoop::on_signal, this, std::placeholders::_1, std::placeholders::_2 ) );
}
