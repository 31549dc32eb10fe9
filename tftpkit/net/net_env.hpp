/*!
    \file "net_env.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef NET_ENV_HPP__E8ABEB02_AA56_4288_BB45_9E8EA0CF19B3__INCLUDED
#define NET_ENV_HPP__E8ABEB02_AA56_4288_BB45_9E8EA0CF19B3__INCLUDED


#pragma once


#include <tftpkit/tftpkit_env.hpp>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion" // Prevent "implicit conversion loses integer precision" warning.
#include <boost/asio/io_service.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/placeholders.hpp>
#include <boost/bind/bind.hpp>
#include <boost/function.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#pragma GCC diagnostic pop


namespace tftpkit {
namespace net {


using boost::asio::deadline_timer;
using boost::asio::ip::udp;
using boost::asio::io_service;


inline void net_nop(...) {}


#ifdef DEBUG

inline void net_trace(char const *format, ...)
{
    va_list args;
    va_start(args, format);
    tftpkit_vtrace(format, args);
    va_end(args);
}

#else // #ifdef DEBUG

inline void net_trace(char const *, ...) {}

#endif // #ifdef DEBUG


} // namespace net {
} // namespace tftpkit {


#endif // #ifndef NET_ENV_HPP__E8ABEB02_AA56_4288_BB45_9E8EA0CF19B3__INCLUDED


/*
    End of "net_env.hpp"
*/
