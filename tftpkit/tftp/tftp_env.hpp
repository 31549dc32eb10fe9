/*!
    \file "tftp_env.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TFTP_ENV_HPP__E79EC6E9_9CCA_4671_9C15_949AB4C45659__INCLUDED
#define TFTP_ENV_HPP__E79EC6E9_9CCA_4671_9C15_949AB4C45659__INCLUDED


#pragma once


#include <tftpkit/tftpkit_env.hpp>
#include <tftpkit/net/net_env.hpp>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion" // Prevent "implicit conversion loses integer precision" warning.
#include <boost/asio/io_service.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/placeholders.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/signals2/signal.hpp>
#pragma GCC diagnostic pop


namespace tftpkit {
namespace tftp {


using boost::asio::deadline_timer;
using boost::asio::ip::udp;
using boost::asio::io_service;
using boost::posix_time::time_duration;


unsigned short constexpr TFTP_DEFAULT_PORT = 69; // Well-known server port.

size_t constexpr TFTP_DEFAULT_BLOCK_SIZE = 512; // RFC 1350.
size_t constexpr TFTP_MIN_BLOCK_SIZE = 8; // RFC 2348.
size_t constexpr TFTP_MAX_BLOCK_SIZE = 65464; // RFC 2348.
size_t constexpr TFTP_DEFAULT_WINDOW_SIZE = 1; // RFC 7440.
size_t constexpr TFTP_MAX_WINDOW_SIZE = 65535; // RFC 7440.
unsigned int constexpr TFTP_MIN_TIMEOUT_IN_SECONDS = 1; // RFC 2349.
unsigned int constexpr TFTP_MAX_TIMEOUT_IN_SECONDS = 255; // RFC 2349.
unsigned int constexpr TFTP_DEFAULT_TIMEOUT_IN_SECONDS = 5;
unsigned int constexpr TFTP_DEFAULT_RETRY_LIMIT = 5;

size_t constexpr TFTP_DATA_HEADER_SIZE = 4; // opcode + block number.
size_t constexpr TFTP_MAX_DATAGRAM_SIZE = TFTP_MAX_BLOCK_SIZE + TFTP_DATA_HEADER_SIZE;


inline void tftp_nop(...) {}


#ifdef DEBUG

inline void tftp_trace(char const *format, ...)
{
    va_list args;
    va_start(args, format);
    tftpkit_vtrace(format, args);
    va_end(args);
}

#else // #ifdef DEBUG

inline void tftp_trace(char const *, ...) {}

#endif // #ifdef DEBUG


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TFTP_ENV_HPP__E79EC6E9_9CCA_4671_9C15_949AB4C45659__INCLUDED


/*
    End of "tftp_env.hpp"
*/
