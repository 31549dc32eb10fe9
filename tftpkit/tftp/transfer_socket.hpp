/*!
    \file "transfer_socket.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TRANSFER_SOCKET_HPP__7E1D2C53_3B0A_4B69_8F55_21A9E3C0D6F4__INCLUDED
#define TRANSFER_SOCKET_HPP__7E1D2C53_3B0A_4B69_8F55_21A9E3C0D6F4__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/net/asio_udp_receiver.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Datagram channel to the one peer of a transfer.
 *
 * Every receive carries a timeout; a receive that sees no datagram in time completes with
 * boost::asio::error::timed_out.  Completion handlers are never invoked from within the initiating call.
 */
class transfer_socket
    : public boost::noncopyable
{
public:
    typedef boost::function<void (boost::system::error_code const&, size_t)> completion_handler_t;

public:
    virtual void async_send(boost::asio::const_buffer datagram, completion_handler_t handler) = 0;
    virtual void async_receive(boost::asio::mutable_buffer buffer, time_duration timeout,
                               completion_handler_t handler) = 0;

    virtual udp::endpoint remote_endpoint() const = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0; //!< Pending operations complete with boost::asio::error::operation_aborted.

    virtual ~transfer_socket() {}
};

typedef shared_ptr<transfer_socket> transfer_socket_ptr;


/**
 * A UDP socket of its own for one transfer.
 *
 * bind_immediately: the socket is connected to the peer at construction (server side, fresh ephemeral port).
 * bind_on_first_reply: datagrams go to the peer's well-known port until the first reply arrives; the socket is
 * then connected to the reply's source, which becomes the peer (client side).  Replies from other hosts are
 * ignored and do not extend the timeout.
 */
class point_to_point_socket
    : public transfer_socket
{
public:
    enum peer_binding
    {
        bind_immediately,
        bind_on_first_reply
    };

public:
    void async_send(boost::asio::const_buffer datagram, completion_handler_t handler);
    void async_receive(boost::asio::mutable_buffer buffer, time_duration timeout, completion_handler_t handler);

    udp::endpoint remote_endpoint() const { return m_peer_endpoint; }
    udp::endpoint local_endpoint() const;
    bool is_open() const { return m_socket.is_open(); }
    void close();

    point_to_point_socket(io_service& io_service, udp::endpoint const& local_endpoint,
                          udp::endpoint const& peer_endpoint, peer_binding binding);
    ~point_to_point_socket();

private:
    void receive_first_reply(boost::asio::mutable_buffer buffer, boost::posix_time::ptime deadline,
                             completion_handler_t handler);
    void on_first_reply(boost::system::error_code const& error_code, size_t bytes_transferred,
                        boost::asio::mutable_buffer buffer, boost::posix_time::ptime deadline,
                        completion_handler_t handler);

private:
    io_service& m_io_service;
    udp::socket m_socket;
    net::asio_udp_receiver m_receiver;
    udp::endpoint m_peer_endpoint;
    udp::endpoint m_sender_endpoint;
    bool mb_connected;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TRANSFER_SOCKET_HPP__7E1D2C53_3B0A_4B69_8F55_21A9E3C0D6F4__INCLUDED


/*
    End of "transfer_socket.hpp"
*/
