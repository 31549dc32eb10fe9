/*!
    \file "asio_udp_receiver.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef ASIO_UDP_RECEIVER_HPP__4F4F49BA_5196_42A2_AB0A_49547671B72D__INCLUDED
#define ASIO_UDP_RECEIVER_HPP__4F4F49BA_5196_42A2_AB0A_49547671B72D__INCLUDED


#pragma once


#include <tftpkit/net/net_env.hpp>


namespace tftpkit {
namespace net {


/**
 * Receives one datagram from a UDP socket, giving up after a timeout.
 *
 * When no datagram arrives in time the pending receive is cancelled and the completion handler is invoked with
 * boost::asio::error::timed_out.  The handler is always invoked exactly once per receive.
 *
 * The receiver does not own the socket.  The socket must outlive every receive started on it, which holds
 * naturally when the completion handler keeps the socket's owner alive.
 */
class asio_udp_receiver
    : public boost::noncopyable
{
public:
    DECLARE_EXCEPTION(asio_udp_receiver_exception, "udp receiver error");
    DECLARE_EXCEPTION(socket_not_set_exception, "udp receiver has no socket", asio_udp_receiver_exception);

    typedef boost::function<void (boost::system::error_code const&, size_t)> completion_handler_t;

public:
    void set_socket(udp::socket& socket) { mp_socket = &socket; }

    void async_receive(uint8_t *data, size_t capacity, boost::posix_time::time_duration timeout,
                       completion_handler_t handler);

    void async_receive_from(uint8_t *data, size_t capacity, boost::posix_time::time_duration timeout,
                            udp::endpoint& sender_endpoint, completion_handler_t handler);

    explicit asio_udp_receiver(io_service& io_service);
    ~asio_udp_receiver();

private:
    struct rx_operation;
    typedef shared_ptr<rx_operation> rx_operation_ptr;

    rx_operation_ptr start_operation(boost::posix_time::time_duration timeout);

    static void on_timer_expired(rx_operation_ptr operation, boost::system::error_code const& error_code);
    static void on_rx_complete(rx_operation_ptr operation, boost::system::error_code const& error_code,
                               size_t bytes_transferred, completion_handler_t handler);

private:
    io_service& m_io_service;
    udp::socket *mp_socket;
};


} // namespace net {
} // namespace tftpkit {


#endif // #ifndef ASIO_UDP_RECEIVER_HPP__4F4F49BA_5196_42A2_AB0A_49547671B72D__INCLUDED


/*
    End of "asio_udp_receiver.hpp"
*/
