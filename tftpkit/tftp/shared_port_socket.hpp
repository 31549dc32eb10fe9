/*!
    \file "shared_port_socket.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    Single-port mode: every transfer talks through the server's listening socket.
*/


#ifndef SHARED_PORT_SOCKET_HPP__5A2F6B18_94C7_4E3D_B0E1_7C8D2F6A9B40__INCLUDED
#define SHARED_PORT_SOCKET_HPP__5A2F6B18_94C7_4E3D_B0E1_7C8D2F6A9B40__INCLUDED


#pragma once


#include <deque>
#include <map>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/transfer_socket.hpp>


namespace tftpkit {
namespace tftp {


class shared_port_socket;


/**
 * Routes datagrams received on the shared listening socket to the transfer of their sender.
 */
class peer_demultiplexer
    : public boost::noncopyable
{
public:
    void attach(udp::endpoint const& peer_endpoint, weak_ptr<shared_port_socket> socket);
    void detach(udp::endpoint const& peer_endpoint);

    bool contains(udp::endpoint const& peer_endpoint) const;
    size_t size() const { return m_sockets.size(); }

    /// Returns false when no transfer is attached for 'peer_endpoint'.
    bool deliver(udp::endpoint const& peer_endpoint, uint8_t const *data, size_t size);

private:
    typedef std::map<udp::endpoint, weak_ptr<shared_port_socket> > socket_map_t;
    socket_map_t m_sockets;
};

typedef shared_ptr<peer_demultiplexer> peer_demultiplexer_ptr;


/**
 * Transfer socket whose sends go through the shared listener and whose receives are fed by the demultiplexer.
 *
 * At most inbox_capacity datagrams are queued while no receive is pending; further datagrams are dropped
 * (the peer retransmits).
 */
class shared_port_socket
    : public transfer_socket
    , public enable_shared_from_this<shared_port_socket>
{
public:
    static size_t constexpr inbox_capacity = 16;

    static shared_ptr<shared_port_socket> create(io_service& io_service, shared_ptr<udp::socket> listener,
                                                 udp::endpoint const& peer_endpoint,
                                                 peer_demultiplexer_ptr demultiplexer);

public:
    void async_send(boost::asio::const_buffer datagram, completion_handler_t handler);
    void async_receive(boost::asio::mutable_buffer buffer, time_duration timeout, completion_handler_t handler);

    udp::endpoint remote_endpoint() const { return m_peer_endpoint; }
    bool is_open() const { return !mb_closed; }
    void close();

    void deliver(uint8_t const *data, size_t size); //!< Called by the demultiplexer.

    ~shared_port_socket();

private:
    shared_port_socket(io_service& io_service, shared_ptr<udp::socket> listener,
                       udp::endpoint const& peer_endpoint, peer_demultiplexer_ptr demultiplexer);

    void complete_receive(boost::system::error_code const& error_code, size_t bytes_transferred);
    void on_rx_timer_expired(unsigned int generation, boost::system::error_code const& error_code);

private:
    io_service& m_io_service;
    shared_ptr<udp::socket> m_listener;
    udp::endpoint const m_peer_endpoint;
    peer_demultiplexer_ptr m_demultiplexer;
    std::deque<vector<uint8_t> > m_inbox;
    deadline_timer m_rx_timer;
    boost::asio::mutable_buffer m_rx_buffer;
    completion_handler_t m_rx_handler;
    unsigned int mi_rx_generation; // Identifies the pending receive; stale timer expirations are ignored.
    bool mb_rx_pending;
    bool mb_closed;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef SHARED_PORT_SOCKET_HPP__5A2F6B18_94C7_4E3D_B0E1_7C8D2F6A9B40__INCLUDED


/*
    End of "shared_port_socket.hpp"
*/
