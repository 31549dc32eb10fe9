/*!
    \file "tftp_server.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TFTP_SERVER_HPP__6B1C2D3E_4F50_4617_8283_94A5B6C7D8E9__INCLUDED
#define TFTP_SERVER_HPP__6B1C2D3E_4F50_4617_8283_94A5B6C7D8E9__INCLUDED


#pragma once


#include <map>
#include <tftpkit/sync_domain_provider.hpp>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/server_config.hpp>
#include <tftpkit/tftp/shared_port_socket.hpp>
#include <tftpkit/tftp/transfer_worker.hpp>


namespace tftpkit {
namespace tftp {


/**
 * TFTP server based on boost asio.
 *
 * Listens for RRQ/WRQ and hands each accepted request to its own transfer_worker.  In multi-port mode each
 * worker gets a fresh ephemeral socket; in single-port mode workers share the listening socket and the
 * datagrams of their peers are routed to them by address.  A request from a peer whose transfer is still in
 * progress is a retransmission and is dropped in both modes.  Anything else arriving on the listening socket is
 * dropped.
 *
 * Workers report to the server when they end, so the server must outlive the runs of its io_service.
 */
class tftp_server
    : public boost::noncopyable
    , public sync_domain_provider
{
public:
    DECLARE_EXCEPTION(tftp_server_exception, "tftp server error");
    DECLARE_EXCEPTION(already_started_exception, "tftp server already started", tftp_server_exception);

    typedef boost::signals2::connection connection_t;
    typedef boost::signals2::signal<void (transfer_summary const& summary)> transfer_complete_signal_t;

public:
    void startup(); //!< Binds the listening socket; throws configuration_exception or boost::system::system_error.
    void shutdown(); //!< Stops listening.  Transfers in progress run to completion (multi-port mode).

    bool is_started() const;
    udp::endpoint local_endpoint() const;
    size_t active_transfer_count() const;
    server_config const& config() const { return m_config; }

    connection_t subscribe_to_transfer_complete(transfer_complete_signal_t::slot_type const& subscriber)
    {
        return m_transfer_complete_publisher.connect(subscriber);
    }

    tftp_server(io_service& io_service, server_config const& config, lock_type *sync_domain_lock = nullptr);
    virtual ~tftp_server();

private:
    void start_receive();
    void on_async_rx_complete(boost::system::error_code const& error_code, size_t bytes_transferred);
    void handle_request(udp::endpoint const& peer, transfer_request request);
    bool has_active_worker(udp::endpoint const& peer) const;
    void send_error(udp::endpoint const& peer, boost::system::error_code const& code);
    void on_transfer_complete(transfer_summary const& summary);

    static void on_error_sent(shared_ptr<vector<uint8_t> > datagram, boost::system::error_code const& error_code);

private:
    io_service& m_io_service;
    server_config const m_config;
    file_policy const m_policy;
    negotiation_limits const m_limits;
    shared_ptr<udp::socket> mp_listener;
    peer_demultiplexer_ptr mp_demultiplexer;
    std::map<udp::endpoint, weak_ptr<transfer_worker> > m_workers; // Multi-port transfers in progress, by peer.
    udp::endpoint m_rx_endpoint;
    vector<uint8_t> m_rx_buffer;
    size_t mi_active_transfers;
    transfer_complete_signal_t m_transfer_complete_publisher;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TFTP_SERVER_HPP__6B1C2D3E_4F50_4617_8283_94A5B6C7D8E9__INCLUDED


/*
    End of "tftp_server.hpp"
*/
