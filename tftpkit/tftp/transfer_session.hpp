/*!
    \file "transfer_session.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TRANSFER_SESSION_HPP__2B9E6F31_D0C4_4A57_8E13_5F6A7B8C9D02__INCLUDED
#define TRANSFER_SESSION_HPP__2B9E6F31_D0C4_4A57_8E13_5F6A7B8C9D02__INCLUDED


#pragma once


#include <istream>
#include <ostream>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/packet.hpp>
#include <tftpkit/tftp/options.hpp>
#include <tftpkit/tftp/window.hpp>
#include <tftpkit/tftp/transfer_socket.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Windowed send/receive engine of one transfer, shared by the server's workers and the client.
 *
 * The session owns the transfer socket.  Every datagram it sends is followed either by a receive with the
 * negotiated timeout or by the end of the transfer.  A timeout retransmits what was last sent; more than
 * retry_limit consecutive timeouts fail the transfer with retries_exhausted.  With a window larger than one
 * block, an ACK for the block before the window resends the window at once, once per window position.  An ERROR
 * from the peer ends the transfer and is never answered.  A malformed or unexpected datagram is answered with
 * ERROR 4 and fails the transfer.
 *
 * Derived classes implement the request/option handshake (on_negotiation_reply()), then hand over to
 * start_sending() or start_receiving().  All handlers keep the session alive through shared_from_this(), so a
 * session lives until its last pending operation completes.  Not thread safe; run on one io_service thread.
 */
class transfer_session
    : public boost::noncopyable
    , public enable_shared_from_this<transfer_session>
{
public:
    enum state_t
    {
        state_negotiating,
        state_transferring,
        state_completed,
        state_failed
    };

    struct statistics
    {
        uint64_t bytes_transferred; // Payload bytes sent or written.
        uint64_t data_packets_sent;
        uint64_t data_packets_received;
        uint64_t acks_sent;
        uint64_t retransmits; // Datagrams sent again after a timeout.
        uint64_t timeouts;

        statistics();
    };

public:
    state_t state() const { return m_state; }
    bool finished() const { return state_completed == m_state || state_failed == m_state; }

    /// Success once completed; the reason of the failure otherwise.
    boost::system::error_code status() const { return m_status; }

    /// The ERROR packet that ended the transfer, if the peer sent one.
    boost::optional<error_packet> const& peer_error() const { return m_peer_error; }

    transfer_profile const& profile() const { return m_profile; }
    statistics const& stats() const { return m_stats; }
    udp::endpoint remote_endpoint() const { return m_socket->remote_endpoint(); }

    /// Ends the transfer with boost::asio::error::operation_aborted, without notifying the peer.
    void abort();

    virtual ~transfer_session();

protected:
    explicit transfer_session(transfer_socket_ptr socket);

    /// A reply received while state() == state_negotiating (ERROR packets are handled by the session).
    virtual void on_negotiation_reply(packet const& reply) = 0;

    /// Called once, after the state became completed or failed and the socket was closed.
    virtual void on_finished() = 0;

    transfer_socket& socket() { return *m_socket; }
    void set_profile(transfer_profile const& profile) { m_profile = profile; }

    void send(packet const& value); //!< Sends 'value', then waits for the reply.
    void send_error(error_packet const& value, boost::system::error_code const& status); //!< Then fails.
    void set_retransmission(packet const& value); //!< What a timeout resends, without sending it now.
    void receive_again(); //!< Waits for another datagram; a timeout resends the current datagrams.
    void fail(boost::system::error_code const& status); //!< Ends the transfer without notifying the peer.

    /// Enters state_transferring as the sender; DATA 1 is sent at once.
    void start_sending(std::istream& source);

    /// Enters state_transferring as the receiver, expecting DATA 1.  Nothing is sent.
    void start_receiving(std::ostream& sink);

    /// Processes a reply as if it had been received in the current state.
    void dispatch(packet const& reply);

private:
    enum after_tx_t
    {
        after_tx_receive,
        after_tx_complete,
        after_tx_fail
    };

    void transmit(after_tx_t after_tx, bool new_content = true);
    void send_next_datagram();
    void build_datagram(size_t index, vector<uint8_t>& datagram);
    size_t datagram_count() const;
    void receive();
    void finish(boost::system::error_code const& status);

    void on_tx_complete(boost::system::error_code const& error_code, size_t bytes_transferred);
    void on_rx_complete(boost::system::error_code const& error_code, size_t bytes_transferred);
    void on_timeout();

    void send_window();
    void on_ack(ack_packet const& ack);
    void on_data(data_packet const& data);
    void on_unexpected(packet const& value);

private:
    transfer_socket_ptr m_socket;
    state_t m_state;
    boost::system::error_code m_status;
    boost::system::error_code m_pending_status; // Reported once a final ERROR has been sent.
    boost::optional<error_packet> m_peer_error;
    transfer_profile m_profile;
    statistics m_stats;

    // Transmission: either one control datagram or the DATA blocks held by the window.
    vector<uint8_t> m_tx_control;
    bool mb_tx_window;
    bool mb_tx_ack;
    vector<uint8_t> m_tx_buffer;
    size_t mi_tx_index;
    after_tx_t m_after_tx;
    unsigned int mi_timeout_count;
    vector<uint8_t> m_rx_buffer;

    // Sender.
    unique_ptr<window> mp_window;
    uint16_t mi_first_pending_block;
    bool mb_window_resent; // Resent early for the current window position.

    // Receiver.
    std::ostream *mp_sink;
    uint16_t mi_expected_block;
    size_t mi_blocks_since_ack;
    bool mb_reacknowledged;
};

typedef shared_ptr<transfer_session> transfer_session_ptr;


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TRANSFER_SESSION_HPP__2B9E6F31_D0C4_4A57_8E13_5F6A7B8C9D02__INCLUDED


/*
    End of "transfer_session.hpp"
*/
