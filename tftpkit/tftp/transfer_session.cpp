/*!
    \file "transfer_session.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/transfer_session.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


transfer_session::statistics::statistics()
    : bytes_transferred(0)
    , data_packets_sent(0)
    , data_packets_received(0)
    , acks_sent(0)
    , retransmits(0)
    , timeouts(0)
{
}


transfer_session::transfer_session(transfer_socket_ptr socket)
    : m_socket(socket)
    , m_state(state_negotiating)
    , mb_tx_window(false)
    , mb_tx_ack(false)
    , mi_tx_index(0)
    , m_after_tx(after_tx_receive)
    , mi_timeout_count(0)
    , m_rx_buffer(TFTP_MAX_DATAGRAM_SIZE + 1) // One spare byte detects oversized datagrams.
    , mi_first_pending_block(1)
    , mb_window_resent(false)
    , mp_sink(nullptr)
    , mi_expected_block(1)
    , mi_blocks_since_ack(0)
    , mb_reacknowledged(false)
{
}


transfer_session::~transfer_session()
{
    m_socket->close();
}


void
transfer_session::abort()
{
    if (finished()) { return; }
    finish(make_error_code(boost::asio::error::operation_aborted));
}


void
transfer_session::send(packet const& value)
{
    set_retransmission(value);
    transmit(after_tx_receive);
}


void
transfer_session::send_error(error_packet const& value, boost::system::error_code const& status)
{
    TRACE("transfer_session::send_error(code=%u, message=\"%s\")\n",
          static_cast<unsigned int>(value.code), value.message.c_str());

    m_pending_status = status;
    set_retransmission(value);
    transmit(after_tx_fail);
}


void
transfer_session::set_retransmission(packet const& value)
{
    mb_tx_window = false;
    mb_tx_ack = TFTP_OPCODE_ACK == opcode_of(value);
    serialize(value, m_tx_control);
}


void
transfer_session::receive_again()
{
    m_after_tx = after_tx_receive;
    receive();
}


void
transfer_session::fail(boost::system::error_code const& status)
{
    finish(status);
}


void
transfer_session::start_sending(std::istream& source)
{
    m_state = state_transferring;
    mp_window.reset(new window(source, m_profile.block_size, m_profile.window_size));
    mi_first_pending_block = 1;
    mb_window_resent = false;
    send_window();
}


void
transfer_session::start_receiving(std::ostream& sink)
{
    m_state = state_transferring;
    mp_sink = &sink;
    mi_expected_block = 1;
    mi_blocks_since_ack = 0;
    mb_reacknowledged = false;
}


void
transfer_session::dispatch(packet const& reply)
{
    if (error_packet const *error = boost::get<error_packet>(&reply))
    {
        // Terminal; never answered.
        m_peer_error = *error;
        finish(peer_error_code(error->code));
        return;
    }

    switch (m_state)
    {
        case state_negotiating:
        {
            on_negotiation_reply(reply);
            break;
        }

        case state_transferring:
        {
            if (mp_window)
            {
                if (ack_packet const *ack = boost::get<ack_packet>(&reply)) { on_ack(*ack); }
                else if (boost::get<oack_packet>(&reply)) { receive_again(); } // Stale.
                else { on_unexpected(reply); }
            }
            else
            {
                if (data_packet const *data = boost::get<data_packet>(&reply)) { on_data(*data); }
                else if (boost::get<oack_packet>(&reply)) { transmit(after_tx_receive, false); } // Our ACK 0 was lost.
                else { on_unexpected(reply); }
            }
            break;
        }

        default:
        {
            break;
        }
    }
}


void
transfer_session::transmit(after_tx_t after_tx, bool new_content)
{
    if (new_content) { mi_timeout_count = 0; }
    m_after_tx = after_tx;
    mi_tx_index = 0;
    send_next_datagram();
}


void
transfer_session::send_next_datagram()
{
    build_datagram(mi_tx_index, m_tx_buffer);
    m_socket->async_send(boost::asio::buffer(m_tx_buffer),
                         boost::bind(&transfer_session::on_tx_complete, shared_from_this(),
                                     boost::asio::placeholders::error,
                                     boost::asio::placeholders::bytes_transferred));
}


void
transfer_session::build_datagram(size_t index, vector<uint8_t>& datagram)
{
    if (!mb_tx_window)
    {
        datagram = m_tx_control;
        return;
    }

    // Blocks past the window's elements are the terminal empty block.
    uint16_t const block = static_cast<uint16_t>(mi_first_pending_block + index);
    window::elements_t const& elements = mp_window->elements();
    serialize(data_packet(block, index < elements.size() ? elements[index] : window::block_t()), datagram);
}


size_t
transfer_session::datagram_count() const
{
    if (!mb_tx_window) { return 1; }
    return mp_window->size() + (mp_window->ends_on_block_boundary() ? 1 : 0);
}


void
transfer_session::receive()
{
    m_socket->async_receive(boost::asio::buffer(m_rx_buffer), m_profile.timeout,
                            boost::bind(&transfer_session::on_rx_complete, shared_from_this(),
                                        boost::asio::placeholders::error,
                                        boost::asio::placeholders::bytes_transferred));
}


void
transfer_session::finish(boost::system::error_code const& status)
{
    if (finished()) { return; }

    TRACE("transfer_session::finish(status=%d=\"%s\")\n", status.value(), status.message().c_str());

    m_status = status;
    m_state = status ? state_failed : state_completed;
    m_socket->close();
    mp_window.reset();
    mp_sink = nullptr;

    on_finished();
}


void
transfer_session::on_tx_complete(boost::system::error_code const& error_code, size_t /*bytes_transferred*/)
{
    if (finished()) { return; }

    if (error_code)
    {
        finish(after_tx_fail == m_after_tx ? m_pending_status : error_code);
        return;
    }

    if (mb_tx_window) { ++m_stats.data_packets_sent; }
    else if (mb_tx_ack) { ++m_stats.acks_sent; }

    if (datagram_count() > ++mi_tx_index)
    {
        send_next_datagram();
        return;
    }

    switch (m_after_tx)
    {
        case after_tx_receive: receive(); break;
        case after_tx_complete: finish(boost::system::error_code()); break;
        case after_tx_fail: finish(m_pending_status); break;
    }
}


void
transfer_session::on_rx_complete(boost::system::error_code const& error_code, size_t bytes_transferred)
{
    if (finished()) { return; }

    if (boost::asio::error::timed_out == error_code)
    {
        on_timeout();
        return;
    }

    if (error_code)
    {
        finish(error_code);
        return;
    }

    packet reply;
    boost::system::error_code decode_error;
    if (TFTP_MAX_DATAGRAM_SIZE < bytes_transferred) { decode_error = make_error_code(malformed_packet); }
    else { deserialize(m_rx_buffer.data(), bytes_transferred, reply, decode_error); }

    if (decode_error)
    {
        send_error(error_packet(error_illegal_operation, decode_error.message()), decode_error);
        return;
    }

    try
    {
        dispatch(reply);
    }
    catch (std::exception const& e)
    {
        tftpkit_log(log_level_error, "transfer with %s failed: %s",
                    m_socket->remote_endpoint().address().to_string().c_str(), e.what());
        if (!finished())
        {
            send_error(error_packet(error_undefined, "internal error"),
                       boost::system::errc::make_error_code(boost::system::errc::io_error));
        }
    }
}


void
transfer_session::on_timeout()
{
    ++m_stats.timeouts;
    if (m_profile.retry_limit < ++mi_timeout_count)
    {
        TRACE("transfer_session::on_timeout(): giving up after %u timeouts\n", mi_timeout_count);
        finish(make_error_code(retries_exhausted));
        return;
    }

    m_stats.retransmits += datagram_count();
    transmit(after_tx_receive, false);
}


void
transfer_session::send_window()
{
    try
    {
        mp_window->fill();
    }
    catch (window::source_read_exception const&)
    {
        send_error(error_packet(error_undefined, "read error"), make_error_code(file_error));
        return;
    }

    mb_tx_window = true;
    transmit(after_tx_receive);
}


void
transfer_session::on_ack(ack_packet const& ack)
{
    if (static_cast<uint16_t>(mi_first_pending_block - 1) == ack.block && 1 < m_profile.window_size &&
        !mb_window_resent)
    {
        // The receiver repeats its last ACK when the first block of the window is lost; resend at once.
        mb_window_resent = true;
        m_stats.retransmits += datagram_count();
        transmit(after_tx_receive, false);
        return;
    }

    size_t const pending = datagram_count();
    size_t const offset = static_cast<uint16_t>(ack.block - mi_first_pending_block);
    if (pending <= offset)
    {
        // Outside the window, e.g. a duplicate of an earlier ACK.
        TRACE("transfer_session::on_ack(): stale ACK %u\n", static_cast<unsigned int>(ack.block));
        receive_again();
        return;
    }

    // ACK n covers every block up to n; the rest of the window is resent from n + 1.
    size_t const acknowledged = offset + 1;
    window::elements_t const& elements = mp_window->elements();
    for (size_t i = 0; (std::min)(acknowledged, elements.size()) > i; ++i)
    {
        m_stats.bytes_transferred += elements[i].size();
    }

    bool const final_block_acknowledged = mp_window->end_reached() && pending == acknowledged;
    mp_window->consume(acknowledged);
    mi_first_pending_block = static_cast<uint16_t>(mi_first_pending_block + acknowledged);
    mb_window_resent = false;

    if (final_block_acknowledged)
    {
        finish(boost::system::error_code());
        return;
    }
    send_window();
}


void
transfer_session::on_data(data_packet const& data)
{
    ++m_stats.data_packets_received;

    if (m_profile.block_size < data.payload.size())
    {
        send_error(error_packet(error_illegal_operation, "block larger than negotiated"),
                   make_error_code(unexpected_packet));
        return;
    }

    if (mi_expected_block != data.block)
    {
        // Duplicate or out of order: never written; the last accepted block is acknowledged once per gap.
        TRACE("transfer_session::on_data(): expected block %u, got %u\n",
              static_cast<unsigned int>(mi_expected_block), static_cast<unsigned int>(data.block));
        mi_blocks_since_ack = 0;
        if (mb_reacknowledged)
        {
            receive_again();
            return;
        }
        mb_reacknowledged = true;
        transmit(after_tx_receive, false);
        return;
    }

    if (!data.payload.empty())
    {
        mp_sink->write(reinterpret_cast<char const *>(data.payload.data()),
                       static_cast<std::streamsize>(data.payload.size()));
    }
    bool const final_block = m_profile.block_size > data.payload.size();
    if (final_block) { mp_sink->flush(); }
    if (!mp_sink->good())
    {
        send_error(error_packet(error_disk_full, "write failed"), make_error_code(file_error));
        return;
    }

    m_stats.bytes_transferred += data.payload.size();
    mb_reacknowledged = false;
    mi_timeout_count = 0;
    set_retransmission(ack_packet(mi_expected_block));
    ++mi_expected_block;

    if (final_block)
    {
        transmit(after_tx_complete);
    }
    else if (m_profile.window_size <= ++mi_blocks_since_ack)
    {
        mi_blocks_since_ack = 0;
        transmit(after_tx_receive);
    }
    else
    {
        receive_again();
    }
}


void
transfer_session::on_unexpected(packet const& value)
{
    string message("unexpected ");
    message += opcode_name(opcode_of(value));
    send_error(error_packet(error_illegal_operation, message), make_error_code(unexpected_packet));
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "transfer_session.cpp"
*/
