/*!
    \file "transfer_socket.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/transfer_socket.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


point_to_point_socket::point_to_point_socket(io_service& io_service, udp::endpoint const& local_endpoint,
                                             udp::endpoint const& peer_endpoint, peer_binding binding)
    : m_io_service(io_service)
    , m_socket(io_service)
    , m_receiver(io_service)
    , m_peer_endpoint(peer_endpoint)
    , mb_connected(false)
{
    m_socket.open(peer_endpoint.protocol());
    m_socket.bind(local_endpoint);
    if (bind_immediately == binding)
    {
        m_socket.connect(peer_endpoint);
        mb_connected = true;
    }
    m_receiver.set_socket(m_socket);
}


point_to_point_socket::~point_to_point_socket()
{
    close();
}


udp::endpoint
point_to_point_socket::local_endpoint() const
{
    boost::system::error_code error_code;
    udp::endpoint const endpoint = m_socket.local_endpoint(error_code);
    return error_code ? udp::endpoint() : endpoint;
}


void
point_to_point_socket::close()
{
    if (!m_socket.is_open()) { return; }

    boost::system::error_code error_code;
    m_socket.close(error_code);
    if (error_code)
    {
        tftpkit_log(log_level_warning, "closing transfer socket: %s", error_code.message().c_str());
    }
}


void
point_to_point_socket::async_send(boost::asio::const_buffer datagram, completion_handler_t handler)
{
    if (mb_connected)
    {
        m_socket.async_send(boost::asio::buffer(datagram), handler);
    }
    else
    {
        m_socket.async_send_to(boost::asio::buffer(datagram), m_peer_endpoint, handler);
    }
}


void
point_to_point_socket::async_receive(boost::asio::mutable_buffer buffer, time_duration timeout,
                                     completion_handler_t handler)
{
    uint8_t *const data = boost::asio::buffer_cast<uint8_t *>(buffer);
    size_t const capacity = boost::asio::buffer_size(buffer);

    if (mb_connected)
    {
        m_receiver.async_receive(data, capacity, timeout, handler);
    }
    else
    {
        receive_first_reply(buffer, boost::posix_time::microsec_clock::universal_time() + timeout, handler);
    }
}


void
point_to_point_socket::receive_first_reply(boost::asio::mutable_buffer buffer, boost::posix_time::ptime deadline,
                                           completion_handler_t handler)
{
    time_duration const remaining = deadline - boost::posix_time::microsec_clock::universal_time();
    m_receiver.async_receive_from(boost::asio::buffer_cast<uint8_t *>(buffer), boost::asio::buffer_size(buffer),
                                  remaining.is_negative() ? time_duration(0, 0, 0) : remaining, m_sender_endpoint,
                                  boost::bind(&point_to_point_socket::on_first_reply, this,
                                              boost::asio::placeholders::error,
                                              boost::asio::placeholders::bytes_transferred,
                                              buffer, deadline, handler));
}


void
point_to_point_socket::on_first_reply(boost::system::error_code const& error_code, size_t bytes_transferred,
                                      boost::asio::mutable_buffer buffer, boost::posix_time::ptime deadline,
                                      completion_handler_t handler)
{
    if (error_code)
    {
        handler(error_code, bytes_transferred);
        return;
    }

    if (m_sender_endpoint.address() != m_peer_endpoint.address())
    {
        // Datagrams from other hosts do not extend the timeout of this receive.
        TRACE("point_to_point_socket::on_first_reply(): ignoring datagram from %s\n",
              m_sender_endpoint.address().to_string().c_str());
        receive_first_reply(buffer, deadline, handler);
        return;
    }

    // The reply's source port is the peer's transfer identifier from now on.
    m_peer_endpoint = m_sender_endpoint;
    boost::system::error_code connect_error;
    m_socket.connect(m_peer_endpoint, connect_error);
    if (connect_error)
    {
        handler(connect_error, 0);
        return;
    }
    mb_connected = true;

    handler(error_code, bytes_transferred);
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "transfer_socket.cpp"
*/
