/*!
    \file "shared_port_socket.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/shared_port_socket.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


void
peer_demultiplexer::attach(udp::endpoint const& peer_endpoint, weak_ptr<shared_port_socket> socket)
{
    m_sockets[peer_endpoint] = socket;
}


void
peer_demultiplexer::detach(udp::endpoint const& peer_endpoint)
{
    m_sockets.erase(peer_endpoint);
}


bool
peer_demultiplexer::contains(udp::endpoint const& peer_endpoint) const
{
    socket_map_t::const_iterator iter = m_sockets.find(peer_endpoint);
    return m_sockets.end() != iter && !iter->second.expired();
}


bool
peer_demultiplexer::deliver(udp::endpoint const& peer_endpoint, uint8_t const *data, size_t size)
{
    socket_map_t::iterator iter = m_sockets.find(peer_endpoint);
    if (m_sockets.end() == iter) { return false; }

    shared_ptr<shared_port_socket> socket = iter->second.lock();
    if (!socket)
    {
        m_sockets.erase(iter);
        return false;
    }

    socket->deliver(data, size);
    return true;
}


size_t constexpr shared_port_socket::inbox_capacity;


shared_ptr<shared_port_socket>
shared_port_socket::create(io_service& io_service, shared_ptr<udp::socket> listener,
                           udp::endpoint const& peer_endpoint, peer_demultiplexer_ptr demultiplexer)
{
    shared_ptr<shared_port_socket> socket(new shared_port_socket(io_service, listener, peer_endpoint,
                                                                 demultiplexer));
    demultiplexer->attach(peer_endpoint, socket);
    return socket;
}


shared_port_socket::shared_port_socket(io_service& io_service, shared_ptr<udp::socket> listener,
                                       udp::endpoint const& peer_endpoint, peer_demultiplexer_ptr demultiplexer)
    : m_io_service(io_service)
    , m_listener(listener)
    , m_peer_endpoint(peer_endpoint)
    , m_demultiplexer(demultiplexer)
    , m_rx_timer(io_service)
    , mi_rx_generation(0)
    , mb_rx_pending(false)
    , mb_closed(false)
{
}


shared_port_socket::~shared_port_socket()
{
    if (!mb_closed) { m_demultiplexer->detach(m_peer_endpoint); }
}


void
shared_port_socket::async_send(boost::asio::const_buffer datagram, completion_handler_t handler)
{
    if (mb_closed || !m_listener->is_open())
    {
        m_io_service.post(boost::bind(handler, make_error_code(boost::asio::error::bad_descriptor),
                                      static_cast<size_t>(0)));
        return;
    }
    m_listener->async_send_to(boost::asio::buffer(datagram), m_peer_endpoint, handler);
}


void
shared_port_socket::async_receive(boost::asio::mutable_buffer buffer, time_duration timeout,
                                  completion_handler_t handler)
{
    m_rx_buffer = buffer;
    m_rx_handler = handler;
    mb_rx_pending = true;
    ++mi_rx_generation;

    if (mb_closed)
    {
        complete_receive(make_error_code(boost::asio::error::operation_aborted), 0);
        return;
    }

    if (!m_inbox.empty())
    {
        vector<uint8_t> datagram(move(m_inbox.front()));
        m_inbox.pop_front();
        size_t const size = boost::asio::buffer_copy(m_rx_buffer, boost::asio::buffer(datagram));
        complete_receive(boost::system::error_code(), size);
        return;
    }

    m_rx_timer.expires_from_now(timeout);
    m_rx_timer.async_wait(boost::bind(&shared_port_socket::on_rx_timer_expired, shared_from_this(),
                                      mi_rx_generation, boost::asio::placeholders::error));
}


void
shared_port_socket::deliver(uint8_t const *data, size_t size)
{
    if (mb_closed) { return; }

    if (mb_rx_pending)
    {
        size_t const copied = boost::asio::buffer_copy(m_rx_buffer, boost::asio::buffer(data, size));
        complete_receive(boost::system::error_code(), copied);
        return;
    }

    if (inbox_capacity <= m_inbox.size())
    {
        TRACE("shared_port_socket::deliver(): inbox full, dropping datagram from %s\n",
              m_peer_endpoint.address().to_string().c_str());
        return;
    }
    m_inbox.push_back(vector<uint8_t>(data, data + size));
}


void
shared_port_socket::close()
{
    if (mb_closed) { return; }

    mb_closed = true;
    m_inbox.clear();
    m_demultiplexer->detach(m_peer_endpoint);
    if (mb_rx_pending) { complete_receive(make_error_code(boost::asio::error::operation_aborted), 0); }
}


void
shared_port_socket::complete_receive(boost::system::error_code const& error_code, size_t bytes_transferred)
{
    mb_rx_pending = false;
    ++mi_rx_generation;

    boost::system::error_code ignored;
    m_rx_timer.cancel(ignored);

    completion_handler_t handler;
    handler.swap(m_rx_handler);
    m_io_service.post(boost::bind(handler, error_code, bytes_transferred));
}


void
shared_port_socket::on_rx_timer_expired(unsigned int generation, boost::system::error_code const& error_code)
{
    if (boost::asio::error::operation_aborted == error_code || !mb_rx_pending || generation != mi_rx_generation)
    {
        return;
    }
    complete_receive(make_error_code(boost::asio::error::timed_out), 0);
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "shared_port_socket.cpp"
*/
