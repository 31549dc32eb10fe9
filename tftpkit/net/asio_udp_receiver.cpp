/*!
    \file "asio_udp_receiver.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/net/net_env.hpp>
#include <tftpkit/net/asio_udp_receiver.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE net_trace
#else
    #define TRACE net_nop
#endif


namespace tftpkit {
namespace net {


/*
    State of one receive.  It is shared by the receive completion and the timer completion so that
    whichever runs last does not touch the receiver (which may already be gone).
*/
struct asio_udp_receiver::rx_operation
{
    rx_operation(io_service& io_service, udp::socket& socket)
        : m_timer(io_service), mp_socket(&socket), mb_completed(false), mb_timed_out(false) {}

    deadline_timer m_timer;
    udp::socket *mp_socket;
    bool mb_completed;
    bool mb_timed_out;
};


void
asio_udp_receiver::async_receive(uint8_t *data, size_t capacity, boost::posix_time::time_duration timeout,
                                 completion_handler_t handler)
{
    TRACE("asio_udp_receiver::async_receive(capacity=%u, timeout=%ld ms)\n",
          static_cast<unsigned int>(capacity), static_cast<long>(timeout.total_milliseconds()));

    rx_operation_ptr operation(start_operation(timeout));
    mp_socket->async_receive(boost::asio::buffer(data, capacity),
                             boost::bind(&asio_udp_receiver::on_rx_complete, operation,
                                         boost::asio::placeholders::error,
                                         boost::asio::placeholders::bytes_transferred,
                                         handler));
}


void
asio_udp_receiver::async_receive_from(uint8_t *data, size_t capacity, boost::posix_time::time_duration timeout,
                                      udp::endpoint& sender_endpoint, completion_handler_t handler)
{
    TRACE("asio_udp_receiver::async_receive_from(capacity=%u, timeout=%ld ms)\n",
          static_cast<unsigned int>(capacity), static_cast<long>(timeout.total_milliseconds()));

    rx_operation_ptr operation(start_operation(timeout));
    mp_socket->async_receive_from(boost::asio::buffer(data, capacity), sender_endpoint,
                                  boost::bind(&asio_udp_receiver::on_rx_complete, operation,
                                              boost::asio::placeholders::error,
                                              boost::asio::placeholders::bytes_transferred,
                                              handler));
}


asio_udp_receiver::rx_operation_ptr
asio_udp_receiver::start_operation(boost::posix_time::time_duration timeout)
{
    if (nullptr == mp_socket) { throw socket_not_set_exception(); }

    rx_operation_ptr operation(make_shared<rx_operation>(m_io_service, *mp_socket));
    operation->m_timer.expires_from_now(timeout);
    operation->m_timer.async_wait(boost::bind(&asio_udp_receiver::on_timer_expired, operation,
                                              boost::asio::placeholders::error));
    return operation;
}


void
asio_udp_receiver::on_timer_expired(rx_operation_ptr operation, boost::system::error_code const& error_code)
{
    // The receive finished first (or the timer was cancelled); nothing to do.
    if (operation->mb_completed || boost::asio::error::operation_aborted == error_code) { return; }

    TRACE("asio_udp_receiver::on_timer_expired(): cancelling receive.\n");

    operation->mb_timed_out = true;
    boost::system::error_code ignored;
    operation->mp_socket->cancel(ignored);
}


void
asio_udp_receiver::on_rx_complete(rx_operation_ptr operation, boost::system::error_code const& error_code,
                                  size_t bytes_transferred, completion_handler_t handler)
{
    operation->mb_completed = true;
    boost::system::error_code ignored;
    operation->m_timer.cancel(ignored);

    // A receive aborted by the timer is reported as a timeout, not as a cancellation.
    if (operation->mb_timed_out && boost::asio::error::operation_aborted == error_code)
    {
        handler(make_error_code(boost::asio::error::timed_out), 0);
    }
    else
    {
        handler(error_code, bytes_transferred);
    }
}


asio_udp_receiver::asio_udp_receiver(io_service& io_service)
    : m_io_service(io_service)
    , mp_socket(nullptr)
{
}


asio_udp_receiver::~asio_udp_receiver()
{
    // Do nothing.
}


} // namespace net {
} // namespace tftpkit {


/*
    End of "asio_udp_receiver.cpp"
*/
