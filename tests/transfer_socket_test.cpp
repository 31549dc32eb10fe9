/*!
    \file "transfer_socket_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    Client side binding of a transfer socket to the first reply, over loopback.
*/


#include <gtest/gtest.h>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <tftpkit/tftp/transfer_socket.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;


namespace {


/// A host other than the server that keeps sending datagrams to 'target'.
class foreign_sender
{
public:
    foreign_sender(io_service& io_service, udp::endpoint const& target, size_t count)
        : m_socket(io_service, udp::endpoint(boost::asio::ip::address::from_string("127.0.0.2"), 0))
        , m_timer(io_service)
        , m_target(target)
        , mi_remaining(count)
        , m_datagram(4, 0)
    {
    }

    void start() { schedule(); }
    void stop() { m_timer.cancel(); }

private:
    void schedule()
    {
        m_timer.expires_from_now(boost::posix_time::milliseconds(200));
        m_timer.async_wait(boost::bind(&foreign_sender::on_timer, this, boost::asio::placeholders::error));
    }

    void on_timer(boost::system::error_code const& error_code)
    {
        if (error_code) { return; }

        boost::system::error_code send_error;
        m_socket.send_to(boost::asio::buffer(m_datagram), m_target, 0, send_error);
        if (0 != --mi_remaining) { schedule(); }
    }

private:
    udp::socket m_socket;
    deadline_timer m_timer;
    udp::endpoint const m_target;
    size_t mi_remaining;
    vector<uint8_t> m_datagram;
};


} // namespace {


class transfer_socket_test
    : public ::testing::Test
{
protected:
    transfer_socket_test()
        : m_server(m_io_service, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
        , m_socket(m_io_service, udp::endpoint(udp::v4(), 0), m_server.local_endpoint(),
                   point_to_point_socket::bind_on_first_reply)
        , m_buffer(64)
        , mb_completed(false)
        , mi_received(0)
    {
    }

    udp::endpoint client_endpoint() const
    {
        return udp::endpoint(boost::asio::ip::address_v4::loopback(), m_socket.local_endpoint().port());
    }

public:
    void on_receive(boost::system::error_code const& error_code, size_t bytes_transferred)
    {
        mb_completed = true;
        m_rx_error = error_code;
        mi_received = bytes_transferred;
    }

protected:
    io_service m_io_service;
    udp::socket m_server;
    point_to_point_socket m_socket;
    vector<uint8_t> m_buffer;
    bool mb_completed;
    boost::system::error_code m_rx_error;
    size_t mi_received;
};


TEST_F(transfer_socket_test, first_reply_names_the_transfer_port)
{
    udp::socket transfer_port(m_io_service, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    uint8_t const reply[] = { 0, 4, 0, 0 };
    transfer_port.send_to(boost::asio::buffer(reply), client_endpoint());

    m_socket.async_receive(boost::asio::buffer(m_buffer), boost::posix_time::seconds(5),
                           boost::bind(&transfer_socket_test::on_receive, this,
                                       boost::asio::placeholders::error,
                                       boost::asio::placeholders::bytes_transferred));
    m_io_service.run();

    ASSERT_TRUE(mb_completed);
    EXPECT_FALSE(m_rx_error) << m_rx_error.message();
    EXPECT_EQ(sizeof(reply), mi_received);
    EXPECT_EQ(transfer_port.local_endpoint(), m_socket.remote_endpoint());
}


TEST_F(transfer_socket_test, foreign_datagrams_do_not_extend_the_timeout)
{
    // Traffic for five seconds, against a one second timeout.
    foreign_sender foreign(m_io_service, client_endpoint(), 25);
    foreign.start();

    boost::posix_time::ptime const start(boost::posix_time::microsec_clock::universal_time());
    boost::posix_time::ptime finish;
    m_socket.async_receive(boost::asio::buffer(m_buffer), boost::posix_time::seconds(1),
                           [this, &foreign, &finish](boost::system::error_code const& error_code, size_t size) {
                               finish = boost::posix_time::microsec_clock::universal_time();
                               foreign.stop();
                               on_receive(error_code, size);
                           });
    m_io_service.run();

    ASSERT_TRUE(mb_completed);
    EXPECT_EQ(make_error_code(boost::asio::error::timed_out), m_rx_error);
    EXPECT_GT(boost::posix_time::seconds(3), finish - start);
    EXPECT_EQ(m_server.local_endpoint(), m_socket.remote_endpoint());
}


/*
    End of "transfer_socket_test.cpp"
*/
