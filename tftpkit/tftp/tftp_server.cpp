/*!
    \file "tftp_server.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_server.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


namespace {


size_t constexpr RX_BUFFER_SIZE = 65536; // Largest UDP payload, rounded up.


/// Requests are recognized by their opcode alone, without decoding.
bool
is_request(uint8_t const *data, size_t size)
{
    if (2 > size) { return false; }
    unsigned int const opcode = (static_cast<unsigned int>(data[0]) << 8) | data[1];
    return TFTP_OPCODE_RRQ == opcode || TFTP_OPCODE_WRQ == opcode;
}


string
describe(udp::endpoint const& endpoint)
{
    ostringstream oss;
    oss << endpoint;
    return oss.str();
}


} // namespace {


tftp_server::tftp_server(io_service& io_service, server_config const& config, lock_type *sync_domain_lock)
    : sync_domain_provider(sync_domain_lock)
    , m_io_service(io_service)
    , m_config(config)
    , m_policy(config.policy())
    , m_limits(config.limits())
    , m_rx_buffer(RX_BUFFER_SIZE)
    , mi_active_transfers(0)
{
}


tftp_server::~tftp_server()
{
    shutdown();
}


/**
 * Start up the sub-system.
 */
void
tftp_server::startup()
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    TRACE("==> tftp_server::startup(address=\"%s\", port=%u)\n",
          m_config.listen_address.c_str(), static_cast<unsigned int>(m_config.listen_port));

    // Fail when already running.
    if (is_started()) { throw already_started_exception(); }

    m_config.validate();

    try
    {
        udp::endpoint const endpoint(boost::asio::ip::address::from_string(m_config.listen_address),
                                     m_config.listen_port);

        // Create server socket.
        mp_listener = make_shared<udp::socket>(m_io_service);
        mp_listener->open(endpoint.protocol());
        mp_listener->bind(endpoint);
        mp_demultiplexer = make_shared<peer_demultiplexer>();

        start_receive();
    }
    catch (...)
    {
        shutdown();
        throw;
    }

    tftpkit_log(log_level_info, "listening on %s (%s), serving \"%s\", receiving into \"%s\"%s",
                describe(local_endpoint()).c_str(), m_config.single_port ? "single port" : "multi port",
                m_config.effective_send_directory().c_str(), m_config.effective_receive_directory().c_str(),
                m_config.read_only ? ", read only" : "");

    LEAVE_SYNC_DOMAIN()
}


/**
 * Shutdown the sub-system.
 */
void
tftp_server::shutdown()
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    if (mp_listener && mp_listener->is_open())
    {
        boost::system::error_code error_code;
        mp_listener->close(error_code);
        if (error_code)
        {
            tftpkit_log(log_level_warning, "closing listening socket: %s", error_code.message().c_str());
        }
        tftpkit_log(log_level_info, "stopped listening, %lu transfers in progress",
                    static_cast<unsigned long>(mi_active_transfers));
    }

    LEAVE_SYNC_DOMAIN()
}


bool
tftp_server::is_started() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mp_listener && mp_listener->is_open();

    LEAVE_SYNC_DOMAIN()
}


udp::endpoint
tftp_server::local_endpoint() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    if (!mp_listener) { return udp::endpoint(); }
    boost::system::error_code error_code;
    udp::endpoint const endpoint(mp_listener->local_endpoint(error_code));
    return error_code ? udp::endpoint() : endpoint;

    LEAVE_SYNC_DOMAIN()
}


size_t
tftp_server::active_transfer_count() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mi_active_transfers;

    LEAVE_SYNC_DOMAIN()
}


void
tftp_server::start_receive()
{
    mp_listener->async_receive_from(boost::asio::buffer(m_rx_buffer), m_rx_endpoint,
                                    boost::bind(&tftp_server::on_async_rx_complete, this,
                                                boost::asio::placeholders::error,
                                                boost::asio::placeholders::bytes_transferred));
}


void
tftp_server::on_async_rx_complete(boost::system::error_code const& error_code, size_t bytes_transferred)
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    // Handle shutdown.
    if (boost::asio::error::operation_aborted == error_code || !mp_listener->is_open()) { return; }

    if (error_code)
    {
        // E.g. an ICMP port unreachable left over from an earlier reply.
        TRACE("tftp_server::on_async_rx_complete(error_code=%d=\"%s\")\n",
              error_code.value(), error_code.message().c_str());
        start_receive();
        return;
    }

    uint8_t const *const data = m_rx_buffer.data();
    udp::endpoint const peer(m_rx_endpoint);

    if (m_config.single_port && mp_demultiplexer->contains(peer))
    {
        // A repeated request from a peer with a transfer in progress is a retransmission; drop it.
        if (!is_request(data, bytes_transferred)) { mp_demultiplexer->deliver(peer, data, bytes_transferred); }
        start_receive();
        return;
    }

    if (!m_config.single_port && is_request(data, bytes_transferred) && has_active_worker(peer))
    {
        TRACE("tftp_server::on_async_rx_complete(): dropping repeated request from %s\n", describe(peer).c_str());
        start_receive();
        return;
    }

    packet request;
    boost::system::error_code decode_error;
    if (!deserialize(data, bytes_transferred, request, decode_error))
    {
        TRACE("tftp_server::on_async_rx_complete(): dropping undecodable datagram from %s (%s)\n",
              describe(peer).c_str(), decode_error.message().c_str());
    }
    else if (read_request const *rrq = boost::get<read_request>(&request))
    {
        transfer_request accepted;
        accepted.direction = direction_read;
        accepted.filename = rrq->filename;
        accepted.mode = rrq->mode;
        accepted.options = rrq->options;
        handle_request(peer, accepted);
    }
    else if (write_request const *wrq = boost::get<write_request>(&request))
    {
        transfer_request accepted;
        accepted.direction = direction_write;
        accepted.filename = wrq->filename;
        accepted.mode = wrq->mode;
        accepted.options = wrq->options;
        handle_request(peer, accepted);
    }
    else
    {
        TRACE("tftp_server::on_async_rx_complete(): dropping %s from %s\n",
              opcode_name(opcode_of(request)), describe(peer).c_str());
    }

    if (mp_listener->is_open()) { start_receive(); }

    LEAVE_SYNC_DOMAIN()
}


void
tftp_server::handle_request(udp::endpoint const& peer, transfer_request request)
{
    boost::system::error_code code = m_policy.check_request(request.direction);
    if (!code) { code = m_policy.resolve(request.filename, request.direction, request.path); }
    if (code)
    {
        tftpkit_log(log_level_warning, "refusing %s of \"%s\" from %s: %s", direction_name(request.direction),
                    request.filename.c_str(), describe(peer).c_str(), code.message().c_str());
        send_error(peer, code);
        return;
    }

    transfer_socket_ptr socket;
    try
    {
        if (m_config.single_port)
        {
            socket = shared_port_socket::create(m_io_service, mp_listener, peer, mp_demultiplexer);
        }
        else
        {
            udp::endpoint const local_endpoint(mp_listener->local_endpoint().address(), 0);
            socket = make_shared<point_to_point_socket>(m_io_service, local_endpoint, peer,
                                                        point_to_point_socket::bind_immediately);
        }
    }
    catch (boost::system::system_error const& e)
    {
        tftpkit_log(log_level_error, "no transfer socket for %s: %s", describe(peer).c_str(), e.what());
        send_error(peer, make_error_code(error_undefined));
        return;
    }

    transfer_worker_ptr worker(transfer_worker::create(socket, request, m_policy, m_limits,
                                                       boost::bind(&tftp_server::on_transfer_complete, this,
                                                                   boost::placeholders::_1)));
    if (!m_config.single_port) { m_workers[peer] = worker; }
    ++mi_active_transfers;
    worker->start();
}


bool
tftp_server::has_active_worker(udp::endpoint const& peer) const
{
    std::map<udp::endpoint, weak_ptr<transfer_worker> >::const_iterator iter = m_workers.find(peer);
    return m_workers.end() != iter && !iter->second.expired();
}


void
tftp_server::send_error(udp::endpoint const& peer, boost::system::error_code const& code)
{
    error_packet const reply(static_cast<uint16_t>(code.value()),
                             code.value() ? code.message() : string("internal error"));
    shared_ptr<vector<uint8_t> > datagram(make_shared<vector<uint8_t> >(serialize(reply)));
    mp_listener->async_send_to(boost::asio::buffer(*datagram), peer,
                               boost::bind(&tftp_server::on_error_sent, datagram,
                                           boost::asio::placeholders::error));
}


void
tftp_server::on_error_sent(shared_ptr<vector<uint8_t> > /*datagram*/, boost::system::error_code const& error_code)
{
    if (error_code && boost::asio::error::operation_aborted != error_code)
    {
        tftpkit_log(log_level_warning, "sending ERROR: %s", error_code.message().c_str());
    }
}


void
tftp_server::on_transfer_complete(transfer_summary const& summary)
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    --mi_active_transfers;
    m_workers.erase(summary.peer);

    // Notify subscribers that the transfer is complete.
    // WARNING: Do not use io_service::dispatch() or the callback may be invoked while
    //          within the synchronization domain, i.e. this is locked!
    m_io_service.post(boost::bind<void>([](tftp_server *thiz, transfer_summary const& summary) {
        thiz->m_transfer_complete_publisher(summary);
    }, this, summary));

    LEAVE_SYNC_DOMAIN()
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "tftp_server.cpp"
*/
