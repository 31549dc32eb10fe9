/*!
    \file "tftp_client.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <fstream>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_client.hpp>
#include <boost/filesystem/operations.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


/**
 * Client side of one transfer: sends the request, interprets the reply (OACK, first DATA or ACK 0), then runs
 * the session's windowed pipeline.
 */
class tftp_client::client_transfer
    : public transfer_session
{
public:
    typedef boost::function<void (boost::system::error_code)> completion_handler_t;

public:
    client_transfer(transfer_socket_ptr socket, transfer_direction direction, string const& remote_pathname,
                    string const& local_pathname, client_config const& config, completion_handler_t handler)
        : transfer_session(socket)
        , m_direction(direction)
        , m_remote_pathname(remote_pathname)
        , m_local_pathname(local_pathname)
        , m_config(config)
        , m_completion_handler(handler)
        , m_local_size(0)
        , mb_created_local_file(false)
    {
    }

    /// Opens the local file; throws local_file_exception.
    void open_local_file()
    {
        if (direction_read == m_direction)
        {
            m_sink.open(m_local_pathname.c_str(), ios_base::out | ios_base::binary | ios_base::trunc);
            if (!m_sink.is_open()) { throw local_file_exception("cannot create \"" + m_local_pathname + "\""); }
            mb_created_local_file = true;
        }
        else
        {
            boost::system::error_code error_code;
            uintmax_t const size = boost::filesystem::file_size(m_local_pathname, error_code);
            if (error_code) { throw local_file_exception("cannot read \"" + m_local_pathname + "\""); }
            m_source.open(m_local_pathname.c_str(), ios_base::in | ios_base::binary);
            if (!m_source.is_open()) { throw local_file_exception("cannot read \"" + m_local_pathname + "\""); }
            m_local_size = size;
        }
    }

    void start()
    {
        set_profile(m_config.default_profile());

        // tsize 0 on a read asks the server for the file size.
        m_requested_options = m_config.request_options(direction_read == m_direction ? 0 : m_local_size);

        if (direction_read == m_direction)
        {
            read_request request;
            request.filename = m_remote_pathname;
            request.mode = m_config.mode;
            request.options = m_requested_options;
            send(request);
        }
        else
        {
            write_request request;
            request.filename = m_remote_pathname;
            request.mode = m_config.mode;
            request.options = m_requested_options;
            send(request);
        }
    }

    /// The client is going away; the transfer ends without reporting to it.
    void detach()
    {
        m_completion_handler.clear();
        abort();
    }

protected:
    void on_negotiation_reply(packet const& reply)
    {
        if (oack_packet const *oack = boost::get<oack_packet>(&reply))
        {
            transfer_profile profile;
            if (!accept_oack(m_requested_options, oack->options, m_config.limits(), profile))
            {
                send_error(error_packet(error_option_negotiation, "invalid option acknowledgement"),
                           make_error_code(invalid_option));
                return;
            }
            set_profile(profile);

            if (direction_read == m_direction)
            {
                start_receiving(m_sink);
                send(ack_packet(0));
            }
            else
            {
                start_sending(m_source);
            }
            return;
        }

        // The server ignored the options: RFC 1350 defaults.
        if (direction_read == m_direction && boost::get<data_packet>(&reply))
        {
            set_profile(m_config.default_profile());
            set_retransmission(ack_packet(0));
            start_receiving(m_sink);
            dispatch(reply);
            return;
        }

        ack_packet const *ack = boost::get<ack_packet>(&reply);
        if (direction_write == m_direction && nullptr != ack && 0 == ack->block)
        {
            set_profile(m_config.default_profile());
            start_sending(m_source);
            return;
        }

        send_error(error_packet(error_illegal_operation, string("unexpected ") + opcode_name(opcode_of(reply))),
                   make_error_code(unexpected_packet));
    }

    void on_finished()
    {
        m_source.close();
        m_sink.close();

        if (status() && mb_created_local_file)
        {
            boost::system::error_code error_code;
            boost::filesystem::remove(m_local_pathname, error_code);
            if (error_code)
            {
                tftpkit_log(log_level_warning, "could not remove \"%s\": %s",
                            m_local_pathname.c_str(), error_code.message().c_str());
            }
        }

        if (m_completion_handler)
        {
            completion_handler_t handler;
            handler.swap(m_completion_handler);
            handler(status());
        }
    }

private:
    transfer_direction const m_direction;
    string const m_remote_pathname;
    string const m_local_pathname;
    client_config const m_config;
    completion_handler_t m_completion_handler;
    option_list m_requested_options;
    std::ifstream m_source;
    std::ofstream m_sink;
    uint64_t m_local_size;
    bool mb_created_local_file;
};


tftp_client::tftp_client(io_service& io_service, client_config const& config, lock_type *sync_domain_lock)
    : sync_domain_provider(sync_domain_lock)
    , m_io_service(io_service)
    , m_config(config)
    , mb_in_progress(false)
{
}


tftp_client::~tftp_client()
{
    if (mp_transfer) { mp_transfer->detach(); }
}


void
tftp_client::untyped_start(transfer_direction direction, string remote_pathname, string local_pathname,
                           startup_callback_ptr_type callback_ptr)
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    TRACE("tftp_client::untyped_start(direction=%s, host=%s, remote_pathname=\"%s\", local_pathname=\"%s\")\n",
          direction_name(direction), m_config.server_host.c_str(), remote_pathname.c_str(), local_pathname.c_str());

    // Ensure that an in-progress operation is not interrupted or destroyed.
    if (in_progress()) { throw operation_in_progress_exception(); }

    m_config.validate();

    try
    {
        startup_callback_ = callback_ptr;
        mp_transfer.reset();
        m_transfer_status = make_error_code(boost::system::errc::operation_in_progress);

        // Resolve the server; requests go to its well-known port, the first reply names the transfer port.
        udp::resolver::iterator endpoint_iter =
            udp::resolver(m_io_service).resolve(udp::resolver::query(udp::v4(), m_config.server_host,
                                                                     std::to_string(m_config.port)));
        if (udp::resolver::iterator() == endpoint_iter) { throw unresolved_endpoint_exception(); }

        transfer_socket_ptr socket(make_shared<point_to_point_socket>(m_io_service, udp::endpoint(udp::v4(), 0),
                                                                      endpoint_iter->endpoint(),
                                                                      point_to_point_socket::bind_on_first_reply));

        mp_transfer = make_shared<client_transfer>(socket, direction, remote_pathname, local_pathname, m_config,
                                                   boost::bind(&tftp_client::transfer_complete, this,
                                                               boost::placeholders::_1));
        mp_transfer->open_local_file();

        mb_in_progress = true;
        mp_transfer->start();
    }
    catch (...)
    {
        mb_in_progress = false;
        startup_callback_.reset();
        if (mp_transfer) { mp_transfer->detach(); }
        m_transfer_status = make_error_code(boost::system::errc::not_connected);
        throw;
    }

    LEAVE_SYNC_DOMAIN()
}


void
tftp_client::run_to_completion()
{
    m_io_service.restart();
    while (in_progress() && 0 != m_io_service.run_one())
    {
        // Keep going.
    }

    // Deliver the completion notifications posted by transfer_complete().
    m_io_service.poll();

    if (in_progress())
    {
        // The io_service was stopped underneath the transfer.
        mp_transfer->abort();
    }

    boost::system::error_code const status = transfer_status();
    if (status) { throw transfer_exception(status, peer_error()); }
}


void
tftp_client::transfer_complete(boost::system::error_code status)
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    if (status)
    {
        tftpkit_log(log_level_warning, "transfer with %s failed: %s",
                    m_config.server_host.c_str(), status.message().c_str());
    }
    else
    {
        TRACE("tftp_client::transfer_complete(): %llu bytes\n",
              static_cast<unsigned long long>(mp_transfer->stats().bytes_transferred));
    }

    // Record transfer result.
    m_transfer_status = status;
    mb_in_progress = false;

    notify_client();

    LEAVE_SYNC_DOMAIN()
}


void
tftp_client::notify_client()
{
    // Notify subscribers that the operation is complete.
    // WARNING: Do not use io_service::dispatch() or the callback may be invoked while
    //          within the synchronization domain, i.e. this is locked!
    m_io_service.post(boost::bind<void>([](tftp_client *thiz) {
        thiz->m_operation_complete_publisher(*thiz);
    }, this));

    // Invoke operation complete functor.
    if (nullptr != startup_callback_)
    {
        m_io_service.post(boost::bind<void>([](startup_callback_ptr_type callback,
                                               boost::system::error_code error_code) {
            (*callback)(error_code);
        }, startup_callback_, m_transfer_status));
        startup_callback_.reset();
    }
}


bool
tftp_client::in_progress() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mb_in_progress;

    LEAVE_SYNC_DOMAIN()
}


boost::system::error_code
tftp_client::transfer_status() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return m_transfer_status;

    LEAVE_SYNC_DOMAIN()
}


boost::optional<error_packet>
tftp_client::peer_error() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mp_transfer ? mp_transfer->peer_error() : boost::optional<error_packet>();

    LEAVE_SYNC_DOMAIN()
}


transfer_profile
tftp_client::profile() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mp_transfer ? mp_transfer->profile() : transfer_profile();

    LEAVE_SYNC_DOMAIN()
}


transfer_session::statistics
tftp_client::statistics() const
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    return mp_transfer ? mp_transfer->stats() : transfer_session::statistics();

    LEAVE_SYNC_DOMAIN()
}


void
tftp_client::set_config(client_config const& config)
{
    ENTER_SYNC_DOMAIN(sync_domain_lock())

    if (in_progress()) { throw operation_in_progress_exception(); }
    m_config = config;

    LEAVE_SYNC_DOMAIN()
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "tftp_client.cpp"
*/
