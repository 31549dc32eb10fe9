/*!
    \file "transfer_worker.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/transfer_worker.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/operations.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


namespace {


string
describe(udp::endpoint const& endpoint)
{
    ostringstream oss;
    oss << endpoint;
    return oss.str();
}


} // namespace {


shared_ptr<transfer_worker>
transfer_worker::create(transfer_socket_ptr socket, transfer_request const& request, file_policy const& policy,
                        negotiation_limits const& limits, completion_handler_t handler)
{
    return shared_ptr<transfer_worker>(new transfer_worker(socket, request, policy, limits, handler));
}


transfer_worker::transfer_worker(transfer_socket_ptr socket, transfer_request const& request,
                                 file_policy const& policy, negotiation_limits const& limits,
                                 completion_handler_t handler)
    : transfer_session(socket)
    , m_request(request)
    , m_policy(policy)
    , m_limits(limits)
    , m_completion_handler(handler)
    , mb_created_file(false)
    , m_start_time(boost::posix_time::microsec_clock::universal_time())
{
}


transfer_worker::~transfer_worker()
{
    TRACE("transfer_worker::~transfer_worker()\n");
}


void
transfer_worker::start()
{
    tftpkit_log(log_level_info, "%s request from %s for \"%s\"",
                direction_read == m_request.direction ? "read" : "write",
                describe(remote_endpoint()).c_str(), m_request.filename.c_str());

    if (!boost::algorithm::iequals(m_request.mode, "octet"))
    {
        send_error(error_packet(error_illegal_operation, "only octet mode is supported"),
                   make_error_code(error_illegal_operation));
        return;
    }

    if (direction_read == m_request.direction) { start_read(); }
    else { start_write(); }
}


void
transfer_worker::start_read()
{
    uint64_t file_size = 0;
    boost::system::error_code const code = m_policy.check_readable(m_request.path, file_size);
    if (code)
    {
        refuse(code);
        return;
    }

    m_source.open(m_request.path.string().c_str(), ios_base::in | ios_base::binary);
    if (!m_source.is_open())
    {
        refuse(make_error_code(error_access_violation));
        return;
    }

    m_limits.file_size = file_size;
    negotiation_result const result = negotiate(m_request.options, direction_read, m_limits);
    set_profile(result.profile);

    if (result.oack_required())
    {
        // Data starts once the client acknowledges the options with ACK 0.
        oack_packet oack;
        oack.options = result.acknowledged;
        send(oack);
        return;
    }

    start_sending(m_source);
}


void
transfer_worker::start_write()
{
    negotiation_result const result = negotiate(m_request.options, direction_write, m_limits);

    boost::system::error_code const code = m_policy.check_writable(m_request.path, result.profile.transfer_size);
    if (code)
    {
        refuse(code);
        return;
    }

    // A failed transfer removes the file only if this transfer created it.
    boost::system::error_code exists_error;
    bool const existed = boost::filesystem::exists(m_request.path, exists_error);

    m_sink.open(m_request.path.string().c_str(), ios_base::out | ios_base::binary | ios_base::trunc);
    if (!m_sink.is_open())
    {
        refuse(make_error_code(error_access_violation));
        return;
    }
    mb_created_file = !existed && !exists_error;

    set_profile(result.profile);
    start_receiving(m_sink);

    // The client confirms with DATA 1.
    if (result.oack_required())
    {
        oack_packet oack;
        oack.options = result.acknowledged;
        send(oack);
    }
    else
    {
        send(ack_packet(0));
    }
}


void
transfer_worker::refuse(boost::system::error_code const& code)
{
    tftpkit_log(log_level_warning, "refusing %s of \"%s\" from %s: %s",
                direction_name(m_request.direction), m_request.filename.c_str(),
                describe(remote_endpoint()).c_str(), code.message().c_str());

    send_error(error_packet(static_cast<uint16_t>(code.value()), code.message()), code);
}


void
transfer_worker::on_negotiation_reply(packet const& reply)
{
    // Only a read waits here: the OACK was sent, ACK 0 starts the data.
    if (ack_packet const *ack = boost::get<ack_packet>(&reply))
    {
        if (0 == ack->block) { start_sending(m_source); }
        else { receive_again(); }
        return;
    }

    send_error(error_packet(error_illegal_operation, "expected ACK 0"), make_error_code(unexpected_packet));
}


void
transfer_worker::on_finished()
{
    m_source.close();
    m_sink.close();

    if (status() && mb_created_file)
    {
        boost::system::error_code error_code;
        boost::filesystem::remove(m_request.path, error_code);
        if (error_code)
        {
            tftpkit_log(log_level_warning, "could not remove partial file \"%s\": %s",
                        m_request.path.string().c_str(), error_code.message().c_str());
        }
    }

    transfer_summary summary;
    summary.peer = remote_endpoint();
    summary.direction = m_request.direction;
    summary.filename = m_request.filename;
    summary.status = status();
    summary.stats = stats();
    summary.elapsed = boost::posix_time::microsec_clock::universal_time() - m_start_time;

    if (status())
    {
        tftpkit_log(log_level_warning, "%s of \"%s\" with %s failed: %s",
                    direction_name(m_request.direction), m_request.filename.c_str(),
                    describe(summary.peer).c_str(), status().message().c_str());
    }
    else
    {
        tftpkit_log(log_level_info, "%s of \"%s\" with %s complete, %llu bytes in %ld ms",
                    direction_name(m_request.direction), m_request.filename.c_str(),
                    describe(summary.peer).c_str(), static_cast<unsigned long long>(stats().bytes_transferred),
                    static_cast<long>(summary.elapsed.total_milliseconds()));
    }

    if (m_completion_handler)
    {
        completion_handler_t handler;
        handler.swap(m_completion_handler);
        handler(summary);
    }
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "transfer_worker.cpp"
*/
