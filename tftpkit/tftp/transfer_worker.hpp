/*!
    \file "transfer_worker.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TRANSFER_WORKER_HPP__D4E5F607_1829_4A3B_9C4D_5E6F70819203__INCLUDED
#define TRANSFER_WORKER_HPP__D4E5F607_1829_4A3B_9C4D_5E6F70819203__INCLUDED


#pragma once


#include <fstream>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/file_policy.hpp>
#include <tftpkit/tftp/transfer_session.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>


namespace tftpkit {
namespace tftp {


/// An accepted RRQ or WRQ.
struct transfer_request
{
    transfer_direction direction;
    string filename;
    string mode;
    option_list options;
    boost::filesystem::path path; // 'filename' resolved below the served directory.

    transfer_request() : direction(direction_read) {}
};


/// What the server publishes when a transfer ends.
struct transfer_summary
{
    udp::endpoint peer;
    transfer_direction direction;
    string filename;
    boost::system::error_code status;
    transfer_session::statistics stats;
    boost::posix_time::time_duration elapsed;

    transfer_summary() : direction(direction_read) {}
};


/**
 * Server side of one transfer: validates the request, negotiates options, then moves the file.
 *
 * The worker keeps itself alive through its pending operations; the dispatcher does not hold it.
 */
class transfer_worker
    : public transfer_session
{
public:
    typedef boost::function<void (transfer_summary const&)> completion_handler_t;

public:
    static shared_ptr<transfer_worker> create(transfer_socket_ptr socket, transfer_request const& request,
                                              file_policy const& policy, negotiation_limits const& limits,
                                              completion_handler_t handler);

    void start();

    transfer_request const& request() const { return m_request; }

    ~transfer_worker();

protected:
    void on_negotiation_reply(packet const& reply);
    void on_finished();

private:
    transfer_worker(transfer_socket_ptr socket, transfer_request const& request, file_policy const& policy,
                    negotiation_limits const& limits, completion_handler_t handler);

    void start_read();
    void start_write();
    void refuse(boost::system::error_code const& code);

private:
    transfer_request const m_request;
    file_policy const m_policy;
    negotiation_limits m_limits;
    completion_handler_t m_completion_handler;
    boost::optional<oack_packet> m_oack;
    std::ifstream m_source;
    std::ofstream m_sink;
    bool mb_created_file;
    boost::posix_time::ptime m_start_time;
};

typedef shared_ptr<transfer_worker> transfer_worker_ptr;


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TRANSFER_WORKER_HPP__D4E5F607_1829_4A3B_9C4D_5E6F70819203__INCLUDED


/*
    End of "transfer_worker.hpp"
*/
