/*!
    \file "tftp_client.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TFTP_CLIENT_HPP__66751E59_CF24_4D48_940A_2F9BB269E274__INCLUDED
#define TFTP_CLIENT_HPP__66751E59_CF24_4D48_940A_2F9BB269E274__INCLUDED


#pragma once


#include <tftpkit/sync_domain_provider.hpp>
#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/client_config.hpp>
#include <tftpkit/tftp/transfer_session.hpp>


namespace tftpkit {
namespace tftp {


/**
 * A failed transfer.  code() is the transfer status; peer_error() is the ERROR packet that ended the transfer,
 * when the server sent one.
 */
class transfer_exception
    : public boost::system::system_error
{
public:
    transfer_exception(boost::system::error_code const& status, boost::optional<error_packet> const& peer_error)
        : boost::system::system_error(status, peer_error ? peer_error->message : string("tftp transfer"))
        , m_peer_error(peer_error)
    {
    }

    boost::optional<error_packet> const& peer_error() const { return m_peer_error; }

private:
    boost::optional<error_packet> m_peer_error;
};


/**
 * TFTP client based on boost asio.
 *
 * Runs one transfer at a time.  get() and put() run the io_service until the transfer ends and throw
 * transfer_exception when it fails; async_get() and async_put() only start the transfer, the callback
 * receives the final status.  A failed get removes the partially written local file.
 */
class tftp_client
    : public boost::noncopyable
    , public sync_domain_provider
{
public:
    DECLARE_EXCEPTION(tftp_client_exception, "tftp client error");
    DECLARE_EXCEPTION(operation_in_progress_exception, "operation already in progress", tftp_client_exception);
    DECLARE_EXCEPTION(unresolved_endpoint_exception, "unresolved endpoint", tftp_client_exception);
    DECLARE_EXCEPTION(local_file_exception, "local file error", tftp_client_exception);

public:
    typedef boost::signals2::signal<void (tftp_client& publisher)> operation_complete_signal_t;
    typedef boost::signals2::connection connection_t;

public:
    template <typename op_complete_functor_type>
    void async_get(string remote_pathname, string local_pathname, op_complete_functor_type callback);

    template <typename op_complete_functor_type>
    void async_put(string local_pathname, string remote_pathname, op_complete_functor_type callback);

    void get(string remote_pathname, string local_pathname);
    void put(string local_pathname, string remote_pathname);

    bool in_progress() const;
    boost::system::error_code transfer_status() const;
    boost::optional<error_packet> peer_error() const; //!< ERROR packet that ended the last transfer, if any.
    transfer_profile profile() const; //!< Negotiated profile of the last transfer.
    transfer_session::statistics statistics() const; //!< Counters of the last transfer.

    client_config const& config() const { return m_config; }
    void set_config(client_config const& config); //!< Throws operation_in_progress_exception during a transfer.

    connection_t subscribe_to_operation_complete(operation_complete_signal_t::slot_type const& subscriber)
    {
        return m_operation_complete_publisher.connect(subscriber);
    }

    tftp_client(io_service& io_service, client_config const& config, lock_type *sync_domain_lock = nullptr);
    virtual ~tftp_client();

protected:
    typedef boost::signals2::signal<void (boost::system::error_code)> startup_callback_type;
    typedef shared_ptr<startup_callback_type> startup_callback_ptr_type;

    void untyped_start(transfer_direction direction, string remote_pathname, string local_pathname,
                       startup_callback_ptr_type callback_ptr);
    virtual void transfer_complete(boost::system::error_code status);

private:
    class client_transfer;

    void run_to_completion();
    void notify_client();

private:
    io_service& m_io_service;
    client_config m_config;
    operation_complete_signal_t m_operation_complete_publisher;
    startup_callback_ptr_type startup_callback_;
    shared_ptr<client_transfer> mp_transfer;
    bool mb_in_progress;
    boost::system::error_code m_transfer_status;
};


template <typename op_complete_functor_type> void
tftp_client::async_get(string remote_pathname, string local_pathname, op_complete_functor_type callback)
{
    startup_callback_ptr_type callback_ptr(new startup_callback_type);
    callback_ptr->connect(std::move(callback));
    untyped_start(direction_read, remote_pathname, local_pathname, std::move(callback_ptr));
}


template <typename op_complete_functor_type> void
tftp_client::async_put(string local_pathname, string remote_pathname, op_complete_functor_type callback)
{
    startup_callback_ptr_type callback_ptr(new startup_callback_type);
    callback_ptr->connect(std::move(callback));
    untyped_start(direction_write, remote_pathname, local_pathname, std::move(callback_ptr));
}


inline void
tftp_client::get(string remote_pathname, string local_pathname)
{
    untyped_start(direction_read, remote_pathname, local_pathname, nullptr);
    run_to_completion();
}


inline void
tftp_client::put(string local_pathname, string remote_pathname)
{
    untyped_start(direction_write, remote_pathname, local_pathname, nullptr);
    run_to_completion();
}


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef TFTP_CLIENT_HPP__66751E59_CF24_4D48_940A_2F9BB269E274__INCLUDED


/*
    End of "tftp_client.hpp"
*/
