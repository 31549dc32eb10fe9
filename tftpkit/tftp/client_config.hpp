/*!
    \file "client_config.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef CLIENT_CONFIG_HPP__8C7B6A59_4D3E_4F21_B0A9_C8D7E6F5A4B3__INCLUDED
#define CLIENT_CONFIG_HPP__8C7B6A59_4D3E_4F21_B0A9_C8D7E6F5A4B3__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>
#include <tftpkit/tftp/options.hpp>
#include <boost/program_options/options_description.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Client settings.  Block size 512 and window size 1 are not requested explicitly; a timeout of zero is not
 * requested either (the local default, 5 seconds, applies).
 */
struct client_config
{
    string server_host;
    unsigned short port;
    unsigned int block_size;
    unsigned int window_size;
    unsigned int timeout_in_seconds; // 0: not requested.
    unsigned int retry_limit;
    string mode; // Only "octet" is supported.

    client_config();

    void setup_config_parsing(boost::program_options::options_description *opts_desc);

    /// Throws configuration_exception describing the first invalid setting.
    void validate() const;

    /// Options for a request; 'transfer_size' is 0 on reads and the local file size on writes.
    option_list request_options(uint64_t transfer_size) const;

    /// Profile in force when the server ignores the options.
    transfer_profile default_profile() const;

    negotiation_limits limits() const;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef CLIENT_CONFIG_HPP__8C7B6A59_4D3E_4F21_B0A9_C8D7E6F5A4B3__INCLUDED


/*
    End of "client_config.hpp"
*/
