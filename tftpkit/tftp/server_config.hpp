/*!
    \file "server_config.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef SERVER_CONFIG_HPP__1F2E3D4C_5B6A_4978_8695_A4B3C2D1E0F9__INCLUDED
#define SERVER_CONFIG_HPP__1F2E3D4C_5B6A_4978_8695_A4B3C2D1E0F9__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>
#include <tftpkit/tftp/options.hpp>
#include <tftpkit/tftp/file_policy.hpp>
#include <boost/program_options/options_description.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Server settings.  A default constructed server_config serves the current directory on port 69.
 */
struct server_config
{
    string listen_address;
    unsigned short listen_port;
    string directory; // Served for both directions unless overridden below.
    string receive_directory; // Empty: 'directory'.
    string send_directory; // Empty: 'directory'.
    bool single_port; // Serve every transfer from the listening port.
    bool read_only; // Refuse write requests.
    bool overwrite; // Allow write requests to replace existing files.
    unsigned int retry_limit;
    unsigned int timeout_in_seconds; // Used unless the client negotiates one.
    unsigned int max_block_size;
    unsigned int max_window_size;

    server_config();

    /**
     * Adds these settings to 'opts_desc' so that parsing a command line or config file fills in *this.
     * Defaults shown in help output are the current values.
     */
    void setup_config_parsing(boost::program_options::options_description *opts_desc);

    /// Throws configuration_exception describing the first invalid setting.
    void validate() const;

    string effective_receive_directory() const { return receive_directory.empty() ? directory : receive_directory; }
    string effective_send_directory() const { return send_directory.empty() ? directory : send_directory; }

    negotiation_limits limits() const;
    file_policy policy() const;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef SERVER_CONFIG_HPP__1F2E3D4C_5B6A_4978_8695_A4B3C2D1E0F9__INCLUDED


/*
    End of "server_config.hpp"
*/
