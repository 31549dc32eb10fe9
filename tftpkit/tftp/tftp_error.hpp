/*!
    \file "tftp_error.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef TFTP_ERROR_HPP__C67DE265_5F8F_45EC_9743_57A7CF53283B__INCLUDED
#define TFTP_ERROR_HPP__C67DE265_5F8F_45EC_9743_57A7CF53283B__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <boost/system/system_error.hpp>


namespace tftpkit {
namespace tftp {


DECLARE_EXCEPTION(configuration_exception, "invalid configuration");


/**
 * Error codes carried by ERROR packets (RFC 1350 section 5, RFC 2347).
 *
 * Used both for errors reported by the peer and for errors this end reports to the peer.
 */
enum tftp_error
{
    error_undefined = 0, // Not defined, see error message (if any).
    error_file_not_found = 1, // File not found.
    error_access_violation = 2, // Access violation.
    error_disk_full = 3, // Disk full or allocation exceeded.
    error_illegal_operation = 4, // Illegal TFTP operation.
    error_unknown_transfer_id = 5, // Unknown transfer ID.
    error_file_exists = 6, // File already exists.
    error_no_such_user = 7, // No such user.
    error_option_negotiation = 8 // Unknown or invalid TFTP option.
};


/**
 * Local transfer failures (i.e. not reported by an ERROR packet).
 */
enum transfer_error
{
    malformed_packet = 1, // Datagram does not decode.
    unknown_opcode, // Opcode is not one of the six TFTP opcodes.
    unexpected_packet, // Well formed, but not valid in the current state.
    retries_exhausted, // No reply within the retry limit.
    invalid_option, // Peer acknowledged an option value that was not requested.
    file_error, // Local file could not be read or written.
    peer_error // Peer sent an ERROR whose code is 0 (see its message) or not defined by RFC 1350.
};


boost::system::error_category const& tftp_category();
boost::system::error_category const& transfer_category();


inline boost::system::error_code make_error_code(tftp_error value)
{
    return boost::system::error_code(static_cast<int>(value), tftp_category());
}


inline boost::system::error_code make_error_code(transfer_error value)
{
    return boost::system::error_code(static_cast<int>(value), transfer_category());
}


/// Short name of an RFC 1350 error code, e.g. "file not found".
char const *tftp_error_name(unsigned int code);

/**
 * Status of a transfer ended by an ERROR packet from the peer.
 *
 * Codes 1..8 map to tftp_category(); code 0 and unknown codes map to transfer_error::peer_error, since a zero
 * error_code value would read as success.
 */
boost::system::error_code peer_error_code(unsigned int code);


} // namespace tftp {
} // namespace tftpkit {


namespace boost {
namespace system {


template <> struct is_error_code_enum<tftpkit::tftp::tftp_error> { static bool const value = true; };
template <> struct is_error_code_enum<tftpkit::tftp::transfer_error> { static bool const value = true; };


} // namespace system {
} // namespace boost {


#endif // #ifndef TFTP_ERROR_HPP__C67DE265_5F8F_45EC_9743_57A7CF53283B__INCLUDED


/*
    End of "tftp_error.hpp"
*/
