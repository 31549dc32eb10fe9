/*!
    \file "options.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef OPTIONS_HPP__BD58D589_1C71_4586_A975_33ADC517D326__INCLUDED
#define OPTIONS_HPP__BD58D589_1C71_4586_A975_33ADC517D326__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/packet.hpp>


namespace tftpkit {
namespace tftp {


/// Direction of a transfer, as seen from the server: read == RRQ == GET, write == WRQ == PUT.
enum transfer_direction
{
    direction_read,
    direction_write
};

char const *direction_name(transfer_direction direction);


/**
 * Parameters in force for one transfer.  Immutable once negotiated.
 */
struct transfer_profile
{
    uint16_t block_size; // [8, 65464]
    uint16_t window_size; // [1, 65535]
    time_duration timeout; // Per receive.
    unsigned int retry_limit; // Consecutive timeouts tolerated before the transfer fails.
    boost::optional<uint64_t> transfer_size; // Known file size, when negotiated.

    transfer_profile();
};


/**
 * Local side of the negotiation: what this end is prepared to grant, and what it knows.
 */
struct negotiation_limits
{
    uint16_t max_block_size;
    uint16_t max_window_size;
    time_duration default_timeout;
    unsigned int retry_limit;
    boost::optional<uint64_t> file_size; // Size of the file being read (read direction only).

    negotiation_limits();
};


struct negotiation_result
{
    transfer_profile profile;
    option_list acknowledged; //!< One entry per requested option kind, with the value in force.

    /// An OACK is needed only when an acknowledged option changes something (tsize always does).
    bool oack_required() const;
};


/**
 * Responder side: clamps the requested options into their legal range and the local limits.
 *
 * Options are applied in order, so the last occurrence of a kind wins.  Negotiation never fails; an empty
 * request yields the RFC 1350 defaults.  For reads 'tsize' is answered with limits.file_size, for writes the
 * requested value is kept.
 */
negotiation_result negotiate(option_list const& requested, transfer_direction direction,
                             negotiation_limits const& limits);

/**
 * Requester side: interprets an OACK in reply to 'requested'.
 *
 * Fails (returns false) when the OACK grants an option that was not requested, or a block or window size
 * larger than requested; the requester must then abort with ERROR 8.
 */
bool accept_oack(option_list const& requested, option_list const& acknowledged, negotiation_limits const& limits,
                 transfer_profile& profile);


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef OPTIONS_HPP__BD58D589_1C71_4586_A975_33ADC517D326__INCLUDED


/*
    End of "options.hpp"
*/
