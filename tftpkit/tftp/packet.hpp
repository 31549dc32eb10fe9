/*!
    \file "packet.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    TFTP packets and their wire format (RFC 1350, RFC 2347).

    All integers are big-endian; strings are NUL terminated.

        RRQ/WRQ | opcode (2) | filename | 0 | mode | 0 | [ optname | 0 | optvalue | 0 ]* |
        DATA    | opcode (2) | block (2) | payload (0..blksize) |
        ACK     | opcode (2) | block (2) |
        ERROR   | opcode (2) | error code (2) | message | 0 |
        OACK    | opcode (2) | [ optname | 0 | optvalue | 0 ]* |
*/


#ifndef PACKET_HPP__A0FC6FAB_9950_4D8D_8423_4715859B4F9C__INCLUDED
#define PACKET_HPP__A0FC6FAB_9950_4D8D_8423_4715859B4F9C__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>
#include <boost/variant.hpp>


namespace tftpkit {
namespace tftp {


unsigned int constexpr TFTP_OPCODE_RRQ   = 1; // Read request == get == download file
unsigned int constexpr TFTP_OPCODE_WRQ   = 2; // Write request == put == upload file
unsigned int constexpr TFTP_OPCODE_DATA  = 3; // Data block of file being transferred.
unsigned int constexpr TFTP_OPCODE_ACK   = 4; // Acknowledgement.
unsigned int constexpr TFTP_OPCODE_ERROR = 5; // Error.
unsigned int constexpr TFTP_OPCODE_OACK  = 6; // Options acknowledgement.


enum option_kind
{
    option_block_size, // "blksize", RFC 2348.
    option_window_size, // "windowsize", RFC 7440.
    option_timeout, // "timeout" (seconds), RFC 2349.
    option_transfer_size // "tsize" (bytes), RFC 2349.
};

char const *option_name(option_kind kind);
bool parse_option_name(string const& name, option_kind& kind); //!< Case insensitive.


struct transfer_option
{
    option_kind kind;
    uint64_t value;

    transfer_option() : kind(option_block_size), value(0) {}
    transfer_option(option_kind kind_, uint64_t value_) : kind(kind_), value(value_) {}
};

typedef vector<transfer_option> option_list;


struct read_request
{
    string filename;
    string mode;
    option_list options;
};

struct write_request
{
    string filename;
    string mode;
    option_list options;
};

struct data_packet
{
    uint16_t block;
    vector<uint8_t> payload;

    data_packet() : block(0) {}
    data_packet(uint16_t block_, vector<uint8_t> payload_) : block(block_), payload(move(payload_)) {}
};

struct ack_packet
{
    uint16_t block;

    explicit ack_packet(uint16_t block_ = 0) : block(block_) {}
};

struct oack_packet
{
    option_list options;
};

struct error_packet
{
    uint16_t code;
    string message;

    error_packet() : code(error_undefined) {}
    error_packet(uint16_t code_, string message_) : code(code_), message(move(message_)) {}
};


typedef boost::variant<read_request, write_request, data_packet, ack_packet, oack_packet, error_packet> packet;


bool operator==(transfer_option const& lhs, transfer_option const& rhs);
bool operator==(read_request const& lhs, read_request const& rhs);
bool operator==(write_request const& lhs, write_request const& rhs);
bool operator==(data_packet const& lhs, data_packet const& rhs);
bool operator==(ack_packet const& lhs, ack_packet const& rhs);
bool operator==(oack_packet const& lhs, oack_packet const& rhs);
bool operator==(error_packet const& lhs, error_packet const& rhs);


/// Thrown by the throwing deserialize() overload and by serialize() for values that cannot be encoded.
class codec_exception
    : public boost::system::system_error
{
public:
    explicit codec_exception(boost::system::error_code const& error_code)
        : boost::system::system_error(error_code, "tftp codec") {}
};


unsigned int opcode_of(packet const& value);
char const *opcode_name(unsigned int opcode);

vector<uint8_t> serialize(packet const& value);
void serialize(packet const& value, vector<uint8_t>& datagram);

/**
 * Decodes one datagram.
 *
 * Corrupt datagrams are ordinary input: this overload reports them through 'error_code'
 * (malformed_packet or unknown_opcode) and leaves 'result' untouched.
 */
bool deserialize(uint8_t const *data, size_t size, packet& result, boost::system::error_code& error_code);
packet deserialize(uint8_t const *data, size_t size);


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef PACKET_HPP__A0FC6FAB_9950_4D8D_8423_4715859B4F9C__INCLUDED


/*
    End of "packet.hpp"
*/
