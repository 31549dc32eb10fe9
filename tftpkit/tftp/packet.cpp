/*!
    \file "packet.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/packet.hpp>
#include <arpa/inet.h>
#include <boost/algorithm/string/predicate.hpp>


namespace tftpkit {
namespace tftp {


static char const l_tftp_option_name_block_size[] = "blksize";
static char const l_tftp_option_name_window_size[] = "windowsize";
static char const l_tftp_option_name_timeout[] = "timeout";
static char const l_tftp_option_name_transfer_size[] = "tsize";


namespace {


/*
    Appends fields to a datagram.
*/
class packet_writer
{
public:
    explicit packet_writer(vector<uint8_t>& datagram) : m_datagram(datagram) { m_datagram.clear(); }

    void serialize_uint16(unsigned int value)
    {
        uint16_t const network_value = htons(static_cast<uint16_t>(value));
        uint8_t const *bytes = reinterpret_cast<uint8_t const *>(&network_value);
        m_datagram.insert(m_datagram.end(), bytes, bytes + sizeof(network_value));
    }

    void serialize_opcode(unsigned int value) { serialize_uint16(value); }
    void serialize_block_number(unsigned int value) { serialize_uint16(value); }

    void serialize_string(string const& value)
    {
        // An embedded NUL would terminate the string early on the wire.
        if (string::npos != value.find('\0')) { throw codec_exception(make_error_code(malformed_packet)); }
        m_datagram.insert(m_datagram.end(), value.begin(), value.end());
        m_datagram.push_back('\0');
    }

    template <typename T> void serialize_integer_as_string(T value)
    {
        ostringstream oss;
        oss << dec << value;
        serialize_string(oss.str());
    }

    void serialize_bytes(vector<uint8_t> const& value)
    {
        m_datagram.insert(m_datagram.end(), value.begin(), value.end());
    }

    void serialize_options(option_list const& options)
    {
        for (option_list::const_iterator iter = options.begin(); options.end() != iter; ++iter)
        {
            serialize_string(option_name(iter->kind));
            serialize_integer_as_string(iter->value);
        }
    }

private:
    vector<uint8_t>& m_datagram;
};


/*
    Consumes fields from a datagram.  Every failure is reported by returning false; nothing here throws.
*/
class packet_reader
{
public:
    packet_reader(uint8_t const *data, size_t size) : mp_data(data), mi_size(size), mi_iter(0) {}

    size_t size_remaining() const { return mi_size - mi_iter; }

    bool deserialize_uint16(unsigned int& value)
    {
        uint16_t network_value = 0;
        if (size_remaining() < sizeof(network_value)) { return false; }
        memcpy(&network_value, mp_data + mi_iter, sizeof(network_value));
        mi_iter += sizeof(network_value);
        value = ntohs(network_value);
        return true;
    }

    bool deserialize_string(string& value)
    {
        uint8_t const *start = mp_data + mi_iter;
        uint8_t const *terminator = static_cast<uint8_t const *>(memchr(start, '\0', size_remaining()));
        if (nullptr == terminator) { return false; }
        value.assign(reinterpret_cast<char const *>(start), terminator - start);
        mi_iter += (terminator - start) + 1;
        return true;
    }

    void deserialize_remaining_bytes(vector<uint8_t>& value)
    {
        value.assign(mp_data + mi_iter, mp_data + mi_size);
        mi_iter = mi_size;
    }

    bool only_padding_remains() const
    {
        for (size_t index = mi_iter; mi_size > index; ++index)
        {
            if ('\0' != mp_data[index]) { return false; }
        }
        return true;
    }

private:
    uint8_t const *mp_data;
    size_t mi_size;
    size_t mi_iter;
};


bool
is_text(string const& value, bool allow_whitespace_controls)
{
    for (string::const_iterator iter = value.begin(); value.end() != iter; ++iter)
    {
        unsigned char const c = static_cast<unsigned char>(*iter);
        bool const whitespace_control = '\t' == c || '\r' == c || '\n' == c;
        if ((0x20 > c && !(allow_whitespace_controls && whitespace_control)) || 0x7f == c) { return false; }
    }
    return true;
}


bool
parse_decimal(string const& text, uint64_t& value)
{
    if (text.empty() || 20 < text.length()) { return false; }

    uint64_t result = 0;
    for (string::const_iterator iter = text.begin(); text.end() != iter; ++iter)
    {
        if ('0' > *iter || '9' < *iter) { return false; }
        uint64_t const digit = static_cast<uint64_t>(*iter - '0');
        if ((UINT64_MAX - digit) / 10 < result) { return false; }
        result = result * 10 + digit;
    }
    value = result;
    return true;
}


/*
    Reads name/value pairs until the end of the datagram.
    Unrecognized names and unparsable values are skipped (RFC 2347); a missing terminator is not.
*/
bool
deserialize_options(packet_reader& reader, option_list& options)
{
    options.clear();
    while (0 < reader.size_remaining() && !reader.only_padding_remains())
    {
        string name;
        string value;
        if (!reader.deserialize_string(name) || !reader.deserialize_string(value)) { return false; }

        option_kind kind;
        uint64_t numeric_value = 0;
        if (parse_option_name(name, kind) && parse_decimal(value, numeric_value))
        {
            options.push_back(transfer_option(kind, numeric_value));
        }
    }
    return true;
}


template <typename request_type> bool
deserialize_request(packet_reader& reader, request_type& request)
{
    return reader.deserialize_string(request.filename) && !request.filename.empty() &&
           is_text(request.filename, false) &&
           reader.deserialize_string(request.mode) && !request.mode.empty() && is_text(request.mode, false) &&
           deserialize_options(reader, request.options);
}


class serialize_visitor
    : public boost::static_visitor<>
{
public:
    explicit serialize_visitor(packet_writer& writer) : m_writer(writer) {}

    void operator()(read_request const& value) const { serialize_request(TFTP_OPCODE_RRQ, value); }
    void operator()(write_request const& value) const { serialize_request(TFTP_OPCODE_WRQ, value); }

    void operator()(data_packet const& value) const
    {
        if (TFTP_MAX_BLOCK_SIZE < value.payload.size()) { throw codec_exception(make_error_code(malformed_packet)); }
        m_writer.serialize_opcode(TFTP_OPCODE_DATA);
        m_writer.serialize_block_number(value.block);
        m_writer.serialize_bytes(value.payload);
    }

    void operator()(ack_packet const& value) const
    {
        m_writer.serialize_opcode(TFTP_OPCODE_ACK);
        m_writer.serialize_block_number(value.block);
    }

    void operator()(oack_packet const& value) const
    {
        m_writer.serialize_opcode(TFTP_OPCODE_OACK);
        m_writer.serialize_options(value.options);
    }

    void operator()(error_packet const& value) const
    {
        m_writer.serialize_opcode(TFTP_OPCODE_ERROR);
        m_writer.serialize_uint16(value.code);
        m_writer.serialize_string(value.message);
    }

private:
    template <typename request_type> void serialize_request(unsigned int opcode, request_type const& value) const
    {
        m_writer.serialize_opcode(opcode);
        m_writer.serialize_string(value.filename);
        m_writer.serialize_string(value.mode);
        m_writer.serialize_options(value.options);
    }

    packet_writer& m_writer;
};


class opcode_visitor
    : public boost::static_visitor<unsigned int>
{
public:
    unsigned int operator()(read_request const&) const { return TFTP_OPCODE_RRQ; }
    unsigned int operator()(write_request const&) const { return TFTP_OPCODE_WRQ; }
    unsigned int operator()(data_packet const&) const { return TFTP_OPCODE_DATA; }
    unsigned int operator()(ack_packet const&) const { return TFTP_OPCODE_ACK; }
    unsigned int operator()(oack_packet const&) const { return TFTP_OPCODE_OACK; }
    unsigned int operator()(error_packet const&) const { return TFTP_OPCODE_ERROR; }
};


} // namespace {


char const *
option_name(option_kind kind)
{
    switch (kind)
    {
        case option_block_size: return l_tftp_option_name_block_size;
        case option_window_size: return l_tftp_option_name_window_size;
        case option_timeout: return l_tftp_option_name_timeout;
        case option_transfer_size: return l_tftp_option_name_transfer_size;
    }
    return "";
}


bool
parse_option_name(string const& name, option_kind& kind)
{
    if (boost::algorithm::iequals(name, l_tftp_option_name_block_size)) { kind = option_block_size; return true; }
    if (boost::algorithm::iequals(name, l_tftp_option_name_window_size)) { kind = option_window_size; return true; }
    if (boost::algorithm::iequals(name, l_tftp_option_name_timeout)) { kind = option_timeout; return true; }
    if (boost::algorithm::iequals(name, l_tftp_option_name_transfer_size)) { kind = option_transfer_size; return true; }
    return false;
}


bool operator==(transfer_option const& lhs, transfer_option const& rhs)
{
    return lhs.kind == rhs.kind && lhs.value == rhs.value;
}

bool operator==(read_request const& lhs, read_request const& rhs)
{
    return lhs.filename == rhs.filename && lhs.mode == rhs.mode && lhs.options == rhs.options;
}

bool operator==(write_request const& lhs, write_request const& rhs)
{
    return lhs.filename == rhs.filename && lhs.mode == rhs.mode && lhs.options == rhs.options;
}

bool operator==(data_packet const& lhs, data_packet const& rhs)
{
    return lhs.block == rhs.block && lhs.payload == rhs.payload;
}

bool operator==(ack_packet const& lhs, ack_packet const& rhs)
{
    return lhs.block == rhs.block;
}

bool operator==(oack_packet const& lhs, oack_packet const& rhs)
{
    return lhs.options == rhs.options;
}

bool operator==(error_packet const& lhs, error_packet const& rhs)
{
    return lhs.code == rhs.code && lhs.message == rhs.message;
}


unsigned int
opcode_of(packet const& value)
{
    return boost::apply_visitor(opcode_visitor(), value);
}


char const *
opcode_name(unsigned int opcode)
{
    switch (opcode)
    {
        case TFTP_OPCODE_RRQ: return "RRQ";
        case TFTP_OPCODE_WRQ: return "WRQ";
        case TFTP_OPCODE_DATA: return "DATA";
        case TFTP_OPCODE_ACK: return "ACK";
        case TFTP_OPCODE_ERROR: return "ERROR";
        case TFTP_OPCODE_OACK: return "OACK";
        default: return "?";
    }
}


void
serialize(packet const& value, vector<uint8_t>& datagram)
{
    packet_writer writer(datagram);
    boost::apply_visitor(serialize_visitor(writer), value);
}


vector<uint8_t>
serialize(packet const& value)
{
    vector<uint8_t> datagram;
    serialize(value, datagram);
    return datagram;
}


bool
deserialize(uint8_t const *data, size_t size, packet& result, boost::system::error_code& error_code)
{
    packet_reader reader(data, size);

    unsigned int opcode = 0;
    if (!reader.deserialize_uint16(opcode))
    {
        error_code = make_error_code(malformed_packet);
        return false;
    }

    bool decoded = false;
    switch (opcode)
    {
        case TFTP_OPCODE_RRQ:
        {
            read_request request;
            decoded = deserialize_request(reader, request);
            if (decoded) { result = move(request); }
            break;
        }

        case TFTP_OPCODE_WRQ:
        {
            write_request request;
            decoded = deserialize_request(reader, request);
            if (decoded) { result = move(request); }
            break;
        }

        case TFTP_OPCODE_DATA:
        {
            data_packet block_data;
            unsigned int block = 0;
            decoded = reader.deserialize_uint16(block) && TFTP_MAX_BLOCK_SIZE >= reader.size_remaining();
            if (decoded)
            {
                block_data.block = static_cast<uint16_t>(block);
                reader.deserialize_remaining_bytes(block_data.payload);
                result = move(block_data);
            }
            break;
        }

        case TFTP_OPCODE_ACK:
        {
            unsigned int block = 0;
            decoded = reader.deserialize_uint16(block) && 0 == reader.size_remaining();
            if (decoded) { result = ack_packet(static_cast<uint16_t>(block)); }
            break;
        }

        case TFTP_OPCODE_ERROR:
        {
            error_packet error;
            unsigned int code = 0;
            decoded = reader.deserialize_uint16(code) && reader.deserialize_string(error.message) &&
                      is_text(error.message, true);
            if (decoded)
            {
                error.code = static_cast<uint16_t>(code);
                result = move(error);
            }
            break;
        }

        case TFTP_OPCODE_OACK:
        {
            oack_packet oack;
            decoded = deserialize_options(reader, oack.options);
            if (decoded) { result = move(oack); }
            break;
        }

        default:
        {
            error_code = make_error_code(unknown_opcode);
            return false;
        }
    }

    error_code = decoded ? boost::system::error_code() : make_error_code(malformed_packet);
    return decoded;
}


packet
deserialize(uint8_t const *data, size_t size)
{
    packet result;
    boost::system::error_code error_code;
    if (!deserialize(data, size, result, error_code)) { throw codec_exception(error_code); }
    return result;
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "packet.cpp"
*/
