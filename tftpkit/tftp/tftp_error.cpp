/*!
    \file "tftp_error.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>


namespace tftpkit {
namespace tftp {


namespace {


char const *const l_tftp_error_names[] =
{
    "undefined error",
    "file not found",
    "access violation",
    "disk full or allocation exceeded",
    "illegal TFTP operation",
    "unknown transfer ID",
    "file already exists",
    "no such user",
    "option negotiation failed"
};


class tftp_category_impl
    : public boost::system::error_category
{
public:
    char const *name() const BOOST_NOEXCEPT { return "tftpkit.tftp"; }
    string message(int value) const { return tftp_error_name(static_cast<unsigned int>(value)); }
};


class transfer_category_impl
    : public boost::system::error_category
{
public:
    char const *name() const BOOST_NOEXCEPT { return "tftpkit.transfer"; }

    string message(int value) const
    {
        switch (value)
        {
            case malformed_packet: return "malformed packet";
            case unknown_opcode: return "unknown opcode";
            case unexpected_packet: return "unexpected packet";
            case retries_exhausted: return "no reply from peer, retries exhausted";
            case invalid_option: return "invalid option acknowledgement";
            case file_error: return "local file error";
            case peer_error: return "transfer aborted by peer";
            default: return "unknown transfer error";
        }
    }
};


} // namespace {


boost::system::error_category const&
tftp_category()
{
    static tftp_category_impl instance;
    return instance;
}


boost::system::error_category const&
transfer_category()
{
    static transfer_category_impl instance;
    return instance;
}


char const *
tftp_error_name(unsigned int code)
{
    return code < arycap(l_tftp_error_names) ? l_tftp_error_names[code] : "unknown error";
}


boost::system::error_code
peer_error_code(unsigned int code)
{
    if (error_file_not_found <= code && error_option_negotiation >= code)
    {
        return make_error_code(static_cast<tftp_error>(code));
    }
    return make_error_code(peer_error);
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "tftp_error.cpp"
*/
