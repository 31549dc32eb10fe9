/*!
    \file "client_config.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/client_config.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options/value_semantic.hpp>


namespace tftpkit {
namespace tftp {


namespace po = boost::program_options;


client_config::client_config()
    : server_host("localhost")
    , port(TFTP_DEFAULT_PORT)
    , block_size(TFTP_DEFAULT_BLOCK_SIZE)
    , window_size(TFTP_DEFAULT_WINDOW_SIZE)
    , timeout_in_seconds(0)
    , retry_limit(TFTP_DEFAULT_RETRY_LIMIT)
    , mode("octet")
{
}


void
client_config::setup_config_parsing(po::options_description *opts_desc)
{
    opts_desc->add_options()
        ("port", po::value<unsigned short>(&port)->default_value(port),
         "Server UDP port.")
        ("blksize", po::value<unsigned int>(&block_size)->default_value(block_size),
         "Block size to request (8..65464).")
        ("windowsize", po::value<unsigned int>(&window_size)->default_value(window_size),
         "Window size to request (1..65535).")
        ("timeout", po::value<unsigned int>(&timeout_in_seconds)->default_value(timeout_in_seconds),
         "Timeout in seconds to request (1..255); 0 keeps the default.")
        ("retries", po::value<unsigned int>(&retry_limit)->default_value(retry_limit),
         "Consecutive timeouts tolerated before the transfer is abandoned.");
}


void
client_config::validate() const
{
    if (server_host.empty()) { throw configuration_exception("no server host"); }
    if (TFTP_MIN_BLOCK_SIZE > block_size || TFTP_MAX_BLOCK_SIZE < block_size)
    {
        throw configuration_exception("block size must be between 8 and 65464");
    }
    if (1 > window_size || TFTP_MAX_WINDOW_SIZE < window_size)
    {
        throw configuration_exception("window size must be between 1 and 65535");
    }
    if (0 != timeout_in_seconds && TFTP_MAX_TIMEOUT_IN_SECONDS < timeout_in_seconds)
    {
        throw configuration_exception("timeout must be between 1 and 255 seconds");
    }
    if (!boost::algorithm::iequals(mode, "octet")) { throw configuration_exception("only octet mode is supported"); }
}


option_list
client_config::request_options(uint64_t transfer_size) const
{
    option_list options;
    if (TFTP_DEFAULT_BLOCK_SIZE != block_size) { options.push_back(transfer_option(option_block_size, block_size)); }
    if (TFTP_DEFAULT_WINDOW_SIZE != window_size)
    {
        options.push_back(transfer_option(option_window_size, window_size));
    }
    if (0 != timeout_in_seconds) { options.push_back(transfer_option(option_timeout, timeout_in_seconds)); }
    options.push_back(transfer_option(option_transfer_size, transfer_size));
    return options;
}


transfer_profile
client_config::default_profile() const
{
    transfer_profile profile;
    profile.retry_limit = retry_limit;
    if (0 != timeout_in_seconds) { profile.timeout = boost::posix_time::seconds(timeout_in_seconds); }
    return profile;
}


negotiation_limits
client_config::limits() const
{
    negotiation_limits limits;
    limits.retry_limit = retry_limit;
    if (0 != timeout_in_seconds) { limits.default_timeout = boost::posix_time::seconds(timeout_in_seconds); }
    return limits;
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "client_config.cpp"
*/
