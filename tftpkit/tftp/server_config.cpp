/*!
    \file "server_config.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/server_config.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options/value_semantic.hpp>


namespace tftpkit {
namespace tftp {


namespace po = boost::program_options;


server_config::server_config()
    : listen_address("0.0.0.0")
    , listen_port(TFTP_DEFAULT_PORT)
    , directory(".")
    , single_port(false)
    , read_only(false)
    , overwrite(true)
    , retry_limit(TFTP_DEFAULT_RETRY_LIMIT)
    , timeout_in_seconds(TFTP_DEFAULT_TIMEOUT_IN_SECONDS)
    , max_block_size(TFTP_MAX_BLOCK_SIZE)
    , max_window_size(TFTP_MAX_WINDOW_SIZE)
{
}


void
server_config::setup_config_parsing(po::options_description *opts_desc)
{
    opts_desc->add_options()
        ("address", po::value<string>(&listen_address)->default_value(listen_address),
         "Local address to listen on.")
        ("port", po::value<unsigned short>(&listen_port)->default_value(listen_port),
         "UDP port to listen on.")
        ("directory", po::value<string>(&directory)->default_value(directory),
         "Directory served for reads and writes.")
        ("receive-directory", po::value<string>(&receive_directory),
         "Directory receiving written files (default: --directory).")
        ("send-directory", po::value<string>(&send_directory),
         "Directory files are read from (default: --directory).")
        ("single-port", po::bool_switch(&single_port),
         "Serve every transfer from the listening port.")
        ("read-only", po::bool_switch(&read_only),
         "Refuse write requests.")
        ("no-overwrite", po::bool_switch()->notifier([this](bool value) { if (value) { overwrite = false; } }),
         "Refuse write requests for files that already exist.")
        ("retries", po::value<unsigned int>(&retry_limit)->default_value(retry_limit),
         "Consecutive timeouts tolerated before a transfer is abandoned.")
        ("timeout", po::value<unsigned int>(&timeout_in_seconds)->default_value(timeout_in_seconds),
         "Receive timeout in seconds, unless negotiated.")
        ("max-blksize", po::value<unsigned int>(&max_block_size)->default_value(max_block_size),
         "Largest block size granted.")
        ("max-windowsize", po::value<unsigned int>(&max_window_size)->default_value(max_window_size),
         "Largest window size granted.");
}


void
server_config::validate() const
{
    boost::system::error_code error_code;
    boost::asio::ip::address::from_string(listen_address, error_code);
    if (error_code) { throw configuration_exception("invalid listen address \"" + listen_address + "\""); }

    string const directories[] = { effective_receive_directory(), effective_send_directory() };
    for (size_t i = 0; arycap(directories) > i; ++i)
    {
        if (!boost::filesystem::is_directory(directories[i], error_code))
        {
            throw configuration_exception("not a directory: \"" + directories[i] + "\"");
        }
    }

    if (TFTP_MIN_TIMEOUT_IN_SECONDS > timeout_in_seconds || TFTP_MAX_TIMEOUT_IN_SECONDS < timeout_in_seconds)
    {
        throw configuration_exception("timeout must be between 1 and 255 seconds");
    }
    if (TFTP_MIN_BLOCK_SIZE > max_block_size || TFTP_MAX_BLOCK_SIZE < max_block_size)
    {
        throw configuration_exception("maximum block size must be between 8 and 65464");
    }
    if (1 > max_window_size || TFTP_MAX_WINDOW_SIZE < max_window_size)
    {
        throw configuration_exception("maximum window size must be between 1 and 65535");
    }
}


negotiation_limits
server_config::limits() const
{
    negotiation_limits limits;
    limits.max_block_size = static_cast<uint16_t>(max_block_size);
    limits.max_window_size = static_cast<uint16_t>(max_window_size);
    limits.default_timeout = boost::posix_time::seconds(timeout_in_seconds);
    limits.retry_limit = retry_limit;
    return limits;
}


file_policy
server_config::policy() const
{
    return file_policy(effective_send_directory(), effective_receive_directory(), read_only, overwrite);
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "server_config.cpp"
*/
