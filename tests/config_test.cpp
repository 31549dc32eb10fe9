/*!
    \file "config_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <gtest/gtest.h>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <test_helpers.hpp>
#include <tftpkit/tftp/tftp.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;
using tftpkit::test::scratch_directory;


namespace po = boost::program_options;


namespace {


template <typename config_type>
void
parse(config_type& config, vector<char const *> args)
{
    args.insert(args.begin(), "tftpkit");

    po::options_description opts_desc;
    config.setup_config_parsing(&opts_desc);

    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(args.size()), args.data(), opts_desc), vm);
    po::notify(vm);
}


} // namespace {


TEST(server_config, defaults_serve_the_current_directory_on_port_69)
{
    server_config const config;

    EXPECT_EQ("0.0.0.0", config.listen_address);
    EXPECT_EQ(69, config.listen_port);
    EXPECT_EQ(".", config.effective_receive_directory());
    EXPECT_EQ(".", config.effective_send_directory());
    EXPECT_FALSE(config.single_port);
    EXPECT_FALSE(config.read_only);
    EXPECT_TRUE(config.overwrite);
    EXPECT_NO_THROW(config.validate());
}


TEST(server_config, command_line_fills_in_the_settings)
{
    scratch_directory root;
    string const directory(root.path().string());

    server_config config;
    parse(config, { "--address", "127.0.0.1", "--port", "6969", "--directory", directory.c_str(),
                    "--single-port", "--read-only", "--no-overwrite", "--retries", "3", "--timeout", "2",
                    "--max-blksize", "1024", "--max-windowsize", "8" });

    EXPECT_EQ("127.0.0.1", config.listen_address);
    EXPECT_EQ(6969, config.listen_port);
    EXPECT_EQ(directory, config.effective_send_directory());
    EXPECT_TRUE(config.single_port);
    EXPECT_TRUE(config.read_only);
    EXPECT_FALSE(config.overwrite);
    EXPECT_NO_THROW(config.validate());

    negotiation_limits const limits(config.limits());
    EXPECT_EQ(1024, limits.max_block_size);
    EXPECT_EQ(8, limits.max_window_size);
    EXPECT_EQ(boost::posix_time::seconds(2), limits.default_timeout);
    EXPECT_EQ(3u, limits.retry_limit);
}


TEST(server_config, separate_directories_per_direction)
{
    scratch_directory incoming;
    scratch_directory outgoing;

    server_config config;
    config.receive_directory = incoming.path().string();
    config.send_directory = outgoing.path().string();

    EXPECT_NO_THROW(config.validate());
    file_policy const policy(config.policy());
    EXPECT_TRUE(boost::filesystem::equivalent(incoming.path(), policy.root(direction_write)));
    EXPECT_TRUE(boost::filesystem::equivalent(outgoing.path(), policy.root(direction_read)));
}


TEST(server_config, invalid_settings_are_refused)
{
    scratch_directory root;

    server_config config;
    config.directory = root.path().string();
    config.listen_address = "not an address";
    EXPECT_THROW(config.validate(), configuration_exception);

    config = server_config();
    config.directory = (root / "missing").string();
    EXPECT_THROW(config.validate(), configuration_exception);

    config = server_config();
    config.directory = root.path().string();
    config.timeout_in_seconds = 0;
    EXPECT_THROW(config.validate(), configuration_exception);

    config.timeout_in_seconds = 5;
    config.max_block_size = 7;
    EXPECT_THROW(config.validate(), configuration_exception);

    config.max_block_size = 512;
    config.max_window_size = 0;
    EXPECT_THROW(config.validate(), configuration_exception);
}


TEST(client_config, default_sizes_are_not_requested)
{
    client_config const config;
    EXPECT_EQ("localhost", config.server_host);
    EXPECT_NO_THROW(config.validate());

    option_list const options(config.request_options(0));
    ASSERT_EQ(1u, options.size());
    EXPECT_EQ(option_transfer_size, options[0].kind);
    EXPECT_EQ(0u, options[0].value);
}


TEST(client_config, command_line_fills_in_the_request)
{
    client_config config;
    config.server_host = "localhost";
    parse(config, { "--port", "6969", "--blksize", "1428", "--windowsize", "4", "--timeout", "3",
                    "--retries", "2" });

    EXPECT_EQ(6969, config.port);
    EXPECT_NO_THROW(config.validate());

    option_list const options(config.request_options(1234));
    ASSERT_EQ(4u, options.size());
    EXPECT_EQ(option_block_size, options[0].kind);
    EXPECT_EQ(1428u, options[0].value);
    EXPECT_EQ(option_window_size, options[1].kind);
    EXPECT_EQ(4u, options[1].value);
    EXPECT_EQ(option_timeout, options[2].kind);
    EXPECT_EQ(3u, options[2].value);
    EXPECT_EQ(option_transfer_size, options[3].kind);
    EXPECT_EQ(1234u, options[3].value);

    transfer_profile const profile(config.default_profile());
    EXPECT_EQ(TFTP_DEFAULT_BLOCK_SIZE, profile.block_size);
    EXPECT_EQ(boost::posix_time::seconds(3), profile.timeout);
    EXPECT_EQ(2u, profile.retry_limit);
}


TEST(client_config, invalid_settings_are_refused)
{
    client_config config;
    config.server_host.clear();
    EXPECT_THROW(config.validate(), configuration_exception);

    config.server_host = "localhost";
    config.block_size = 65465;
    EXPECT_THROW(config.validate(), configuration_exception);

    config.block_size = 512;
    config.window_size = 0;
    EXPECT_THROW(config.validate(), configuration_exception);

    config.window_size = 1;
    config.timeout_in_seconds = 256;
    EXPECT_THROW(config.validate(), configuration_exception);

    config.timeout_in_seconds = 0;
    config.mode = "netascii";
    EXPECT_THROW(config.validate(), configuration_exception);
}


/*
    End of "config_test.cpp"
*/
