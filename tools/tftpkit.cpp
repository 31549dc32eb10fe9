/*!
    \file "tftpkit.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    Command line front end:

        tftpkit server [options]
        tftpkit get HOST REMOTE [LOCAL] [options]
        tftpkit put HOST LOCAL [REMOTE] [options]
*/


#include <csignal>
#include <iostream>
#include <tftpkit/tftp/tftp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;

namespace po = boost::program_options;


namespace {


int constexpr EXIT_OK = 0;
int constexpr EXIT_FAILED = 1;


/// Options every subcommand takes.
struct common_options
{
    string config_pathname;
    bool verbose;
    bool help;

    common_options() : verbose(false), help(false) {}

    void setup_config_parsing(po::options_description *opts_desc)
    {
        opts_desc->add_options()
            ("config", po::value<string>(&config_pathname), "INI style file with further options.")
            ("verbose,v", po::bool_switch(&verbose), "Log each transfer step.")
            ("help,h", po::bool_switch(&help), "Show this help.");
    }
};


void
print_usage(std::ostream& os)
{
    os << "usage: tftpkit server [options]\n"
          "       tftpkit get HOST REMOTE [LOCAL] [options]\n"
          "       tftpkit put HOST LOCAL [REMOTE] [options]\n"
          "Run \"tftpkit <command> --help\" for the options of a command.\n";
}


/**
 * Parses 'args' into the variables bound by 'opts_desc'.  The command line wins over the config file, so it is
 * stored first.  Returns false when only help was asked for.
 */
bool
parse(vector<string> const& args, po::options_description const& opts_desc,
      po::positional_options_description const& positional, common_options& common, char const *usage)
{
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(opts_desc).positional(positional).run(), vm);

    if (vm.count("config"))
    {
        string const config_pathname(vm["config"].as<string>());
        po::store(po::parse_config_file<char>(config_pathname.c_str(), opts_desc), vm);
    }

    if (vm.count("help") && vm["help"].as<bool>())
    {
        std::cout << usage << "\n" << opts_desc;
        return false;
    }

    po::notify(vm);

    if (common.verbose) { set_log_threshold(log_level_debug); }
    return true;
}


int
run_server(vector<string> const& args)
{
    server_config config;
    common_options common;

    po::options_description opts_desc("server options");
    config.setup_config_parsing(&opts_desc);
    common.setup_config_parsing(&opts_desc);

    if (!parse(args, opts_desc, po::positional_options_description(), common, "usage: tftpkit server [options]"))
    {
        return EXIT_OK;
    }
    config.validate();

    io_service io_service;
    tftp_server server(io_service, config);
    server.subscribe_to_transfer_complete([](transfer_summary const& summary) {
        tftpkit_log(log_level_debug, "%s \"%s\": %llu bytes in %s, %llu retransmits",
                    direction_name(summary.direction), summary.filename.c_str(),
                    static_cast<unsigned long long>(summary.stats.bytes_transferred),
                    boost::posix_time::to_simple_string(summary.elapsed).c_str(),
                    static_cast<unsigned long long>(summary.stats.retransmits));
    });
    server.startup();

    boost::asio::signal_set signals(io_service, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code const& error_code, int signal_number) {
        if (error_code) { return; }
        tftpkit_log(log_level_info, "signal %d, shutting down", signal_number);
        server.shutdown();
        io_service.stop();
    });

    io_service.run();
    return EXIT_OK;
}


int
run_transfer(transfer_direction direction, vector<string> const& args)
{
    client_config config;
    common_options common;
    string first_pathname;
    string second_pathname;

    po::options_description visible(direction_read == direction ? "get options" : "put options");
    config.setup_config_parsing(&visible);
    common.setup_config_parsing(&visible);

    po::options_description hidden;
    hidden.add_options()
        ("host", po::value<string>(&config.server_host)->required(), "Server host.")
        ("first", po::value<string>(&first_pathname)->required(), "Remote (get) or local (put) file.")
        ("second", po::value<string>(&second_pathname), "Local (get) or remote (put) file.");

    po::options_description opts_desc;
    opts_desc.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("host", 1).add("first", 1).add("second", 1);

    char const *const usage = direction_read == direction ? "usage: tftpkit get HOST REMOTE [LOCAL] [options]"
                                                          : "usage: tftpkit put HOST LOCAL [REMOTE] [options]";
    if (!parse(args, opts_desc, positional, common, usage)) { return EXIT_OK; }

    // The missing name defaults to the file name part of the given one.
    if (second_pathname.empty())
    {
        second_pathname = boost::filesystem::path(first_pathname).filename().string();
    }

    io_service io_service;
    tftp_client client(io_service, config);
    if (direction_read == direction)
    {
        client.get(first_pathname, second_pathname);
    }
    else
    {
        client.put(first_pathname, second_pathname);
    }

    transfer_session::statistics const stats(client.statistics());
    tftpkit_log(log_level_info, "%s \"%s\": %llu bytes, block size %u, window size %u, %llu retransmits",
                direction_read == direction ? "received" : "sent", first_pathname.c_str(),
                static_cast<unsigned long long>(stats.bytes_transferred),
                static_cast<unsigned int>(client.profile().block_size),
                static_cast<unsigned int>(client.profile().window_size),
                static_cast<unsigned long long>(stats.retransmits));
    return EXIT_OK;
}


} // namespace {


int
main(int argc, char *argv[])
{
    if (2 > argc)
    {
        print_usage(std::cerr);
        return EXIT_FAILED;
    }

    string const command(argv[1]);
    vector<string> const args(argv + 2, argv + argc);

    try
    {
        if ("server" == command) { return run_server(args); }
        if ("get" == command) { return run_transfer(direction_read, args); }
        if ("put" == command) { return run_transfer(direction_write, args); }
        if ("--help" == command || "-h" == command)
        {
            print_usage(std::cout);
            return EXIT_OK;
        }

        print_usage(std::cerr);
        return EXIT_FAILED;
    }
    catch (transfer_exception const& e)
    {
        if (e.peer_error())
        {
            tftpkit_log(log_level_error, "transfer failed: server sent ERROR %u (%s): %s",
                        static_cast<unsigned int>(e.peer_error()->code), tftp_error_name(e.peer_error()->code),
                        e.peer_error()->message.c_str());
        }
        else
        {
            tftpkit_log(log_level_error, "transfer failed: %s", e.code().message().c_str());
        }
    }
    catch (configuration_exception const& e)
    {
        tftpkit_log(log_level_error, "configuration: %s", e.what());
    }
    catch (po::error const& e)
    {
        tftpkit_log(log_level_error, "%s", e.what());
        print_usage(std::cerr);
    }
    catch (std::exception const& e)
    {
        tftpkit_log(log_level_error, "%s", e.what());
    }

    return EXIT_FAILED;
}


/*
    End of "tftpkit.cpp"
*/
