/*!
    \file "transfer_worker_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    Server side of a transfer: request validation, option negotiation and file handling.
*/


#include <gtest/gtest.h>
#include <test_helpers.hpp>
#include <tftpkit/tftp/transfer_worker.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;
using tftpkit::test::fake_transfer_socket;
using tftpkit::test::make_content;
using tftpkit::test::read_file;
using tftpkit::test::scratch_directory;
using tftpkit::test::write_file;


namespace fs = boost::filesystem;


class transfer_worker_test
    : public ::testing::Test
{
protected:
    transfer_worker_test()
        : mp_socket(make_shared<fake_transfer_socket>(m_io_service))
        , m_policy(m_root.path(), m_root.path(), false, true)
        , mi_summary_count(0)
    {
    }

    transfer_request make_request(transfer_direction direction, string const& filename)
    {
        transfer_request request;
        request.direction = direction;
        request.filename = filename;
        request.mode = "octet";
        request.path = m_root / filename;
        return request;
    }

    /// Runs a worker for 'request' until it has finished.
    void run(transfer_request const& request)
    {
        transfer_worker_ptr worker(transfer_worker::create(mp_socket, request, m_policy, m_limits,
                                                           [this](transfer_summary const& summary) {
                                                               m_summary = summary;
                                                               ++mi_summary_count;
                                                           }));
        worker->start();
        m_io_service.run();

        EXPECT_TRUE(worker->finished());
        EXPECT_EQ(1u, mi_summary_count);
        EXPECT_FALSE(mp_socket->is_open());
    }

    /// A peer acknowledging every DATA packet, and ACKing an OACK with ACK 0.
    void acknowledge_everything()
    {
        fake_transfer_socket *const socket = mp_socket.get();
        mp_socket->set_peer([socket](packet const& sent) {
            if (data_packet const *data = boost::get<data_packet>(&sent))
            {
                socket->push_reply(ack_packet(data->block));
            }
            else if (boost::get<oack_packet>(&sent))
            {
                socket->push_reply(ack_packet(0));
            }
        });
    }

    error_packet const *last_error() const
    {
        return mp_socket->sent().empty() ? nullptr : boost::get<error_packet>(&mp_socket->sent().back());
    }

protected:
    io_service m_io_service;
    scratch_directory m_root;
    shared_ptr<fake_transfer_socket> mp_socket;
    file_policy m_policy;
    negotiation_limits m_limits;
    transfer_summary m_summary;
    size_t mi_summary_count;
};


TEST_F(transfer_worker_test, read_without_options_starts_with_data_1)
{
    vector<uint8_t> const content(make_content(1000));
    write_file(m_root / "kernel.img", content);
    acknowledge_everything();

    run(make_request(direction_read, "kernel.img"));

    EXPECT_FALSE(m_summary.status);
    EXPECT_EQ(direction_read, m_summary.direction);
    EXPECT_EQ("kernel.img", m_summary.filename);
    EXPECT_EQ(1000u, m_summary.stats.bytes_transferred);
    EXPECT_EQ(2u, mp_socket->count<data_packet>());
    EXPECT_EQ(0u, mp_socket->count<oack_packet>());
    ASSERT_NE(nullptr, boost::get<data_packet>(&mp_socket->sent().front()));
}


TEST_F(transfer_worker_test, read_with_options_waits_for_ack_0)
{
    write_file(m_root / "initrd", make_content(1000));
    acknowledge_everything();

    transfer_request request(make_request(direction_read, "initrd"));
    request.options.push_back(transfer_option(option_block_size, 1024));
    request.options.push_back(transfer_option(option_transfer_size, 0));
    request.options.push_back(transfer_option(option_timeout, 0)); // Clamped to 1.
    run(request);

    EXPECT_FALSE(m_summary.status);
    oack_packet const *oack = boost::get<oack_packet>(&mp_socket->sent().front());
    ASSERT_NE(nullptr, oack);
    ASSERT_EQ(3u, oack->options.size());
    EXPECT_TRUE(transfer_option(option_block_size, 1024) == oack->options[0]);
    EXPECT_TRUE(transfer_option(option_timeout, 1) == oack->options[1]);
    EXPECT_TRUE(transfer_option(option_transfer_size, 1000) == oack->options[2]);

    // One short block carries the whole file.
    EXPECT_EQ(1u, mp_socket->count<data_packet>());
}


TEST_F(transfer_worker_test, read_of_missing_file_is_error_1)
{
    run(make_request(direction_read, "missing.bin"));

    EXPECT_EQ(make_error_code(error_file_not_found), m_summary.status);
    ASSERT_NE(nullptr, last_error());
    EXPECT_EQ(error_file_not_found, last_error()->code);
    EXPECT_EQ(1u, mp_socket->sent().size());
}


TEST_F(transfer_worker_test, read_of_a_directory_is_error_2)
{
    fs::create_directory(m_root / "subdir");
    run(make_request(direction_read, "subdir"));

    ASSERT_NE(nullptr, last_error());
    EXPECT_EQ(error_access_violation, last_error()->code);
}


TEST_F(transfer_worker_test, netascii_is_refused_with_error_4)
{
    write_file(m_root / "motd", make_content(10));
    transfer_request request(make_request(direction_read, "motd"));
    request.mode = "netascii";
    run(request);

    ASSERT_NE(nullptr, last_error());
    EXPECT_EQ(error_illegal_operation, last_error()->code);
    EXPECT_EQ(make_error_code(error_illegal_operation), m_summary.status);
}


TEST_F(transfer_worker_test, mode_is_case_insensitive)
{
    write_file(m_root / "motd", make_content(10));
    acknowledge_everything();
    transfer_request request(make_request(direction_read, "motd"));
    request.mode = "OCTET";
    run(request);

    EXPECT_FALSE(m_summary.status);
}


TEST_F(transfer_worker_test, ack_other_than_0_during_negotiation_is_ignored)
{
    write_file(m_root / "a.bin", make_content(10));
    mp_socket->push_reply(ack_packet(7));
    mp_socket->push_reply(ack_packet(0));
    mp_socket->push_reply(ack_packet(1));

    transfer_request request(make_request(direction_read, "a.bin"));
    request.options.push_back(transfer_option(option_transfer_size, 0));
    run(request);

    EXPECT_FALSE(m_summary.status);
    EXPECT_EQ(1u, mp_socket->count<oack_packet>());
    EXPECT_EQ(1u, mp_socket->count<data_packet>());
}


TEST_F(transfer_worker_test, write_with_options_acknowledges_with_oack)
{
    vector<uint8_t> const content(make_content(20));
    mp_socket->push_reply(data_packet(1, vector<uint8_t>(content.begin(), content.begin() + 8)));
    mp_socket->push_reply(data_packet(2, vector<uint8_t>(content.begin() + 8, content.begin() + 16)));
    mp_socket->push_reply(data_packet(3, vector<uint8_t>(content.begin() + 16, content.end())));

    transfer_request request(make_request(direction_write, "upload.bin"));
    request.options.push_back(transfer_option(option_block_size, 8));
    request.options.push_back(transfer_option(option_window_size, 2));
    request.options.push_back(transfer_option(option_transfer_size, 20));
    run(request);

    EXPECT_FALSE(m_summary.status);
    EXPECT_TRUE(content == read_file(m_root / "upload.bin"));

    ASSERT_EQ(3u, mp_socket->sent().size());
    EXPECT_NE(nullptr, boost::get<oack_packet>(&mp_socket->sent()[0]));
    EXPECT_TRUE(ack_packet(2) == boost::get<ack_packet>(mp_socket->sent()[1]));
    EXPECT_TRUE(ack_packet(3) == boost::get<ack_packet>(mp_socket->sent()[2]));
}


TEST_F(transfer_worker_test, write_without_options_acknowledges_with_ack_0)
{
    mp_socket->push_reply(data_packet(1, vector<uint8_t>(512, 7)));
    mp_socket->push_reply(data_packet(2, vector<uint8_t>()));

    run(make_request(direction_write, "exact.bin"));

    EXPECT_FALSE(m_summary.status);
    EXPECT_EQ(512u, fs::file_size(m_root / "exact.bin"));
    EXPECT_TRUE(ack_packet(0) == boost::get<ack_packet>(mp_socket->sent().front()));
}


TEST_F(transfer_worker_test, write_over_existing_file_without_overwrite_is_error_6)
{
    vector<uint8_t> const original(make_content(30));
    write_file(m_root / "config.txt", original);
    m_policy = file_policy(m_root.path(), m_root.path(), false, false);

    run(make_request(direction_write, "config.txt"));

    ASSERT_NE(nullptr, last_error());
    EXPECT_EQ(error_file_exists, last_error()->code);
    EXPECT_TRUE(original == read_file(m_root / "config.txt"));
}


TEST_F(transfer_worker_test, write_larger_than_free_space_is_error_3)
{
    transfer_request request(make_request(direction_write, "huge.bin"));
    request.options.push_back(transfer_option(option_transfer_size, UINT64_MAX / 2));
    run(request);

    ASSERT_NE(nullptr, last_error());
    EXPECT_EQ(error_disk_full, last_error()->code);
    EXPECT_FALSE(fs::exists(m_root / "huge.bin"));
}


TEST_F(transfer_worker_test, failed_write_removes_the_partial_file)
{
    mp_socket->push_reply(data_packet(1, vector<uint8_t>(512, 1)));
    mp_socket->push_reply(error_packet(error_undefined, "user cancelled"));

    run(make_request(direction_write, "partial.bin"));

    EXPECT_EQ(make_error_code(peer_error), m_summary.status);
    EXPECT_FALSE(fs::exists(m_root / "partial.bin"));
    EXPECT_EQ(0u, mp_socket->count<error_packet>());
}


TEST_F(transfer_worker_test, failed_overwrite_keeps_the_existing_file)
{
    write_file(m_root / "firmware.bin", make_content(2000));
    mp_socket->push_reply(data_packet(1, vector<uint8_t>(512, 3)));
    mp_socket->push_reply(error_packet(error_disk_full, "client disk full"));

    run(make_request(direction_write, "firmware.bin"));

    EXPECT_EQ(make_error_code(error_disk_full), m_summary.status);
    ASSERT_TRUE(fs::exists(m_root / "firmware.bin"));
    EXPECT_EQ(512u, fs::file_size(m_root / "firmware.bin"));
}


TEST_F(transfer_worker_test, refused_write_leaves_an_existing_file_alone)
{
    write_file(m_root / "keep.bin", make_content(5));
    m_policy = file_policy(m_root.path(), m_root.path(), false, false);

    run(make_request(direction_write, "keep.bin"));

    EXPECT_TRUE(m_summary.status);
    EXPECT_TRUE(fs::exists(m_root / "keep.bin"));
}


/*
    End of "transfer_worker_test.cpp"
*/
