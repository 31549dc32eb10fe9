/*!
    \file "options_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <gtest/gtest.h>
#include <tftpkit/tftp/options.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;


namespace {


option_list
request(option_kind kind, uint64_t value)
{
    return option_list(1, transfer_option(kind, value));
}


uint64_t
acknowledged_value(negotiation_result const& result, option_kind kind)
{
    for (size_t i = 0; result.acknowledged.size() > i; ++i)
    {
        if (kind == result.acknowledged[i].kind) { return result.acknowledged[i].value; }
    }
    ADD_FAILURE() << option_name(kind) << " not acknowledged";
    return 0;
}


} // namespace {


TEST(negotiate, no_options_gives_the_classic_profile)
{
    negotiation_result const result = negotiate(option_list(), direction_read, negotiation_limits());

    EXPECT_EQ(512, result.profile.block_size);
    EXPECT_EQ(1, result.profile.window_size);
    EXPECT_EQ(boost::posix_time::seconds(5), result.profile.timeout);
    EXPECT_EQ(5u, result.profile.retry_limit);
    EXPECT_FALSE(result.profile.transfer_size);
    EXPECT_TRUE(result.acknowledged.empty());
    EXPECT_FALSE(result.oack_required());
}


TEST(negotiate, values_are_clamped_never_refused)
{
    negotiation_limits const limits;

    EXPECT_EQ(8, negotiate(request(option_block_size, 0), direction_read, limits).profile.block_size);
    EXPECT_EQ(8, negotiate(request(option_block_size, 4), direction_read, limits).profile.block_size);
    EXPECT_EQ(65464, negotiate(request(option_block_size, 70000), direction_read, limits).profile.block_size);
    EXPECT_EQ(65464, negotiate(request(option_block_size, UINT64_MAX), direction_read, limits).profile.block_size);

    EXPECT_EQ(1, negotiate(request(option_window_size, 0), direction_read, limits).profile.window_size);
    EXPECT_EQ(65535, negotiate(request(option_window_size, 1 << 20), direction_read, limits).profile.window_size);

    EXPECT_EQ(boost::posix_time::seconds(1),
              negotiate(request(option_timeout, 0), direction_read, limits).profile.timeout);
    EXPECT_EQ(boost::posix_time::seconds(255),
              negotiate(request(option_timeout, 1000), direction_read, limits).profile.timeout);
}


TEST(negotiate, local_limits_cap_the_grant)
{
    negotiation_limits limits;
    limits.max_block_size = 1428;
    limits.max_window_size = 8;

    option_list requested;
    requested.push_back(transfer_option(option_block_size, 9000));
    requested.push_back(transfer_option(option_window_size, 64));

    negotiation_result const result = negotiate(requested, direction_write, limits);
    EXPECT_EQ(1428, result.profile.block_size);
    EXPECT_EQ(8, result.profile.window_size);
    EXPECT_EQ(1428u, acknowledged_value(result, option_block_size));
    EXPECT_EQ(8u, acknowledged_value(result, option_window_size));
    EXPECT_TRUE(result.oack_required());
}


TEST(negotiate, last_occurrence_wins)
{
    option_list requested;
    requested.push_back(transfer_option(option_block_size, 1024));
    requested.push_back(transfer_option(option_block_size, 2048));

    negotiation_result const result = negotiate(requested, direction_read, negotiation_limits());
    EXPECT_EQ(2048, result.profile.block_size);
    ASSERT_EQ(1u, result.acknowledged.size());
    EXPECT_EQ(2048u, result.acknowledged[0].value);
}


TEST(negotiate, default_values_need_no_oack)
{
    option_list requested;
    requested.push_back(transfer_option(option_block_size, 512));
    requested.push_back(transfer_option(option_window_size, 1));
    requested.push_back(transfer_option(option_timeout, 5));

    negotiation_result const result = negotiate(requested, direction_read, negotiation_limits());
    EXPECT_EQ(3u, result.acknowledged.size());
    EXPECT_FALSE(result.oack_required());
}


TEST(negotiate, transfer_size_on_read_is_the_file_size)
{
    negotiation_limits limits;
    limits.file_size = 123456;

    negotiation_result const result = negotiate(request(option_transfer_size, 0), direction_read, limits);
    ASSERT_TRUE(result.profile.transfer_size);
    EXPECT_EQ(123456u, *result.profile.transfer_size);
    EXPECT_EQ(123456u, acknowledged_value(result, option_transfer_size));
    EXPECT_TRUE(result.oack_required());
}


TEST(negotiate, transfer_size_on_read_of_unknown_size_is_not_acknowledged)
{
    negotiation_result const result = negotiate(request(option_transfer_size, 0), direction_read,
                                                negotiation_limits());
    EXPECT_FALSE(result.profile.transfer_size);
    EXPECT_TRUE(result.acknowledged.empty());
    EXPECT_FALSE(result.oack_required());
}


TEST(negotiate, transfer_size_on_write_is_kept)
{
    negotiation_limits limits;
    limits.file_size = 1; // Ignored for writes.

    negotiation_result const result = negotiate(request(option_transfer_size, 4096), direction_write, limits);
    ASSERT_TRUE(result.profile.transfer_size);
    EXPECT_EQ(4096u, *result.profile.transfer_size);
    EXPECT_EQ(4096u, acknowledged_value(result, option_transfer_size));
}


TEST(negotiate, timeout_and_retry_limit_follow_the_limits)
{
    negotiation_limits limits;
    limits.default_timeout = boost::posix_time::seconds(2);
    limits.retry_limit = 9;

    negotiation_result const result = negotiate(option_list(), direction_read, limits);
    EXPECT_EQ(boost::posix_time::seconds(2), result.profile.timeout);
    EXPECT_EQ(9u, result.profile.retry_limit);
}


TEST(accept_oack, grants_within_the_request_are_taken)
{
    option_list requested;
    requested.push_back(transfer_option(option_block_size, 1428));
    requested.push_back(transfer_option(option_window_size, 16));
    requested.push_back(transfer_option(option_timeout, 2));
    requested.push_back(transfer_option(option_transfer_size, 0));

    option_list acknowledged;
    acknowledged.push_back(transfer_option(option_block_size, 1024));
    acknowledged.push_back(transfer_option(option_transfer_size, 99999));

    transfer_profile profile;
    ASSERT_TRUE(accept_oack(requested, acknowledged, negotiation_limits(), profile));
    EXPECT_EQ(1024, profile.block_size);
    EXPECT_EQ(1, profile.window_size); // Not acknowledged: default.
    EXPECT_EQ(boost::posix_time::seconds(5), profile.timeout);
    ASSERT_TRUE(profile.transfer_size);
    EXPECT_EQ(99999u, *profile.transfer_size);
}


TEST(accept_oack, bad_grants_are_refused)
{
    option_list requested;
    requested.push_back(transfer_option(option_block_size, 1024));
    requested.push_back(transfer_option(option_window_size, 4));
    requested.push_back(transfer_option(option_timeout, 3));

    transfer_profile profile;
    negotiation_limits const limits;

    EXPECT_FALSE(accept_oack(requested, request(option_block_size, 2048), limits, profile));
    EXPECT_FALSE(accept_oack(requested, request(option_window_size, 5), limits, profile));
    EXPECT_FALSE(accept_oack(requested, request(option_window_size, 0), limits, profile));
    EXPECT_FALSE(accept_oack(requested, request(option_timeout, 0), limits, profile));
    EXPECT_FALSE(accept_oack(requested, request(option_timeout, 256), limits, profile));
    EXPECT_FALSE(accept_oack(requested, request(option_transfer_size, 1), limits, profile)); // Not requested.

    EXPECT_TRUE(accept_oack(requested, request(option_timeout, 3), limits, profile));
    EXPECT_EQ(boost::posix_time::seconds(3), profile.timeout);
}


/*
    End of "options_test.cpp"
*/
