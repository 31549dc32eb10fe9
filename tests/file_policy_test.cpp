/*!
    \file "file_policy_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <gtest/gtest.h>
#include <test_helpers.hpp>
#include <tftpkit/tftp/file_policy.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;
using tftpkit::test::make_content;
using tftpkit::test::scratch_directory;
using tftpkit::test::write_file;


namespace fs = boost::filesystem;


class file_policy_test
    : public ::testing::Test
{
protected:
    file_policy_test()
        : m_outside(m_scratch / "outside")
        , m_send(m_scratch / "send")
        , m_receive(m_scratch / "receive")
        , m_policy(m_send, m_receive, false, true)
    {
        fs::create_directories(m_outside);
        fs::create_directories(m_send / "images");
        fs::create_directories(m_receive);
        write_file(m_send / "images" / "boot.img", make_content(4096));
        write_file(m_outside / "secret", make_content(16));
    }

    boost::system::error_code resolve(string const& filename, transfer_direction direction = direction_read)
    {
        m_resolved.clear();
        return m_policy.resolve(filename, direction, m_resolved);
    }

protected:
    scratch_directory m_scratch;
    fs::path const m_outside;
    fs::path const m_send;
    fs::path const m_receive;
    file_policy m_policy;
    fs::path m_resolved;
};


TEST_F(file_policy_test, names_resolve_below_the_root_of_their_direction)
{
    EXPECT_FALSE(resolve("images/boot.img"));
    EXPECT_EQ(m_send / "images" / "boot.img", m_resolved);

    EXPECT_FALSE(resolve("upload.bin", direction_write));
    EXPECT_EQ(m_receive / "upload.bin", m_resolved);
}


TEST_F(file_policy_test, leading_slash_and_dot_components_are_ignored)
{
    EXPECT_FALSE(resolve("/images/boot.img"));
    EXPECT_EQ(m_send / "images" / "boot.img", m_resolved);

    EXPECT_FALSE(resolve("./images//./boot.img"));
    EXPECT_EQ(m_send / "images" / "boot.img", m_resolved);
}


TEST_F(file_policy_test, traversal_is_an_access_violation)
{
    boost::system::error_code const violation(make_error_code(error_access_violation));

    EXPECT_EQ(violation, resolve("../outside/secret"));
    EXPECT_EQ(violation, resolve("images/../../outside/secret"));
    EXPECT_EQ(violation, resolve("images/.."));
    EXPECT_EQ(violation, resolve(".."));
    EXPECT_TRUE(m_resolved.empty());
}


TEST_F(file_policy_test, names_without_a_file_are_refused)
{
    boost::system::error_code const violation(make_error_code(error_access_violation));

    EXPECT_EQ(violation, resolve(""));
    EXPECT_EQ(violation, resolve("/"));
    EXPECT_EQ(violation, resolve("."));
    EXPECT_EQ(violation, resolve("//./"));
}


TEST_F(file_policy_test, symbolic_links_out_of_the_root_are_refused)
{
    fs::create_directory_symlink(m_outside, m_send / "escape");

    EXPECT_EQ(make_error_code(error_access_violation), resolve("escape/secret"));
}


TEST_F(file_policy_test, symbolic_links_within_the_root_are_followed)
{
    fs::create_directory_symlink(m_send / "images", m_send / "current");

    EXPECT_FALSE(resolve("current/boot.img"));
}


TEST_F(file_policy_test, read_only_refuses_writes_only)
{
    file_policy const read_only(m_send, m_receive, true, true);

    EXPECT_FALSE(read_only.check_request(direction_read));
    EXPECT_EQ(make_error_code(error_access_violation), read_only.check_request(direction_write));
    EXPECT_EQ(make_error_code(error_access_violation),
              read_only.check_writable(m_receive / "new.bin", boost::optional<uint64_t>()));

    EXPECT_FALSE(m_policy.check_request(direction_write));
}


TEST_F(file_policy_test, readable_reports_size_or_the_rfc_error)
{
    uint64_t size = 0;
    EXPECT_FALSE(m_policy.check_readable(m_send / "images" / "boot.img", size));
    EXPECT_EQ(4096u, size);

    EXPECT_EQ(make_error_code(error_file_not_found), m_policy.check_readable(m_send / "nothing", size));
    EXPECT_EQ(make_error_code(error_access_violation), m_policy.check_readable(m_send / "images", size));
}


TEST_F(file_policy_test, writable_checks_overwrite_parent_and_space)
{
    boost::optional<uint64_t> const no_size;

    EXPECT_FALSE(m_policy.check_writable(m_receive / "new.bin", no_size));
    EXPECT_FALSE(m_policy.check_writable(m_receive / "new.bin", boost::optional<uint64_t>(1024)));

    write_file(m_receive / "existing.bin", make_content(8));
    EXPECT_FALSE(m_policy.check_writable(m_receive / "existing.bin", no_size));

    file_policy const keep(m_send, m_receive, false, false);
    EXPECT_EQ(make_error_code(error_file_exists), keep.check_writable(m_receive / "existing.bin", no_size));

    EXPECT_EQ(make_error_code(error_file_not_found),
              m_policy.check_writable(m_receive / "no" / "such" / "dir.bin", no_size));

    EXPECT_EQ(make_error_code(error_disk_full),
              m_policy.check_writable(m_receive / "huge.bin", boost::optional<uint64_t>(UINT64_MAX / 2)));
}


/*
    End of "file_policy_test.cpp"
*/
