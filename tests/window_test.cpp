/*!
    \file "window_test.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <gtest/gtest.h>
#include <test_helpers.hpp>
#include <tftpkit/tftp/window.hpp>


using namespace tftpkit;
using namespace tftpkit::tftp;
using tftpkit::test::make_content;


namespace {


string
as_string(vector<uint8_t> const& content)
{
    return string(content.begin(), content.end());
}


} // namespace {


TEST(window, short_last_block_ends_the_source)
{
    std::istringstream source(as_string(make_content(1300)));
    window w(source, 512, 4);

    EXPECT_FALSE(w.fill());
    ASSERT_EQ(3u, w.size());
    EXPECT_EQ(512u, w.elements()[0].size());
    EXPECT_EQ(512u, w.elements()[1].size());
    EXPECT_EQ(276u, w.elements()[2].size());
    EXPECT_TRUE(w.end_reached());
    EXPECT_FALSE(w.ends_on_block_boundary());
    EXPECT_EQ(1300u, w.bytes_read());
}


TEST(window, exact_multiple_ends_on_block_boundary)
{
    std::istringstream source(as_string(make_content(1024)));
    window w(source, 512, 4);

    w.fill();
    EXPECT_EQ(2u, w.size());
    EXPECT_TRUE(w.ends_on_block_boundary());
}


TEST(window, empty_source_holds_no_block)
{
    std::istringstream source;
    window w(source, 512, 1);

    EXPECT_FALSE(w.fill());
    EXPECT_TRUE(w.empty());
    EXPECT_TRUE(w.ends_on_block_boundary());
}


TEST(window, fill_stops_at_window_size_and_resumes_after_consume)
{
    vector<uint8_t> const content(make_content(5000));
    std::istringstream source(as_string(content));
    window w(source, 512, 2);

    EXPECT_TRUE(w.fill());
    EXPECT_EQ(2u, w.size());
    EXPECT_FALSE(w.end_reached());

    w.consume(1);
    ASSERT_EQ(1u, w.size());
    EXPECT_TRUE(vector<uint8_t>(content.begin() + 512, content.begin() + 1024) == w.elements()[0]);

    EXPECT_TRUE(w.fill());
    ASSERT_EQ(2u, w.size());
    EXPECT_TRUE(vector<uint8_t>(content.begin() + 1024, content.begin() + 1536) == w.elements()[1]);

    w.consume(10);
    EXPECT_TRUE(w.empty());
}


TEST(window, clear_discards_everything)
{
    std::istringstream source(as_string(make_content(100)));
    window w(source, 8, 4);

    w.fill();
    EXPECT_EQ(4u, w.size());
    w.clear();
    EXPECT_TRUE(w.empty());
    EXPECT_EQ(32u, w.bytes_read());
}


TEST(window, failing_source_throws)
{
    std::istringstream source("data");
    source.setstate(ios_base::badbit);
    window w(source, 512, 1);

    EXPECT_THROW(w.fill(), window::source_read_exception);
}


/*
    End of "window_test.cpp"
*/
