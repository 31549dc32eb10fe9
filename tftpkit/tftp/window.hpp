/*!
    \file "window.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef WINDOW_HPP__0C8A39F4_5B87_4E51_9D0C_6E2A8D41F7B3__INCLUDED
#define WINDOW_HPP__0C8A39F4_5B87_4E51_9D0C_6E2A8D41F7B3__INCLUDED


#pragma once


#include <deque>
#include <istream>
#include <tftpkit/tftp/tftp_env.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Blocks read ahead from a byte source and held until the peer acknowledges them.
 *
 * The window never produces an empty block; a source whose length is a multiple of the block size (the empty
 * source included) ends with ends_on_block_boundary() == true and the caller sends the terminal empty block.
 */
class window
    : public boost::noncopyable
{
public:
    DECLARE_EXCEPTION(window_exception, "window error");
    DECLARE_EXCEPTION(source_read_exception, "error reading transfer source", window_exception);

    typedef vector<uint8_t> block_t;
    typedef std::deque<block_t> elements_t;

public:
    /// Reads blocks until window_size are held or the source ends.  Returns false once the source has ended.
    bool fill();

    elements_t const& elements() const { return m_elements; }
    size_t size() const { return m_elements.size(); }
    bool empty() const { return m_elements.empty(); }

    void clear() { m_elements.clear(); }
    void consume(size_t count); //!< Discards the first 'count' blocks.

    bool end_reached() const { return mb_end_reached; }
    bool ends_on_block_boundary() const { return mb_end_reached && mb_last_read_empty; }

    size_t block_size() const { return m_block_size; }
    size_t window_size() const { return m_window_size; }
    uint64_t bytes_read() const { return m_bytes_read; }

    window(std::istream& source, size_t block_size, size_t window_size);

private:
    std::istream& m_source;
    size_t const m_block_size;
    size_t const m_window_size;
    elements_t m_elements;
    uint64_t m_bytes_read;
    bool mb_end_reached;
    bool mb_last_read_empty;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef WINDOW_HPP__0C8A39F4_5B87_4E51_9D0C_6E2A8D41F7B3__INCLUDED


/*
    End of "window.hpp"
*/
