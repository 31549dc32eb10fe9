/*!
    \file "window.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/window.hpp>


//#define ENABLE_TRACE

#ifdef ENABLE_TRACE
    #define TRACE tftp_trace
#else
    #define TRACE tftp_nop
#endif


namespace tftpkit {
namespace tftp {


window::window(std::istream& source, size_t block_size, size_t window_size)
    : m_source(source)
    , m_block_size((std::max)(static_cast<size_t>(1), block_size))
    , m_window_size((std::max)(static_cast<size_t>(1), window_size))
    , m_bytes_read(0)
    , mb_end_reached(false)
    , mb_last_read_empty(false)
{
}


bool
window::fill()
{
    while (!mb_end_reached && m_window_size > m_elements.size())
    {
        block_t block(m_block_size);
        m_source.read(reinterpret_cast<char *>(block.data()), static_cast<std::streamsize>(m_block_size));
        if (m_source.bad()) { throw source_read_exception(); }

        size_t const bytes_read = static_cast<size_t>(m_source.gcount());
        m_bytes_read += bytes_read;

        if (m_block_size > bytes_read)
        {
            mb_end_reached = true;
            mb_last_read_empty = 0 == bytes_read;
        }

        if (0 < bytes_read)
        {
            block.resize(bytes_read);
            m_elements.push_back(move(block));
        }
    }

    TRACE("window::fill(): %lu blocks held, end_reached=%d\n",
          static_cast<unsigned long>(m_elements.size()), static_cast<int>(mb_end_reached));

    return !mb_end_reached;
}


void
window::consume(size_t count)
{
    if (count >= m_elements.size()) { m_elements.clear(); }
    else { m_elements.erase(m_elements.begin(), m_elements.begin() + static_cast<ptrdiff_t>(count)); }
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "window.cpp"
*/
