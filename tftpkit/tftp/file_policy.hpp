/*!
    \file "file_policy.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef FILE_POLICY_HPP__93A4C1D7_6E2B_4F08_A5D9_0B1C2E3F4A65__INCLUDED
#define FILE_POLICY_HPP__93A4C1D7_6E2B_4F08_A5D9_0B1C2E3F4A65__INCLUDED


#pragma once


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/tftp_error.hpp>
#include <tftpkit/tftp/options.hpp>
#include <boost/filesystem/path.hpp>


namespace tftpkit {
namespace tftp {


/**
 * Which files the server may serve and accept.
 *
 * Reads are served from the send directory, writes land in the receive directory.  Every check returns an
 * error code in tftp_category(), i.e. the code to put in the ERROR packet, or success.
 */
class file_policy
{
public:
    bool read_only() const { return mb_read_only; }
    bool overwrite() const { return mb_overwrite; }
    boost::filesystem::path const& root(transfer_direction direction) const;

    /// Refuses writes on a read-only server.
    boost::system::error_code check_request(transfer_direction direction) const;

    /**
     * Maps a requested filename below the root for 'direction'.
     *
     * A leading '/' is ignored.  Names containing "..", and names that lead outside the root through a symbolic
     * link, are refused with error_access_violation.
     */
    boost::system::error_code resolve(string const& filename, transfer_direction direction,
                                      boost::filesystem::path& result) const;

    boost::system::error_code check_readable(boost::filesystem::path const& path, uint64_t& file_size) const;
    boost::system::error_code check_writable(boost::filesystem::path const& path,
                                             boost::optional<uint64_t> const& transfer_size) const;

    file_policy(boost::filesystem::path const& send_directory, boost::filesystem::path const& receive_directory,
                bool read_only, bool overwrite);

private:
    boost::filesystem::path m_send_directory;
    boost::filesystem::path m_receive_directory;
    bool mb_read_only;
    bool mb_overwrite;
};


} // namespace tftp {
} // namespace tftpkit {


#endif // #ifndef FILE_POLICY_HPP__93A4C1D7_6E2B_4F08_A5D9_0B1C2E3F4A65__INCLUDED


/*
    End of "file_policy.hpp"
*/
