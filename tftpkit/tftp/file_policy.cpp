/*!
    \file "file_policy.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/file_policy.hpp>
#include <boost/filesystem/operations.hpp>


namespace tftpkit {
namespace tftp {


namespace fs = boost::filesystem;


namespace {


/// True when 'path' is 'root' itself or below it.  Both must be canonical.
bool
is_within(fs::path const& path, fs::path const& root)
{
    fs::path::const_iterator path_iter = path.begin();
    for (fs::path::const_iterator root_iter = root.begin(); root.end() != root_iter; ++root_iter, ++path_iter)
    {
        if (path.end() == path_iter || *root_iter != *path_iter) { return false; }
    }
    return true;
}


} // namespace {


file_policy::file_policy(fs::path const& send_directory, fs::path const& receive_directory,
                         bool read_only, bool overwrite)
    : m_send_directory(send_directory)
    , m_receive_directory(receive_directory)
    , mb_read_only(read_only)
    , mb_overwrite(overwrite)
{
}


fs::path const&
file_policy::root(transfer_direction direction) const
{
    return direction_read == direction ? m_send_directory : m_receive_directory;
}


boost::system::error_code
file_policy::check_request(transfer_direction direction) const
{
    if (direction_write == direction && mb_read_only) { return make_error_code(error_access_violation); }
    return boost::system::error_code();
}


boost::system::error_code
file_policy::resolve(string const& filename, transfer_direction direction, fs::path& result) const
{
    fs::path const requested(filename);
    fs::path relative;
    for (fs::path::const_iterator iter = requested.begin(); requested.end() != iter; ++iter)
    {
        string const element(iter->string());
        if (element.empty() || "." == element || "/" == element) { continue; }
        if (".." == element || iter->has_root_name()) { return make_error_code(error_access_violation); }
        relative /= *iter;
    }
    if (relative.empty()) { return make_error_code(error_access_violation); }

    fs::path const& root_directory = root(direction);
    fs::path const candidate(root_directory / relative);

    boost::system::error_code error_code;
    fs::path const canonical_root(fs::canonical(root_directory, error_code));
    if (error_code) { return make_error_code(error_access_violation); }
    fs::path const canonical_candidate(fs::weakly_canonical(candidate, error_code));
    if (error_code) { return make_error_code(error_access_violation); }

    if (!is_within(canonical_candidate, canonical_root) || canonical_candidate == canonical_root)
    {
        return make_error_code(error_access_violation);
    }

    result = candidate;
    return boost::system::error_code();
}


boost::system::error_code
file_policy::check_readable(fs::path const& path, uint64_t& file_size) const
{
    boost::system::error_code error_code;
    fs::file_status const status(fs::status(path, error_code));
    if (!fs::exists(status)) { return make_error_code(error_file_not_found); }
    if (error_code || !fs::is_regular_file(status)) { return make_error_code(error_access_violation); }

    uintmax_t const size = fs::file_size(path, error_code);
    if (error_code) { return make_error_code(error_access_violation); }

    file_size = size;
    return boost::system::error_code();
}


boost::system::error_code
file_policy::check_writable(fs::path const& path, boost::optional<uint64_t> const& transfer_size) const
{
    if (mb_read_only) { return make_error_code(error_access_violation); }

    boost::system::error_code error_code;
    fs::file_status const status(fs::status(path, error_code));
    if (fs::exists(status))
    {
        if (!mb_overwrite) { return make_error_code(error_file_exists); }
        if (!fs::is_regular_file(status)) { return make_error_code(error_access_violation); }
    }

    fs::path const directory(path.parent_path());
    if (!fs::is_directory(directory, error_code)) { return make_error_code(error_file_not_found); }

    if (transfer_size)
    {
        fs::space_info const space = fs::space(directory, error_code);
        if (!error_code && space.available < *transfer_size) { return make_error_code(error_disk_full); }
    }

    return boost::system::error_code();
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "file_policy.cpp"
*/
