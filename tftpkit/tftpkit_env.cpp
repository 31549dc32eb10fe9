/*!
    \file "tftpkit_env.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftpkit_env.hpp>
#include <mutex>
#include <boost/date_time/posix_time/posix_time.hpp>


namespace tftpkit {


namespace {

atomic<int> l_log_threshold(log_level_info);
mutex l_log_output_lock; // Keeps lines from concurrent threads intact.

char const *const l_log_level_names[] = { "error", "warning", "info", "debug" };

} // namespace {


void
set_log_threshold(log_level level)
{
    l_log_threshold = level;
}


log_level
log_threshold()
{
    return static_cast<log_level>(l_log_threshold.load());
}


void
tftpkit_vlog(log_level level, char const *format, va_list args)
{
    if (!log_enabled(level)) { return; }

    char message[1024];
    int const length = vsnprintf(message, sizeof(message), format, args);
    if (0 > length) { return; }

    // Callers may or may not terminate the format with a newline; always emit exactly one.
    size_t message_length = (std::min)(static_cast<size_t>(length), sizeof(message) - 1);
    while (0 < message_length && '\n' == message[message_length - 1]) { message[--message_length] = '\0'; }

    string const timestamp =
        boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::local_time());

    lock_guard<mutex> guard(l_log_output_lock);
    fprintf(stderr, "[%s] [%s] %s\n", timestamp.c_str(), l_log_level_names[level], message);
    fflush(stderr);
}


void
tftpkit_log(log_level level, char const *format, ...)
{
    va_list args;
    va_start(args, format);
    tftpkit_vlog(level, format, args);
    va_end(args);
}


} // namespace tftpkit {


/*
    End of "tftpkit_env.cpp"
*/
