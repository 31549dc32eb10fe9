/*!
    \file "tftpkit_env.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)

    This is the general use header for the tftpkit library.
*/


#ifndef TFTPKIT_ENV_HPP__6A837C69_26EC_49D1_AFBA_543C94C2180B__INCLUDED
#define TFTPKIT_ENV_HPP__6A837C69_26EC_49D1_AFBA_543C94C2180B__INCLUDED


#pragma once


#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>


/**
 * Declares an exception class.
 *
 *   DECLARE_EXCEPTION(name, default_what)         derives from std::runtime_error
 *   DECLARE_EXCEPTION(name, default_what, base)   derives from 'base' (another declared exception)
 *
 * The declared class is default constructible (uses 'default_what') and constructible from a message.
 */
#define DECLARE_EXCEPTION_2(name, default_what) DECLARE_EXCEPTION_3(name, default_what, std::runtime_error)
#define DECLARE_EXCEPTION_3(name, default_what, base)                  \
    class name : public base                                           \
    {                                                                  \
    public:                                                            \
        name() : base(default_what) {}                                 \
        explicit name(std::string const& message) : base(message) {}  \
    }
#define TFTPKIT_SELECT_EXCEPTION_MACRO(_1, _2, _3, macro, ...) macro
#define DECLARE_EXCEPTION(...) \
    TFTPKIT_SELECT_EXCEPTION_MACRO(__VA_ARGS__, DECLARE_EXCEPTION_3, DECLARE_EXCEPTION_2, unused)(__VA_ARGS__)


namespace tftpkit {


using namespace std;


/// Number of elements in a fixed size array.
template <typename T, size_t N> inline size_t constexpr arycap(T const (&)[N]) { return N; }


enum log_level
{
    log_level_error = 0,
    log_level_warning,
    log_level_info,
    log_level_debug
};

void set_log_threshold(log_level level); //!< Messages less severe than 'level' are discarded.
log_level log_threshold();
inline bool log_enabled(log_level level) { return level <= log_threshold(); }

void tftpkit_vlog(log_level level, char const *format, va_list args);
void tftpkit_log(log_level level, char const *format, ...) __attribute__((format(printf, 2, 3)));

inline void tftpkit_vtrace(char const *format, va_list args) { tftpkit_vlog(log_level_debug, format, args); }


} // namespace tftpkit {


#endif // #ifndef TFTPKIT_ENV_HPP__6A837C69_26EC_49D1_AFBA_543C94C2180B__INCLUDED


/*
    End of "tftpkit_env.hpp"
*/
