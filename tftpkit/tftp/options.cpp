/*!
    \file "options.cpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#include <tftpkit/tftp/tftp_env.hpp>
#include <tftpkit/tftp/options.hpp>


namespace tftpkit {
namespace tftp {


namespace {


uint64_t
clamp_value(uint64_t value, uint64_t lower, uint64_t upper)
{
    return (std::max)(lower, (std::min)(value, upper));
}


option_list::const_iterator
find_last(option_list const& options, option_kind kind)
{
    option_list::const_iterator found = options.end();
    for (option_list::const_iterator iter = options.begin(); options.end() != iter; ++iter)
    {
        if (kind == iter->kind) { found = iter; }
    }
    return found;
}


} // namespace {


char const *
direction_name(transfer_direction direction)
{
    return direction_read == direction ? "read" : "write";
}


transfer_profile::transfer_profile()
    : block_size(TFTP_DEFAULT_BLOCK_SIZE)
    , window_size(TFTP_DEFAULT_WINDOW_SIZE)
    , timeout(boost::posix_time::seconds(TFTP_DEFAULT_TIMEOUT_IN_SECONDS))
    , retry_limit(TFTP_DEFAULT_RETRY_LIMIT)
{
}


negotiation_limits::negotiation_limits()
    : max_block_size(TFTP_MAX_BLOCK_SIZE)
    , max_window_size(TFTP_MAX_WINDOW_SIZE)
    , default_timeout(boost::posix_time::seconds(TFTP_DEFAULT_TIMEOUT_IN_SECONDS))
    , retry_limit(TFTP_DEFAULT_RETRY_LIMIT)
{
}


bool
negotiation_result::oack_required() const
{
    transfer_profile const defaults;
    for (option_list::const_iterator iter = acknowledged.begin(); acknowledged.end() != iter; ++iter)
    {
        switch (iter->kind)
        {
            case option_block_size: if (defaults.block_size != iter->value) { return true; } break;
            case option_window_size: if (defaults.window_size != iter->value) { return true; } break;
            case option_timeout:
                if (static_cast<uint64_t>(defaults.timeout.total_seconds()) != iter->value) { return true; }
                break;
            case option_transfer_size: return true;
        }
    }
    return false;
}


negotiation_result
negotiate(option_list const& requested, transfer_direction direction, negotiation_limits const& limits)
{
    negotiation_result result;
    transfer_profile& profile = result.profile;
    profile.timeout = limits.default_timeout;
    profile.retry_limit = limits.retry_limit;

    uint64_t const max_block_size =
        clamp_value(limits.max_block_size, TFTP_MIN_BLOCK_SIZE, TFTP_MAX_BLOCK_SIZE);
    uint64_t const max_window_size = clamp_value(limits.max_window_size, 1, TFTP_MAX_WINDOW_SIZE);

    bool requested_kinds[option_transfer_size + 1] = { false, false, false, false };

    for (option_list::const_iterator iter = requested.begin(); requested.end() != iter; ++iter)
    {
        switch (iter->kind)
        {
            case option_block_size:
            {
                profile.block_size =
                    static_cast<uint16_t>(clamp_value(iter->value, TFTP_MIN_BLOCK_SIZE, max_block_size));
                break;
            }

            case option_window_size:
            {
                profile.window_size = static_cast<uint16_t>(clamp_value(iter->value, 1, max_window_size));
                break;
            }

            case option_timeout:
            {
                profile.timeout = boost::posix_time::seconds(static_cast<long>(
                    clamp_value(iter->value, TFTP_MIN_TIMEOUT_IN_SECONDS, TFTP_MAX_TIMEOUT_IN_SECONDS)));
                break;
            }

            case option_transfer_size:
            {
                if (direction_write == direction) { profile.transfer_size = iter->value; }
                else { profile.transfer_size = limits.file_size; }
                break;
            }
        }
        requested_kinds[iter->kind] = true;
    }

    // The OACK lists the values in force, once per requested kind.
    if (requested_kinds[option_block_size])
    {
        result.acknowledged.push_back(transfer_option(option_block_size, profile.block_size));
    }
    if (requested_kinds[option_window_size])
    {
        result.acknowledged.push_back(transfer_option(option_window_size, profile.window_size));
    }
    if (requested_kinds[option_timeout])
    {
        result.acknowledged.push_back(transfer_option(option_timeout, profile.timeout.total_seconds()));
    }
    if (requested_kinds[option_transfer_size] && profile.transfer_size)
    {
        result.acknowledged.push_back(transfer_option(option_transfer_size, *profile.transfer_size));
    }

    return result;
}


bool
accept_oack(option_list const& requested, option_list const& acknowledged, negotiation_limits const& limits,
            transfer_profile& profile)
{
    for (option_list::const_iterator iter = acknowledged.begin(); acknowledged.end() != iter; ++iter)
    {
        option_list::const_iterator const request = find_last(requested, iter->kind);
        if (requested.end() == request) { return false; }

        switch (iter->kind)
        {
            case option_block_size:
            case option_window_size:
            {
                if (0 == iter->value || request->value < iter->value) { return false; }
                break;
            }

            case option_timeout:
            {
                if (TFTP_MIN_TIMEOUT_IN_SECONDS > iter->value || TFTP_MAX_TIMEOUT_IN_SECONDS < iter->value)
                {
                    return false;
                }
                break;
            }

            default:
            {
                break;
            }
        }
    }

    // Whatever the OACK does not mention stays at its default.
    negotiation_limits oack_limits(limits);
    oack_limits.file_size = boost::none;
    profile = negotiate(acknowledged, direction_write, oack_limits).profile;
    return true;
}


} // namespace tftp {
} // namespace tftpkit {


/*
    End of "options.cpp"
*/
