#pragma once

#include <string>
#include <system_error>

namespace speedline
{

// ============================================================================
// Transfer Error Codes
// ============================================================================

enum class transfer_errc
{
    success = 0,
    setup_failure,    // failed before any byte was streamed
    peer_abort,       // consumer or producer went away mid-transfer
    size_violation,   // upload exceeded the configured ceiling
    transport_error   // I/O layer failure
};

namespace detail
{

struct transfer_errc_category : std::error_category
{
    const char* name() const noexcept override
    {
        return "speedline::transfer";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<transfer_errc>(ev))
        {
            case transfer_errc::success:         return "Success";
            case transfer_errc::setup_failure:   return "Transfer setup failed";
            case transfer_errc::peer_abort:      return "Peer aborted the transfer";
            case transfer_errc::size_violation:  return "Payload too large";
            case transfer_errc::transport_error: return "Transport error";
        }
        return "Unknown error";
    }
};

} // namespace detail

inline const std::error_category& transfer_category() noexcept
{
    static detail::transfer_errc_category category;
    return category;
}

inline std::error_code make_error_code(transfer_errc e) noexcept
{
    return {static_cast<int>(e), transfer_category()};
}

} // namespace speedline

namespace std
{

template<>
struct is_error_code_enum<speedline::transfer_errc> : true_type {};

} // namespace std
