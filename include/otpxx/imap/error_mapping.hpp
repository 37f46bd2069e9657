/*

error_mapping.hpp
-----------------

Centralized mapping between IMAP responses and otpxx::errc.

*/

#pragma once

#include <cstddef>
#include <string_view>

#include <otpxx/detail/error_detail.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx::imap
{

enum class error_kind
{
    tagged_no,
    tagged_bad,
    bye,
    continuation_expected,
    parse
};

[[nodiscard]] constexpr errc map_imap_error(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::tagged_no: return errc::imap_tagged_no;
        case error_kind::tagged_bad: return errc::imap_tagged_bad;
        case error_kind::bye: return errc::imap_bye;
        case error_kind::continuation_expected: return errc::imap_continuation_expected;
        case error_kind::parse: return errc::imap_parse_error;
    }
    return errc::imap_parse_error;
}

[[nodiscard]] inline otpxx::detail::error_detail make_imap_detail(
    std::string_view tag,
    std::string_view command,
    std::string_view tagged_line,
    std::size_t untagged_count,
    std::size_t literals_count)
{
    otpxx::detail::error_detail detail;
    detail.add("proto", "imap");
    detail.add("tag", tag);
    detail.add("command", command);
    detail.add("tagged.line", tagged_line);
    detail.add_int("untagged.count", untagged_count);
    detail.add_int("literals.count", literals_count);
    return detail;
}

} // namespace otpxx::imap
