/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Read-only RFC 5322 / MIME message model. Only what is needed to locate a code
in a notification mail is kept: addresses, subject, date and the text of the
body.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <otpxx/codec/base64.hpp>
#include <otpxx/codec/encoded_word.hpp>
#include <otpxx/codec/quoted_printable.hpp>
#include <otpxx/detail/ascii.hpp>
#include <otpxx/detail/datetime.hpp>
#include <otpxx/detail/regex.hpp>
#include <otpxx/detail/result.hpp>

namespace otpxx::mime
{

/// Maximum nesting of multipart entities that is followed.
inline constexpr int MAX_MULTIPART_DEPTH = 8;

struct header_field
{
    std::string name;
    std::string value;
};

/// Single mail address with the optional display name.
struct mail_address
{
    std::string name;
    std::string address;
};

/// Media type with its parameters, e.g. `text/plain; charset=utf-8`.
struct content_type
{
    std::string type = "text";
    std::string subtype = "plain";
    std::vector<std::pair<std::string, std::string>> params;

    [[nodiscard]] bool is(std::string_view t, std::string_view s) const noexcept
    {
        return detail::iequals_ascii(type, t) && detail::iequals_ascii(subtype, s);
    }

    [[nodiscard]] bool is_multipart() const noexcept
    {
        return detail::iequals_ascii(type, "multipart");
    }

    [[nodiscard]] std::string param(std::string_view name) const
    {
        for (const auto& [key, value] : params)
        {
            if (detail::iequals_ascii(key, name))
                return value;
        }
        return {};
    }
};

/**
Split a header block into fields. Folded lines (starting with space or tab)
are joined to the previous field.
**/
[[nodiscard]] inline std::vector<header_field> parse_headers(std::string_view block)
{
    std::vector<header_field> fields;
    std::size_t pos = 0;
    while (pos < block.size())
    {
        auto eol = block.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = block.size();
        std::string_view line = block.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        pos = eol + 1;

        if (line.empty())
            continue;
        if ((line.front() == ' ' || line.front() == '\t') && !fields.empty())
        {
            fields.back().value += ' ';
            fields.back().value += detail::trim_view(line);
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            continue;
        fields.push_back({std::string(detail::trim_view(line.substr(0, colon))),
            std::string(detail::trim_view(line.substr(colon + 1)))});
    }
    return fields;
}

[[nodiscard]] inline std::string unquote(std::string_view value)
{
    value = detail::trim_view(value);
    if (value.size() < 2 || value.front() != '"' || value.back() != '"')
        return std::string(value);
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 1; i + 1 < value.size(); ++i)
    {
        if (value[i] == '\\' && i + 2 < value.size())
            ++i;
        out.push_back(value[i]);
    }
    return out;
}

[[nodiscard]] inline content_type parse_content_type(std::string_view value)
{
    content_type ct;
    const auto semi = value.find(';');
    std::string_view media = detail::trim_view(value.substr(0, semi));
    const auto slash = media.find('/');
    if (slash != std::string_view::npos)
    {
        ct.type = detail::to_lower_copy(detail::trim_view(media.substr(0, slash)));
        ct.subtype = detail::to_lower_copy(detail::trim_view(media.substr(slash + 1)));
    }
    if (semi == std::string_view::npos)
        return ct;

    std::string_view rest = value.substr(semi + 1);
    while (!rest.empty())
    {
        // Parameters are separated by ';' outside of quoted strings.
        std::size_t end = 0;
        bool quoted = false;
        for (; end < rest.size(); ++end)
        {
            if (rest[end] == '"')
                quoted = !quoted;
            else if (rest[end] == ';' && !quoted)
                break;
        }
        const std::string_view param = rest.substr(0, end);
        const auto eq = param.find('=');
        if (eq != std::string_view::npos)
            ct.params.emplace_back(detail::to_lower_copy(detail::trim_view(param.substr(0, eq))),
                unquote(param.substr(eq + 1)));
        rest = end < rest.size() ? rest.substr(end + 1) : std::string_view{};
    }
    return ct;
}

/**
Parse an address list such as `"Doe, John" <john@x.org>, jane@y.org`.
Group syntax and comments are tolerated.
**/
[[nodiscard]] inline std::vector<mail_address> parse_address_list(std::string_view value)
{
    std::vector<mail_address> out;

    auto flush = [&out](std::string_view token)
    {
        token = detail::trim_view(token);
        if (token.empty())
            return;
        mail_address addr;
        const auto lt = token.rfind('<');
        const auto gt = token.rfind('>');
        if (lt != std::string_view::npos && gt != std::string_view::npos && gt > lt)
        {
            addr.address = std::string(detail::trim_view(token.substr(lt + 1, gt - lt - 1)));
            addr.name = codec::decode_header_value(unquote(token.substr(0, lt)));
        }
        else
        {
            // Drop a trailing "(comment)".
            const auto paren = token.find('(');
            addr.address = std::string(detail::trim_view(token.substr(0, paren)));
        }
        if (!addr.address.empty() || !addr.name.empty())
            out.push_back(std::move(addr));
    };

    bool quoted = false;
    int angle = 0;
    int comment = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        const char ch = value[i];
        if (ch == '\\' && quoted)
        {
            ++i;
            continue;
        }
        if (ch == '"' && comment == 0)
            quoted = !quoted;
        else if (quoted)
            continue;
        else if (ch == '(')
            ++comment;
        else if (ch == ')' && comment > 0)
            --comment;
        else if (ch == '<' && comment == 0)
            ++angle;
        else if (ch == '>' && angle > 0)
            --angle;
        else if (angle == 0 && comment == 0)
        {
            if (ch == ':')
                start = i + 1; // group name
            else if (ch == ',' || ch == ';')
            {
                flush(value.substr(start, i - start));
                start = i + 1;
            }
        }
    }
    if (start < value.size())
        flush(value.substr(start));
    return out;
}

namespace html
{

/// Append a Unicode code point as UTF-8.
inline void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80)
        out.push_back(static_cast<char>(cp));
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x110000)
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string decode_entities(std::string_view text)
{
    struct named_entity
    {
        std::string_view name;
        std::string_view value;
    };
    static constexpr named_entity NAMED[] = {
        {"nbsp", " "}, {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"ndash", "-"}, {"mdash", "-"}, {"zwnj", ""}, {"zwj", ""}, {"shy", ""}};

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] != '&')
        {
            out.push_back(text[i]);
            continue;
        }
        const auto semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10)
        {
            out.push_back('&');
            continue;
        }
        const std::string_view name = text.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (!name.empty() && name.front() == '#')
        {
            std::uint32_t cp = 0;
            const bool hex = name.size() > 1 && (name[1] == 'x' || name[1] == 'X');
            std::size_t k = hex ? 2 : 1;
            bool valid = k < name.size();
            for (; k < name.size() && valid; ++k)
            {
                const int digit = hex ? codec::hex_value(name[k]) : (detail::is_ascii_digit(name[k]) ? name[k] - '0' : -1);
                if (digit < 0)
                    valid = false;
                else
                    cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(digit);
            }
            if (valid)
            {
                if (cp == 0xA0)
                    out.push_back(' ');
                else
                    append_utf8(out, cp);
                decoded = true;
            }
        }
        else
        {
            for (const auto& entity : NAMED)
            {
                if (detail::iequals_ascii(entity.name, name))
                {
                    out.append(entity.value);
                    decoded = true;
                    break;
                }
            }
        }
        if (decoded)
            i = semi;
        else
            out.push_back('&');
    }
    return out;
}

} // namespace html

/**
Render HTML markup as plain text: script and style blocks are dropped, block
level elements become line breaks, tags are removed and entities decoded.
**/
[[nodiscard]] inline std::string html_to_text(std::string_view markup)
{
    static const detail::regex HIDDEN(R"(<(script|style|head)\b[^>]*>.*?</\1\s*>)", detail::regex_icase);
    static const detail::regex BREAKS(R"(<(br|/p|/div|/tr|/li|/h[1-6]|/table)\b[^>]*>)", detail::regex_icase);
    static const detail::regex TAGS(R"(<[^>]*>)", detail::regex_icase);
    static const detail::regex COMMENTS(R"(<!--.*?-->)", detail::regex_icase);

    std::string text(markup);
    text = detail::regex_replace(text, COMMENTS, " ");
    text = detail::regex_replace(text, HIDDEN, " ");
    text = detail::regex_replace(text, BREAKS, "\n");
    text = detail::regex_replace(text, TAGS, " ");
    return html::decode_entities(text);
}

/**
Parsed message.

The body is reduced to two text renditions: the first `text/plain` part and
the first `text/html` part, both transfer decoded and converted to UTF-8 when
the charset is Latin-1.
**/
class message
{
public:
    /**
    Parse raw RFC 5322 data, typically the BODY[] of an IMAP fetch.

    @return The message or errc::mime_parse_error when no header is found.
    **/
    [[nodiscard]] static result<message> parse(std::string_view raw)
    {
        if (raw.empty())
            return fail<message>(errc::mime_parse_error, "Empty message.");

        message msg;
        const auto [head, body] = split_entity(raw);
        msg.headers_ = parse_headers(head);
        if (msg.headers_.empty())
            return fail<message>(errc::mime_parse_error, "Message has no header fields.");

        if (auto subject = msg.header("Subject"))
            msg.subject_ = codec::decode_header_value(*subject);
        if (auto from = msg.header("From"))
            msg.from_ = parse_address_list(*from);
        for (const auto& field : msg.headers_)
        {
            if (detail::iequals_ascii(field.name, "To") || detail::iequals_ascii(field.name, "Cc")
                || detail::iequals_ascii(field.name, "Delivered-To"))
            {
                auto addresses = parse_address_list(field.value);
                msg.recipients_.insert(msg.recipients_.end(), addresses.begin(), addresses.end());
            }
        }
        if (auto date = msg.header("Date"))
            msg.date_ = detail::parse_rfc5322_date(*date);

        msg.walk(msg.headers_, body, 0);
        return msg;
    }

    [[nodiscard]] const std::vector<header_field>& headers() const noexcept
    {
        return headers_;
    }

    /// First value of the named header, compared case insensitively.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const
    {
        for (const auto& field : headers_)
        {
            if (detail::iequals_ascii(field.name, name))
                return field.value;
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] const std::vector<mail_address>& from() const noexcept { return from_; }
    [[nodiscard]] const std::vector<mail_address>& recipients() const noexcept { return recipients_; }
    [[nodiscard]] const std::optional<std::chrono::system_clock::time_point>& date() const noexcept { return date_; }
    [[nodiscard]] const std::string& plain_text() const noexcept { return plain_text_; }
    [[nodiscard]] const std::string& html_text() const noexcept { return html_text_; }

    /// Text used for code extraction: the plain part, else the rendered HTML.
    [[nodiscard]] std::string body_text() const
    {
        if (!detail::trim_view(plain_text_).empty())
            return plain_text_;
        return html_to_text(html_text_);
    }

private:
    static std::pair<std::string_view, std::string_view> split_entity(std::string_view raw)
    {
        std::size_t sep = raw.find("\r\n\r\n");
        std::size_t skip = 4;
        const std::size_t lf = raw.find("\n\n");
        if (lf != std::string_view::npos && (sep == std::string_view::npos || lf < sep))
        {
            sep = lf;
            skip = 2;
        }
        if (sep == std::string_view::npos)
            return {raw, {}};
        return {raw.substr(0, sep), raw.substr(sep + skip)};
    }

    static std::string find_value(const std::vector<header_field>& fields, std::string_view name)
    {
        for (const auto& field : fields)
        {
            if (detail::iequals_ascii(field.name, name))
                return field.value;
        }
        return {};
    }

    static std::string decode_body(std::string_view body, std::string_view transfer_encoding, std::string_view charset)
    {
        std::string decoded;
        const auto cte = detail::trim_view(transfer_encoding);
        if (detail::iequals_ascii(cte, "base64"))
        {
            auto bytes = codec::base64_decode(body);
            decoded = bytes ? std::move(*bytes) : std::string(body);
        }
        else if (detail::iequals_ascii(cte, "quoted-printable"))
            decoded = codec::decode_quoted_printable(body);
        else
            decoded = std::string(body);

        if (detail::iequals_ascii(charset, "iso-8859-1") || detail::iequals_ascii(charset, "latin1")
            || detail::iequals_ascii(charset, "windows-1252"))
            return codec::latin1_to_utf8(decoded);
        return decoded;
    }

    static std::vector<std::string_view> split_multipart(std::string_view body, std::string_view boundary)
    {
        std::vector<std::string_view> parts;
        const std::string delimiter = "--" + std::string(boundary);
        std::size_t pos = 0;
        std::size_t part_start = std::string_view::npos;

        while (pos <= body.size())
        {
            auto eol = body.find('\n', pos);
            const bool last_line = eol == std::string_view::npos;
            if (last_line)
                eol = body.size();
            std::string_view line = body.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            if (detail::trim_view(line).starts_with(delimiter))
            {
                const std::string_view tail = detail::trim_view(line).substr(delimiter.size());
                if (part_start != std::string_view::npos)
                {
                    // The line break before the delimiter belongs to the delimiter.
                    std::size_t part_end = pos;
                    if (part_end > part_start && body[part_end - 1] == '\n')
                        --part_end;
                    if (part_end > part_start && body[part_end - 1] == '\r')
                        --part_end;
                    parts.push_back(body.substr(part_start, part_end - part_start));
                }
                if (tail.starts_with("--"))
                    return parts;
                part_start = last_line ? body.size() : eol + 1;
            }
            if (last_line)
                break;
            pos = eol + 1;
        }
        // Missing close delimiter: keep what was collected.
        if (part_start != std::string_view::npos && part_start < body.size())
            parts.push_back(body.substr(part_start));
        return parts;
    }

    void walk(const std::vector<header_field>& fields, std::string_view body, int depth)
    {
        const std::string ct_value = find_value(fields, "Content-Type");
        const content_type ct = ct_value.empty() ? content_type{} : parse_content_type(ct_value);

        if (ct.is_multipart())
        {
            const std::string boundary = ct.param("boundary");
            if (boundary.empty() || depth >= MAX_MULTIPART_DEPTH)
                return;
            for (std::string_view part : split_multipart(body, boundary))
            {
                const auto [head, content] = split_entity(part);
                walk(parse_headers(head), content, depth + 1);
            }
            return;
        }

        const std::string disposition = find_value(fields, "Content-Disposition");
        if (detail::starts_with_ci(detail::trim_view(disposition), "attachment"))
            return;

        const std::string cte = find_value(fields, "Content-Transfer-Encoding");
        if (ct.is("text", "plain") && plain_text_.empty())
            plain_text_ = decode_body(body, cte, ct.param("charset"));
        else if (ct.is("text", "html") && html_text_.empty())
            html_text_ = decode_body(body, cte, ct.param("charset"));
    }

    std::vector<header_field> headers_;
    std::string subject_;
    std::vector<mail_address> from_;
    std::vector<mail_address> recipients_;
    std::optional<std::chrono::system_clock::time_point> date_;
    std::string plain_text_;
    std::string html_text_;
};

} // namespace otpxx::mime
