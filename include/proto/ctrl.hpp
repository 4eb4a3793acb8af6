#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "util/constants.hpp"

namespace ctrl
{
constexpr uint8_t MSG_CTRL_HELLO = 0x01;
constexpr uint8_t HELLO_VER      = 0x01;
constexpr uint8_t T_USER_ID      = 0x01;
constexpr uint8_t T_CAPS         = 0x02;  // comma separated tokens

constexpr std::size_t USER_ID_MAX = 64;
constexpr std::size_t CAPS_MAX    = 200;  // keeps HELLO inside one parcel-sized write

struct Hello
{
    std::string              user_id;
    bool                     has_caps{false};
    std::vector<std::string> caps;
};

inline bool is_hello(const std::vector<uint8_t> &f)
{
    return f.size() >= 2 && f[0] == MSG_CTRL_HELLO && f[1] == HELLO_VER;
}

inline std::vector<uint8_t> encode_hello(std::string_view user, const std::vector<std::string> &caps)
{
    std::vector<uint8_t> out;
    const std::size_t    uid_len = (user.size() > USER_ID_MAX) ? USER_ID_MAX : user.size();

    std::string joined;
    for (const auto &c : caps)
    {
        if (c.empty() || c.find(',') != std::string::npos)
            continue;
        if (joined.size() + c.size() + 1 > CAPS_MAX)
            break;
        if (!joined.empty())
            joined.push_back(',');
        joined += c;
    }

    out.reserve(2 + 3 + uid_len + 3 + joined.size());
    out.push_back(MSG_CTRL_HELLO);
    out.push_back(HELLO_VER);
    // T_USER_ID only when length in 1..64
    if (uid_len > 0)
    {
        out.push_back(T_USER_ID);
        out.push_back(0x00);
        out.push_back(static_cast<uint8_t>(uid_len));
        out.insert(out.end(), user.begin(), user.begin() + uid_len);
    }
    out.push_back(T_CAPS);
    out.push_back(static_cast<uint8_t>((joined.size() >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(joined.size() & 0xFF));
    out.insert(out.end(), joined.begin(), joined.end());
    return out;
}

inline bool parse_hello(const uint8_t *buf, size_t len, Hello &h)
{
    if (len < 2 || buf[0] != MSG_CTRL_HELLO || buf[1] != HELLO_VER)
        return false;
    size_t i = 2;
    while (i + 3 <= len)
    {
        uint8_t  t = buf[i++];
        uint16_t L = (uint16_t)buf[i++] << 8;
        L |= buf[i++];
        if (i + L > len)
            return false;  // malformed => return false
        const char *v = reinterpret_cast<const char *>(buf + i);
        switch (t)
        {
            case T_USER_ID:
                // 1..64, else malformed
                if (L == 0 || L > USER_ID_MAX)
                    return false;
                h.user_id.assign(v, static_cast<size_t>(L));
                break;
            case T_CAPS:
            {
                if (L > CAPS_MAX)
                    return false;
                h.has_caps = true;
                h.caps.clear();
                std::string_view all(v, L);
                while (!all.empty())
                {
                    auto        comma = all.find(',');
                    std::string tok(all.substr(0, comma));
                    if (!tok.empty())
                        h.caps.push_back(std::move(tok));
                    if (comma == std::string_view::npos)
                        break;
                    all.remove_prefix(comma + 1);
                }
                break;
            }
            default:  // ignore TLV if unknown
                break;
        }
        i += L;
    }
    return true;
}

// Algorithm names from "compression:<name>" tokens
inline std::vector<std::string> compression_algorithms(const Hello &h)
{
    std::vector<std::string> out;
    const std::string_view   prefix = constants::CAP_COMPRESSION_PREFIX;
    for (const auto &c : h.caps)
    {
        if (c.size() > prefix.size() && c.compare(0, prefix.size(), prefix) == 0)
            out.push_back(c.substr(prefix.size()));
    }
    return out;
}
}  // namespace ctrl
