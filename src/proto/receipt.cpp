#include <cctype>
#include <string>

#include <nlohmann/json.hpp>

#include "proto/parcel.hpp"
#include "proto/receipt.hpp"
#include "util/log.hpp"

namespace receipt
{

// insertion order keeps msg_id first on the wire
using json = nlohmann::ordered_json;

const char *status_name(Status s)
{
    switch (s)
    {
        case Status::Complete:
            return "complete";
        case Status::Missing:
            return "missing";
        case Status::ChecksumFailed:
            return "checksum_failed";
    }
    return "?";
}

std::string encode(const Receipt &r)
{
    json j{{"msg_id", r.msg_id}, {"status", status_name(r.status)}};
    if (r.status == Status::Missing)
        j["parcels"] = r.parcels;
    return j.dump();
}

std::vector<std::uint8_t> encode_bytes(const Receipt &r)
{
    const std::string s = encode(r);
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

bool looks_like_receipt(const std::vector<std::uint8_t> &frame)
{
    for (std::uint8_t b : frame)
    {
        if (std::isspace(b))
            continue;
        return b == '{';
    }
    return false;
}

std::optional<Receipt> parse(const std::string &text)
{
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    if (!j.contains("msg_id") || !j.contains("status") || !j["msg_id"].is_string() ||
        !j["status"].is_string())
        return std::nullopt;

    Receipt r;
    r.msg_id = j["msg_id"].get<std::string>();
    if (!parcel::valid_msg_id(r.msg_id))
        return std::nullopt;

    const std::string status = j["status"].get<std::string>();
    if (status == "complete")
        r.status = Status::Complete;
    else if (status == "missing")
        r.status = Status::Missing;
    else if (status == "checksum_failed")
        r.status = Status::ChecksumFailed;
    else
    {
        LOG_WARN("parse: unknown receipt status '%s'", status.c_str());
        return std::nullopt;
    }

    if (j.contains("parcels"))
    {
        const json &arr = j["parcels"];
        if (!arr.is_array())
            return std::nullopt;
        for (const auto &v : arr)
        {
            if (!v.is_number_unsigned())
                return std::nullopt;
            const auto n = v.get<std::uint64_t>();
            if (n < 1 || n > UINT16_MAX)
                return std::nullopt;
            r.parcels.push_back(static_cast<std::uint16_t>(n));
        }
    }
    if (r.status != Status::Missing)
        r.parcels.clear();
    return r;
}

std::optional<Receipt> parse(const std::vector<std::uint8_t> &frame)
{
    return parse(std::string(frame.begin(), frame.end()));
}

}  // namespace receipt
