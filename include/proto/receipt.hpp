#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace receipt
{

enum class Status
{
    Complete,
    Missing,
    ChecksumFailed
};

struct Receipt
{
    std::string                msg_id;
    Status                     status{Status::Complete};
    std::vector<std::uint16_t> parcels;  // only for Missing
};

const char *status_name(Status s);

inline Receipt complete(const std::string &id)
{
    return Receipt{id, Status::Complete, {}};
}
inline Receipt missing(const std::string &id, std::vector<std::uint16_t> parcels)
{
    return Receipt{id, Status::Missing, std::move(parcels)};
}
inline Receipt checksum_failed(const std::string &id)
{
    return Receipt{id, Status::ChecksumFailed, {}};
}

// {"msg_id":"AK","status":"missing","parcels":[3,7,12]}
std::string                encode(const Receipt &r);
std::vector<std::uint8_t>  encode_bytes(const Receipt &r);
std::optional<Receipt>     parse(const std::string &json);
std::optional<Receipt>     parse(const std::vector<std::uint8_t> &frame);

// Cheap check used to route an incoming frame before parsing it.
bool looks_like_receipt(const std::vector<std::uint8_t> &frame);

}  // namespace receipt
