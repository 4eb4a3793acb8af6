#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "proto/parcel.hpp"
#include "util/clock.hpp"

namespace engine
{

using parcel::Bytes;
using parcel::MessageId;
using parcellink::Millis;
using parcellink::SteadyTime;

enum class AddResult
{
    Added,
    Duplicate,
    Completed,  // this parcel made the message complete
    Rejected    // MalformedParcel or out of range
};

enum class AssembleStatus
{
    Ok,
    MissingParcels,
    ChecksumMismatch,
    UnknownMessage
};

struct Assembled
{
    AssembleStatus             status{AssembleStatus::UnknownMessage};
    std::uint8_t               flags{0};
    Bytes                      payload;  // still in wire form (maybe compressed)
    std::vector<std::uint16_t> missing;
};

struct MissingRequest
{
    MessageId                  msg_id;
    std::vector<std::uint16_t> parcels;
};

struct DroppedInbound
{
    MessageId   msg_id;
    std::size_t received{0};
    std::size_t total{0};  // 0 when the header never arrived
};

// Per-identifier reassembly state for one link.
class ReceiveBuffer
{
  public:
    // Wire path: an unknown id is read as a header parcel, a known id as a data parcel.
    AddResult add_frame(const Bytes &frame, SteadyTime now, MessageId *id_out = nullptr);
    // Typed path, order of header and data parcels is free.
    AddResult add_parcel(const parcel::Parcel &p, SteadyTime now);

    bool                       is_complete(const MessageId &id) const;
    std::vector<std::uint16_t> missing_parcels(const MessageId &id) const;

    // Ok and ChecksumMismatch both end the reassembly attempt and drop the record.
    Assembled assemble(const MessageId &id);
    void      clear(const MessageId &id);

    bool        has(const MessageId &id) const;
    std::size_t pending() const;

    // Housekeeping. Each incomplete message that has been quiet for `delay` since its last
    // parcel or last request yields one request; the request time is recorded.
    std::vector<MissingRequest> collect_missing_requests(SteadyTime now, Millis delay);
    // Also forgets assembled messages older than `timeout`.
    std::vector<DroppedInbound> drop_stale(SteadyTime now, Millis timeout);

  private:
    struct Inbound
    {
        bool                            has_header{false};
        std::uint16_t                   total{0};
        std::uint32_t                   checksum{0};
        std::uint8_t                    flags{0};
        std::map<std::uint16_t, Bytes>  parcels;  // sparse, keyed by parcel number
        SteadyTime                      first_at{};
        SteadyTime                      last_at{};
        std::optional<SteadyTime>       last_request_at;
    };

    // Fingerprint of a message assembled recently, so a stray retransmission of one of
    // its parcels is not mistaken for the header of a new message.
    struct Finished
    {
        std::uint16_t                           total{0};
        std::uint32_t                           checksum{0};
        std::uint8_t                            flags{0};
        std::map<std::uint16_t, std::uint32_t>  payload_crc;  // data parcel number -> crc32
        SteadyTime                              at{};
    };

    AddResult add_locked(const parcel::Parcel &p, SteadyTime now);
    static bool                       complete(const Inbound &in);
    static std::vector<std::uint16_t> missing_of(const Inbound &in);
    bool                              is_stray_locked(const MessageId &id, const Bytes &frame) const;

    mutable std::mutex             mu_;
    std::map<MessageId, Inbound>   map_;
    std::map<MessageId, Finished>  finished_;
};

}  // namespace engine
