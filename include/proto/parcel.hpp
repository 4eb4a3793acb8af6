#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/constants.hpp"

/*
TX:
LinkEngine.enqueue_message(payload)
  -> codec::prepare_outbound(...) = flags + wire bytes
     -> parcel::split(msg_id, wire bytes, flags)
        -> [Header parcel 1][Data parcel 2]...[Data parcel N]
             encode(Parcel) // [9B header][payload] or [4B data header][payload]
               -> transport.send(frame_bytes)

RX:
transport.on_rx(frame_bytes)
  -> ReceiveBuffer picks decode_header() for an unknown id, decode_data() otherwise
      -> all N parcels held ? assemble + crc32 check -> codec::restore_inbound -> app
*/

namespace parcel
{

using Bytes     = std::vector<std::uint8_t>;
using MessageId = std::string;  // always 2 chars 'A'..'Z'

inline constexpr std::uint8_t COMPRESSION_MASK = 0x0F;

enum class Kind : std::uint8_t
{
    Header,
    Data
};

// Decoded parcel. Header fields are only meaningful when kind == Header;
// number is 1 for the header parcel.
struct Parcel
{
    Kind          kind{Kind::Data};
    MessageId     msg_id;
    std::uint16_t number{0};
    std::uint16_t total{0};
    std::uint32_t checksum{0};
    std::uint8_t  flags{0};
    Bytes         payload;

    std::uint8_t compression() const { return flags & COMPRESSION_MASK; }
};

bool          valid_msg_id(const std::string &id);
std::uint32_t crc32(const Bytes &data);

// Encoding never fails for well-formed input; an invalid id or an oversized chunk
// yields an empty frame and an error log.
Bytes encode_header(const MessageId &id,
                    std::uint16_t    total,
                    std::uint32_t    checksum,
                    std::uint8_t     flags,
                    const Bytes     &chunk);
Bytes encode_data(const MessageId &id, std::uint16_t number, const Bytes &chunk);
Bytes encode(const Parcel &p);

// Both interpretations are offered; the caller decides which one applies.
// nullopt means MalformedParcel.
std::optional<Parcel> decode_header(const Bytes &frame);
std::optional<Parcel> decode_data(const Bytes &frame);

// Peek the id without committing to a parcel kind.
std::optional<MessageId> peek_msg_id(const Bytes &frame);

// Cuts the wire bytes into one header chunk of up to HEADER_CAPACITY bytes followed by
// data chunks of up to DATA_CAPACITY bytes. Empty when the message needs more than
// MAX_PARCELS parcels.
std::vector<Parcel> split(const MessageId &id, const Bytes &wire, std::uint8_t flags);

std::size_t parcel_count(std::size_t wire_size);

}  // namespace parcel
