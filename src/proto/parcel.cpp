#include <algorithm>
#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>
#include <zlib.h>

#include "proto/parcel.hpp"
#include "util/log.hpp"

namespace parcel
{

using constants::DATA_CAPACITY;
using constants::DATA_OVERHEAD;
using constants::HEADER_CAPACITY;
using constants::HEADER_OVERHEAD;

bool valid_msg_id(const std::string &id)
{
    if (id.size() != constants::MSG_ID_LEN)
        return false;
    return std::all_of(id.begin(), id.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

std::uint32_t crc32(const Bytes &data)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    if (!data.empty())
        crc = ::crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

Bytes encode_header(const MessageId &id,
                    std::uint16_t    total,
                    std::uint32_t    checksum,
                    std::uint8_t     flags,
                    const Bytes     &chunk)
{
    if (!valid_msg_id(id) || total == 0 || chunk.size() > HEADER_CAPACITY)
    {
        LOG_ERROR("encode_header: invalid header (id='%s' total=%u len=%zu)", id.c_str(),
                  static_cast<unsigned>(total), chunk.size());
        return {};
    }
    Bytes out(HEADER_OVERHEAD + chunk.size());
    out[0] = static_cast<std::uint8_t>(id[0]);
    out[1] = static_cast<std::uint8_t>(id[1]);

    std::uint16_t total_be = htons(total);
    std::memcpy(out.data() + 2, &total_be, sizeof total_be);

    std::uint32_t crc_be = htonl(checksum);
    std::memcpy(out.data() + 4, &crc_be, sizeof crc_be);

    out[8] = flags;
    if (!chunk.empty())
        std::memcpy(out.data() + HEADER_OVERHEAD, chunk.data(), chunk.size());
    return out;
}

Bytes encode_data(const MessageId &id, std::uint16_t number, const Bytes &chunk)
{
    // parcel 1 is always the header
    if (!valid_msg_id(id) || number < 2 || chunk.size() > DATA_CAPACITY)
    {
        LOG_ERROR("encode_data: invalid data parcel (id='%s' num=%u len=%zu)", id.c_str(),
                  static_cast<unsigned>(number), chunk.size());
        return {};
    }
    Bytes out(DATA_OVERHEAD + chunk.size());
    out[0] = static_cast<std::uint8_t>(id[0]);
    out[1] = static_cast<std::uint8_t>(id[1]);

    std::uint16_t num_be = htons(number);
    std::memcpy(out.data() + 2, &num_be, sizeof num_be);

    if (!chunk.empty())
        std::memcpy(out.data() + DATA_OVERHEAD, chunk.data(), chunk.size());
    return out;
}

Bytes encode(const Parcel &p)
{
    if (p.kind == Kind::Header)
        return encode_header(p.msg_id, p.total, p.checksum, p.flags, p.payload);
    return encode_data(p.msg_id, p.number, p.payload);
}

std::optional<MessageId> peek_msg_id(const Bytes &frame)
{
    if (frame.size() < constants::MSG_ID_LEN)
        return std::nullopt;
    MessageId id(reinterpret_cast<const char *>(frame.data()), constants::MSG_ID_LEN);
    if (!valid_msg_id(id))
        return std::nullopt;
    return id;
}

std::optional<Parcel> decode_header(const Bytes &frame)
{
    if (frame.size() < HEADER_OVERHEAD || frame.size() > constants::MAX_PARCEL_SIZE)
    {
        LOG_WARN("decode_header: bad frame size (%zu)", frame.size());
        return std::nullopt;
    }
    auto id = peek_msg_id(frame);
    if (!id)
    {
        LOG_WARN("decode_header: invalid message id");
        return std::nullopt;
    }
    Parcel p;
    p.kind   = Kind::Header;
    p.msg_id = *id;
    p.number = 1;

    std::uint16_t total_be;
    std::memcpy(&total_be, frame.data() + 2, sizeof total_be);
    p.total = ntohs(total_be);

    std::uint32_t crc_be;
    std::memcpy(&crc_be, frame.data() + 4, sizeof crc_be);
    p.checksum = ntohl(crc_be);

    p.flags = frame[8];
    p.payload.assign(frame.begin() + HEADER_OVERHEAD, frame.end());
    return p;
}

std::optional<Parcel> decode_data(const Bytes &frame)
{
    if (frame.size() < DATA_OVERHEAD || frame.size() > constants::MAX_PARCEL_SIZE)
    {
        LOG_WARN("decode_data: bad frame size (%zu)", frame.size());
        return std::nullopt;
    }
    auto id = peek_msg_id(frame);
    if (!id)
    {
        LOG_WARN("decode_data: invalid message id");
        return std::nullopt;
    }
    Parcel p;
    p.kind   = Kind::Data;
    p.msg_id = *id;

    std::uint16_t num_be;
    std::memcpy(&num_be, frame.data() + 2, sizeof num_be);
    p.number = ntohs(num_be);

    p.payload.assign(frame.begin() + DATA_OVERHEAD, frame.end());
    return p;
}

std::size_t parcel_count(std::size_t wire_size)
{
    if (wire_size <= HEADER_CAPACITY)
        return 1;
    const std::size_t rest = wire_size - HEADER_CAPACITY;
    return 1 + (rest + DATA_CAPACITY - 1) / DATA_CAPACITY;
}

std::vector<Parcel> split(const MessageId &id, const Bytes &wire, std::uint8_t flags)
{
    if (!valid_msg_id(id))
    {
        LOG_ERROR("split: invalid message id '%s'", id.c_str());
        return {};
    }
    const std::size_t total = parcel_count(wire.size());
    if (total > constants::MAX_PARCELS)
    {
        LOG_ERROR("split: payload too large (%zu bytes, needs %zu parcels)", wire.size(), total);
        return {};
    }

    std::vector<Parcel> out;
    out.reserve(total);

    Parcel head;
    head.kind     = Kind::Header;
    head.msg_id   = id;
    head.number   = 1;
    head.total    = static_cast<std::uint16_t>(total);
    head.checksum = crc32(wire);
    head.flags    = flags;

    std::size_t take = std::min(HEADER_CAPACITY, wire.size());
    head.payload.assign(wire.begin(), wire.begin() + take);
    out.push_back(std::move(head));

    std::size_t   offset = take;
    std::uint16_t num    = 2;
    while (offset < wire.size())
    {
        take = std::min(DATA_CAPACITY, wire.size() - offset);
        Parcel d;
        d.kind   = Kind::Data;
        d.msg_id = id;
        d.number = num++;
        d.payload.assign(wire.begin() + offset, wire.begin() + offset + take);
        offset += take;
        out.push_back(std::move(d));
    }
    return out;
}

}  // namespace parcel
