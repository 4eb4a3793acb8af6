#include <algorithm>

#include "engine/receive_buffer.hpp"
#include "util/log.hpp"

namespace engine
{

bool ReceiveBuffer::complete(const Inbound &in)
{
    // out-of-range numbers never get in, so the count is enough
    return in.has_header && in.parcels.size() == in.total;
}

std::vector<std::uint16_t> ReceiveBuffer::missing_of(const Inbound &in)
{
    std::vector<std::uint16_t> out;
    std::uint16_t              upto = in.total;
    if (!in.has_header)
        upto = in.parcels.empty() ? 1 : std::max<std::uint16_t>(1, in.parcels.rbegin()->first);
    for (std::uint32_t n = 1; n <= upto; ++n)
    {
        if (!in.parcels.count(static_cast<std::uint16_t>(n)))
            out.push_back(static_cast<std::uint16_t>(n));
    }
    return out;
}

bool ReceiveBuffer::is_stray_locked(const MessageId &id, const Bytes &frame) const
{
    auto fit = finished_.find(id);
    if (fit == finished_.end())
        return false;
    const Finished &done = fit->second;
    if (auto h = parcel::decode_header(frame))
    {
        if (h->total == done.total && h->checksum == done.checksum && h->flags == done.flags)
            return true;
    }
    if (auto d = parcel::decode_data(frame))
    {
        auto cit = done.payload_crc.find(d->number);
        if (cit != done.payload_crc.end() && cit->second == parcel::crc32(d->payload))
            return true;
    }
    return false;
}

AddResult ReceiveBuffer::add_frame(const Bytes &frame, SteadyTime now, MessageId *id_out)
{
    auto id = parcel::peek_msg_id(frame);
    if (!id)
    {
        LOG_WARN("add_frame: dropping frame without a valid message id (%zu bytes)",
                 frame.size());
        return AddResult::Rejected;
    }
    if (id_out)
        *id_out = *id;

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it    = map_.find(*id);
    const bool                  known = it != map_.end();
    if (known && it->second.has_header)
    {
        // a resent header matches the stored total, checksum and flags
        auto h = parcel::decode_header(frame);
        if (h && h->total == it->second.total && h->checksum == it->second.checksum &&
            h->flags == it->second.flags)
        {
            it->second.last_at = now;
            LOG_DEBUG("add_frame: repeated header for %s", id->c_str());
            return AddResult::Duplicate;
        }
    }
    if (!known && is_stray_locked(*id, frame))
    {
        LOG_DEBUG("add_frame: late parcel for already assembled %s", id->c_str());
        return AddResult::Duplicate;
    }
    auto p = known ? parcel::decode_data(frame) : parcel::decode_header(frame);
    if (!p)
    {
        LOG_WARN("add_frame: malformed %s parcel for %s", known ? "data" : "header",
                 id->c_str());
        return AddResult::Rejected;
    }
    return add_locked(*p, now);
}

AddResult ReceiveBuffer::add_parcel(const parcel::Parcel &p, SteadyTime now)
{
    if (!parcel::valid_msg_id(p.msg_id))
        return AddResult::Rejected;
    std::lock_guard<std::mutex> lk(mu_);
    return add_locked(p, now);
}

AddResult ReceiveBuffer::add_locked(const parcel::Parcel &p, SteadyTime now)
{
    if (p.kind == parcel::Kind::Header)
    {
        if (p.total == 0 || p.payload.size() > constants::HEADER_CAPACITY)
        {
            LOG_WARN("add_parcel: bad header for %s (total=%u)", p.msg_id.c_str(),
                     static_cast<unsigned>(p.total));
            return AddResult::Rejected;
        }
    }
    else if (p.number < 2 || p.payload.size() > constants::DATA_CAPACITY)
    {
        LOG_WARN("add_parcel: bad data parcel %u for %s", static_cast<unsigned>(p.number),
                 p.msg_id.c_str());
        return AddResult::Rejected;
    }

    auto [it, created] = map_.try_emplace(p.msg_id);
    Inbound &in        = it->second;
    if (created)
    {
        in.first_at = now;
        LOG_DEBUG("add_parcel: new inbound message %s", p.msg_id.c_str());
    }

    if (p.kind == parcel::Kind::Header)
    {
        if (in.has_header)
        {
            in.last_at = now;
            LOG_DEBUG("add_parcel: duplicate header for %s", p.msg_id.c_str());
            return AddResult::Duplicate;
        }
        in.has_header = true;
        in.total      = p.total;
        in.checksum   = p.checksum;
        in.flags      = p.flags;
        // data parcels that arrived early and lie beyond the declared end are noise
        for (auto pit = in.parcels.begin(); pit != in.parcels.end();)
        {
            if (pit->first > in.total)
                pit = in.parcels.erase(pit);
            else
                ++pit;
        }
        LOG_DEBUG("add_parcel: %s expects %u parcels (flags=0x%02x)", p.msg_id.c_str(),
                  static_cast<unsigned>(in.total), static_cast<unsigned>(in.flags));
    }
    else if (in.has_header && p.number > in.total)
    {
        LOG_WARN("add_parcel: parcel %u beyond total %u for %s", static_cast<unsigned>(p.number),
                 static_cast<unsigned>(in.total), p.msg_id.c_str());
        return AddResult::Rejected;
    }

    in.last_at = now;
    auto [pit, inserted] = in.parcels.try_emplace(p.number, p.payload);
    if (!inserted)
    {
        LOG_DEBUG("add_parcel: duplicate parcel %u for %s", static_cast<unsigned>(p.number),
                  p.msg_id.c_str());
        return AddResult::Duplicate;
    }
    return complete(in) ? AddResult::Completed : AddResult::Added;
}

bool ReceiveBuffer::is_complete(const MessageId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(id);
    return it != map_.end() && complete(it->second);
}

std::vector<std::uint16_t> ReceiveBuffer::missing_parcels(const MessageId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(id);
    if (it == map_.end())
        return {};
    return missing_of(it->second);
}

Assembled ReceiveBuffer::assemble(const MessageId &id)
{
    Assembled                   out;
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(id);
    if (it == map_.end())
        return out;

    const Inbound &in = it->second;
    if (!complete(in))
    {
        out.status  = AssembleStatus::MissingParcels;
        out.missing = missing_of(in);
        return out;
    }

    std::size_t size = 0;
    for (const auto &kv : in.parcels)
        size += kv.second.size();
    out.payload.reserve(size);
    for (const auto &kv : in.parcels)  // std::map iterates in parcel order
        out.payload.insert(out.payload.end(), kv.second.begin(), kv.second.end());
    out.flags = in.flags;

    const std::uint32_t actual = parcel::crc32(out.payload);
    if (actual != in.checksum)
    {
        LOG_WARN("assemble: checksum mismatch for %s (got %08x, want %08x)", id.c_str(), actual,
                 in.checksum);
        out.status = AssembleStatus::ChecksumMismatch;
        out.payload.clear();
    }
    else
    {
        out.status = AssembleStatus::Ok;
        Finished done{in.total, in.checksum, in.flags, {}, in.last_at};
        for (const auto &kv : in.parcels)
        {
            if (kv.first >= 2)
                done.payload_crc.emplace(kv.first, parcel::crc32(kv.second));
        }
        finished_[id] = std::move(done);
    }
    map_.erase(it);
    return out;
}

void ReceiveBuffer::clear(const MessageId &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    map_.erase(id);
}

bool ReceiveBuffer::has(const MessageId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.count(id) != 0;
}

std::size_t ReceiveBuffer::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

std::vector<MissingRequest> ReceiveBuffer::collect_missing_requests(SteadyTime now, Millis delay)
{
    std::vector<MissingRequest> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : map_)
    {
        Inbound &in = kv.second;
        if (complete(in))
            continue;
        SteadyTime anchor = in.last_at;
        if (in.last_request_at && *in.last_request_at > anchor)
            anchor = *in.last_request_at;
        if (now - anchor < delay)
            continue;
        auto missing = missing_of(in);
        if (missing.empty())
            continue;
        in.last_request_at = now;
        out.push_back(MissingRequest{kv.first, std::move(missing)});
    }
    return out;
}

std::vector<DroppedInbound> ReceiveBuffer::drop_stale(SteadyTime now, Millis timeout)
{
    std::vector<DroppedInbound> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = map_.begin(); it != map_.end();)
    {
        if (now - it->second.first_at > timeout)
        {
            out.push_back(DroppedInbound{it->first, it->second.parcels.size(),
                                         it->second.has_header ? it->second.total : 0u});
            it = map_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    for (auto it = finished_.begin(); it != finished_.end();)
    {
        if (now - it->second.at > timeout)
            it = finished_.erase(it);
        else
            ++it;
    }
    return out;
}

}  // namespace engine
