#include "codec/negotiator.hpp"
#include "util/log.hpp"

namespace codec
{

bool looks_compressed(const std::vector<std::uint8_t> &d)
{
    if (d.size() < 4)
        return false;
    // PNG
    if (d[0] == 0x89 && d[1] == 0x50 && d[2] == 0x4E && d[3] == 0x47)
        return true;
    // JPEG
    if (d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF)
        return true;
    // GZIP
    if (d[0] == 0x1F && d[1] == 0x8B)
        return true;
    // ZLIB
    if (d[0] == 0x78 && (d[1] == 0x01 || d[1] == 0x5E || d[1] == 0x9C || d[1] == 0xDA))
        return true;
    // ZIP
    if (d[0] == 0x50 && d[1] == 0x4B && d[2] == 0x03 && d[3] == 0x04)
        return true;
    return false;
}

Negotiator::Negotiator(std::size_t threshold) : threshold_(threshold) {}

void Negotiator::add(std::unique_ptr<Compressor> c)
{
    if (!c || c->algorithm() == ALGO_NONE || c->algorithm() > 0x0F)
    {
        LOG_ERROR("add: rejecting compressor with invalid algorithm id");
        return;
    }
    codecs_.push_back(std::move(c));
}

Compressor *Negotiator::find(std::uint8_t algorithm) const
{
    for (const auto &c : codecs_)
    {
        if (c->algorithm() == algorithm)
            return c.get();
    }
    return nullptr;
}

bool Negotiator::supports(std::uint8_t algorithm) const
{
    return find(algorithm) != nullptr;
}

bool Negotiator::supports_name(const std::string &name) const
{
    for (const auto &c : codecs_)
    {
        if (c->name() == name)
            return true;
    }
    return false;
}

std::vector<std::string> Negotiator::capability_tokens() const
{
    std::vector<std::string> out;
    for (const auto &c : codecs_)
        out.push_back(std::string(constants::CAP_COMPRESSION_PREFIX) + std::string(c->name()));
    return out;
}

bool Negotiator::should_compress(const std::vector<std::uint8_t> &payload,
                                 bool                             peer_supports) const
{
    if (!peer_supports || codecs_.empty())
        return false;
    if (payload.size() < threshold_)
        return false;
    return !looks_compressed(payload);
}

Outbound Negotiator::prepare_outbound(const std::vector<std::uint8_t> &payload,
                                      bool                             peer_supports) const
{
    Outbound out;
    if (should_compress(payload, peer_supports))
    {
        Compressor               *c = codecs_.front().get();
        std::vector<std::uint8_t> packed;
        if (c->compress(payload, packed) && packed.size() < payload.size())
        {
            LOG_DEBUG("compressed %zu -> %zu bytes (%s)", payload.size(), packed.size(),
                      std::string(c->name()).c_str());
            out.flags = c->algorithm();
            out.wire  = std::move(packed);
            return out;
        }
        LOG_DEBUG("compression did not shrink %zu bytes, sending raw", payload.size());
    }
    out.flags = ALGO_NONE;
    out.wire  = payload;
    return out;
}

DecodeStatus Negotiator::restore_inbound(std::uint8_t                     flags,
                                         const std::vector<std::uint8_t> &wire,
                                         std::vector<std::uint8_t>       &out) const
{
    const std::uint8_t algo = flags & 0x0F;
    if (algo == ALGO_NONE)
    {
        out = wire;
        return DecodeStatus::Ok;
    }
    Compressor *c = find(algo);
    if (!c)
    {
        LOG_ERROR("unsupported compression algorithm %u", static_cast<unsigned>(algo));
        return DecodeStatus::UnsupportedCompression;
    }
    if (!c->decompress(wire, out))
        return DecodeStatus::DecompressFailed;
    return DecodeStatus::Ok;
}

Negotiator make_default_negotiator(std::size_t threshold)
{
    Negotiator n(threshold);
    n.add(std::make_unique<DeflateCompressor>());
    return n;
}

}  // namespace codec
