#include <zlib.h>

#include "codec/compressor.hpp"
#include "util/log.hpp"

namespace codec
{

bool DeflateCompressor::compress(const std::vector<std::uint8_t> &in,
                                 std::vector<std::uint8_t>       &out)
{
    uLongf bound = compressBound(static_cast<uLong>(in.size()));
    out.resize(bound);
    const int rc = compress2(out.data(), &bound, in.data(), static_cast<uLong>(in.size()),
                             Z_BEST_COMPRESSION);
    if (rc != Z_OK)
    {
        LOG_WARN("compress2 failed (%d)", rc);
        out.clear();
        return false;
    }
    out.resize(bound);
    return true;
}

bool DeflateCompressor::decompress(const std::vector<std::uint8_t> &in,
                                   std::vector<std::uint8_t>       &out)
{
    out.clear();
    if (in.empty())
        return false;

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK)
    {
        LOG_ERROR("inflateInit failed");
        return false;
    }
    zs.next_in  = const_cast<Bytef *>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());

    std::uint8_t buf[4096];
    int          rc = Z_OK;
    while (rc == Z_OK)
    {
        zs.next_out  = buf;
        zs.avail_out = sizeof(buf);
        rc           = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
            break;
        const std::size_t got = sizeof(buf) - zs.avail_out;
        if (out.size() + got > max_output_)
        {
            LOG_WARN("inflate output exceeds %zu bytes", max_output_);
            rc = Z_BUF_ERROR;
            break;
        }
        out.insert(out.end(), buf, buf + got);
        // input exhausted without stream end: truncated
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)
        {
            rc = Z_DATA_ERROR;
            break;
        }
    }
    inflateEnd(&zs);

    if (rc != Z_STREAM_END)
    {
        LOG_WARN("inflate failed (%d)", rc);
        out.clear();
        return false;
    }
    return true;
}

}  // namespace codec
