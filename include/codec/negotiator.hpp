#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "codec/compressor.hpp"

namespace codec
{

enum class DecodeStatus
{
    Ok,
    UnsupportedCompression,
    DecompressFailed
};

struct Outbound
{
    std::uint8_t              flags{ALGO_NONE};
    std::vector<std::uint8_t> wire;  // bytes that go on the wire and into the CRC
};

// PNG, JPEG, GZIP, ZLIB and ZIP signatures
bool looks_compressed(const std::vector<std::uint8_t> &data);

class Negotiator
{
  public:
    explicit Negotiator(std::size_t threshold = constants::COMPRESSION_THRESHOLD);

    // The first registered compressor is the one used for sending.
    void add(std::unique_ptr<Compressor> c);
    bool supports(std::uint8_t algorithm) const;
    bool supports_name(const std::string &name) const;

    // Capability tokens for HELLO, e.g. "compression:deflate"
    std::vector<std::string> capability_tokens() const;

    bool should_compress(const std::vector<std::uint8_t> &payload, bool peer_supports) const;

    // Decides once per message. The flags always describe the returned wire bytes.
    Outbound prepare_outbound(const std::vector<std::uint8_t> &payload, bool peer_supports) const;

    DecodeStatus restore_inbound(std::uint8_t                     flags,
                                 const std::vector<std::uint8_t> &wire,
                                 std::vector<std::uint8_t>       &out) const;

  private:
    Compressor *find(std::uint8_t algorithm) const;

    std::size_t                              threshold_;
    std::vector<std::unique_ptr<Compressor>> codecs_;
};

// Negotiator with the DEFLATE codec registered
Negotiator make_default_negotiator(std::size_t threshold = constants::COMPRESSION_THRESHOLD);

}  // namespace codec
