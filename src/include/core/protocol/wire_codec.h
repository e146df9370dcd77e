/*
    wire_codec.h
    Binary framing of the upload protocol. All integers are big-endian.

    Client -> Server, once per connection:
        u32 len | utf8 client_name | u64 file_size | u32 len | utf8 filename
        | u32 len | utf8 upload_id
    Server -> Client:
        u64 resume_offset
    Client -> Server:
        raw file bytes [resume_offset, file_size)
    Server -> Client:
        "OK" or "ER"
*/

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reup::core {

using BinaryData = std::vector<std::uint8_t>;

struct TransferHeader {
    std::string client_name;
    std::uint64_t file_size = 0;
    std::string filename;
    std::string upload_id;
};

enum class StatusReply {
    kOk,
    kError,
    kUnexpected,
};

namespace wire {

constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::size_t kOffsetSize = 8;
constexpr std::size_t kStatusSize = 2;

constexpr std::array<std::uint8_t, kStatusSize> kStatusOk{'O', 'K'};
constexpr std::array<std::uint8_t, kStatusSize> kStatusError{'E', 'R'};

BinaryData EncodeU32(std::uint32_t value);
BinaryData EncodeU64(std::uint64_t value);
BinaryData EncodeString(std::string_view value);
BinaryData EncodeHeader(std::string_view client_name,
                        std::string_view filename,
                        std::uint64_t file_size,
                        std::string_view upload_id);

// Throw TruncatedFrame when `bytes` is shorter than the field
std::uint32_t DecodeU32(std::span<const std::uint8_t> bytes);
std::uint64_t DecodeU64(std::span<const std::uint8_t> bytes);

StatusReply DecodeStatus(std::span<const std::uint8_t> bytes);
std::string_view StatusToString(StatusReply status);

// Sequential reader over a received frame
class WireReader {
public:
    explicit WireReader(std::span<const std::uint8_t> bytes)
        : bytes_(bytes) {}

    std::uint32_t ReadU32();
    std::uint64_t ReadU64();
    std::string ReadString();

    std::size_t consumed() const { return pos_; }
    std::size_t remaining() const { return bytes_.size() - pos_; }

private:
    std::span<const std::uint8_t> take(std::size_t size);

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_ = 0;
};

TransferHeader DecodeHeader(std::span<const std::uint8_t> bytes);

} // namespace wire

} // namespace reup::core
