#include <algorithm>
#include <core/network/client/transfer_fault.h>
#include <core/protocol/wire_codec.h>
#include <limits>
#include <stdexcept>

namespace reup::core::wire {

namespace {

template<typename T>
void appendBigEndian(BinaryData& out, T value) {
    for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
}

template<typename T>
T readBigEndian(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < sizeof(T)) {
        throw TruncatedFrame(sizeof(T), bytes.size());
    }
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | bytes[i]);
    }
    return value;
}

void appendString(BinaryData& out, std::string_view value) {
    if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("string field exceeds u32 length prefix");
    }
    appendBigEndian(out, static_cast<std::uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace

BinaryData EncodeU32(std::uint32_t value) {
    BinaryData out;
    out.reserve(sizeof(value));
    appendBigEndian(out, value);
    return out;
}

BinaryData EncodeU64(std::uint64_t value) {
    BinaryData out;
    out.reserve(sizeof(value));
    appendBigEndian(out, value);
    return out;
}

BinaryData EncodeString(std::string_view value) {
    BinaryData out;
    out.reserve(kLengthPrefixSize + value.size());
    appendString(out, value);
    return out;
}

BinaryData EncodeHeader(std::string_view client_name,
                        std::string_view filename,
                        std::uint64_t file_size,
                        std::string_view upload_id) {
    // One contiguous buffer so the header goes out in a single write
    BinaryData out;
    out.reserve(3 * kLengthPrefixSize + kOffsetSize + client_name.size() + filename.size()
                + upload_id.size());
    appendString(out, client_name);
    appendBigEndian(out, file_size);
    appendString(out, filename);
    appendString(out, upload_id);
    return out;
}

std::uint32_t DecodeU32(std::span<const std::uint8_t> bytes) {
    return readBigEndian<std::uint32_t>(bytes);
}

std::uint64_t DecodeU64(std::span<const std::uint8_t> bytes) {
    return readBigEndian<std::uint64_t>(bytes);
}

StatusReply DecodeStatus(std::span<const std::uint8_t> bytes) {
    if (bytes.size() != kStatusSize) {
        return StatusReply::kUnexpected;
    }
    if (std::equal(bytes.begin(), bytes.end(), kStatusOk.begin())) {
        return StatusReply::kOk;
    }
    if (std::equal(bytes.begin(), bytes.end(), kStatusError.begin())) {
        return StatusReply::kError;
    }
    return StatusReply::kUnexpected;
}

std::string_view StatusToString(StatusReply status) {
    switch (status) {
    case StatusReply::kOk:
        return "OK";
    case StatusReply::kError:
        return "ER";
    case StatusReply::kUnexpected:
        return "unexpected";
    }
    return "unexpected";
}

std::span<const std::uint8_t> WireReader::take(std::size_t size) {
    if (remaining() < size) {
        throw TruncatedFrame(size, remaining());
    }
    auto field = bytes_.subspan(pos_, size);
    pos_ += size;
    return field;
}

std::uint32_t WireReader::ReadU32() {
    return DecodeU32(take(sizeof(std::uint32_t)));
}

std::uint64_t WireReader::ReadU64() {
    return DecodeU64(take(sizeof(std::uint64_t)));
}

std::string WireReader::ReadString() {
    std::uint32_t length = ReadU32();
    auto field = take(length);
    return std::string(field.begin(), field.end());
}

TransferHeader DecodeHeader(std::span<const std::uint8_t> bytes) {
    WireReader reader(bytes);
    TransferHeader header;
    header.client_name = reader.ReadString();
    header.file_size = reader.ReadU64();
    header.filename = reader.ReadString();
    header.upload_id = reader.ReadString();
    return header;
}

} // namespace reup::core::wire
