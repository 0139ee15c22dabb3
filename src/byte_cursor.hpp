#pragma once
#include <cstdint>
#include <cstddef>
#include <span>
#include <string>

namespace psyq {

// Sequential little-endian reader over a buffer it does not own.
// Every read either consumes its full width or throws TruncatedInput and
// leaves the position where it was.
class ByteCursor
{
    std::span<const uint8_t> source;
    size_t cursor = 0;

public:
    explicit ByteCursor(std::span<const uint8_t> data) : source(data) {}

    uint8_t read_u8();
    uint16_t read_u16_le();
    uint32_t read_u32_le();
    std::span<const uint8_t> read_bytes(size_t count);
    void skip(size_t count);

    // One length byte, then that many raw bytes. Used for every name field.
    std::string read_length_prefixed_bytes();

    void seek(size_t position);

    constexpr size_t position() const { return cursor; }
    constexpr size_t size() const { return source.size(); }
    constexpr size_t remaining() const { return source.size() - cursor; }
    constexpr bool is_eof() const { return cursor >= source.size(); }

private:
    void require(size_t count) const;
};

} // namespace psyq
