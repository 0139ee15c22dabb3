#include "byte_cursor.hpp"
#include "errors.hpp"

namespace psyq {

void ByteCursor::require(size_t count) const
{
    if (count > remaining()) {
        throw ParseError(ErrorKind::TruncatedInput, cursor,
                         "need " + std::to_string(count) + " bytes, " + std::to_string(remaining()) + " left");
    }
}

uint8_t ByteCursor::read_u8()
{
    require(1);
    return source[cursor++];
}

uint16_t ByteCursor::read_u16_le()
{
    require(2);
    uint16_t value = static_cast<uint16_t>(source[cursor]) |
                     (static_cast<uint16_t>(source[cursor + 1]) << 8);
    cursor += 2;
    return value;
}

uint32_t ByteCursor::read_u32_le()
{
    require(4);
    uint32_t value = static_cast<uint32_t>(source[cursor]) |
                     (static_cast<uint32_t>(source[cursor + 1]) << 8) |
                     (static_cast<uint32_t>(source[cursor + 2]) << 16) |
                     (static_cast<uint32_t>(source[cursor + 3]) << 24);
    cursor += 4;
    return value;
}

std::span<const uint8_t> ByteCursor::read_bytes(size_t count)
{
    require(count);
    auto bytes = source.subspan(cursor, count);
    cursor += count;
    return bytes;
}

void ByteCursor::skip(size_t count)
{
    require(count);
    cursor += count;
}

std::string ByteCursor::read_length_prefixed_bytes()
{
    const size_t start = cursor;
    const uint8_t length = read_u8();
    if (length > remaining()) {
        // rewind so the error points at the whole field, not its payload
        cursor = start;
        throw ParseError(ErrorKind::TruncatedInput, start,
                         "name of " + std::to_string(length) + " bytes runs past end of input");
    }
    auto bytes = read_bytes(length);
    return std::string(bytes.begin(), bytes.end());
}

void ByteCursor::seek(size_t position)
{
    if (position > source.size()) {
        throw ParseError(ErrorKind::TruncatedInput, cursor,
                         "seek to " + std::to_string(position) + " past end of input");
    }
    cursor = position;
}

} // namespace psyq
