/*
 * Copyright (c) 2023 MariaDB plc, Finnish Branch
 *
 * Use of this software is governed by the Business Source License included
 * in the LICENSE.TXT file and at www.mariadb.com/bsl11.
 *
 * Change Date: 2029-02-28
 *
 * On the date above, in accordance with the Business Source License, use
 * of this software will be governed by version 2 or later of the General
 * Public License.
 */

#define WXB_MODULE_NAME "codec"

#include <wiresql/codec.hh>

#include <algorithm>
#include <wirebase/log.hh>
#include <wiresql/error.hh>

namespace
{
using namespace wiresql;

// Largest length-encoded integer is the marker and 8 bytes.
const size_t LENENC_MAX_SIZE = 9;

size_t encode_length(uint64_t length, uint8_t* out)
{
    size_t n = 1;

    if (length <= LENENC_MAX_1BYTE)
    {
        out[0] = length;
    }
    else if (length <= 0xffff)
    {
        out[0] = LENENC_2BYTE;
        set_byte2(out + 1, length);
        n += 2;
    }
    else if (length <= 0xffffff)
    {
        out[0] = LENENC_3BYTE;
        set_byte3(out + 1, length);
        n += 3;
    }
    else
    {
        out[0] = LENENC_8BYTE;
        set_byte8(out + 1, length);
        n += 8;
    }

    return n;
}

void check_length(int64_t length, const char* what)
{
    if (length < 0)
    {
        WXB_THROW(InvalidLength, "Negative " << what << " " << length);
    }
}
}

namespace wiresql
{

size_t length_encoded_size(uint64_t length)
{
    uint8_t data[LENENC_MAX_SIZE];
    return encode_length(length, data);
}

BinaryCodec::BinaryCodec(ByteCursor& cursor, uint32_t max_packet_size)
    : m_cursor(cursor)
    , m_max_packet_size(std::min<uint32_t>(max_packet_size, MYSQL_PACKET_LENGTH_MAX))
{
}

/**
 * Decode the length-encoded integer at an absolute offset without consuming it.
 *
 * @param offset  Offset of the marker byte
 * @param value   The value, NULL_LENGTH for the NULL marker or the marker itself if unknown
 *
 * @return Number of bytes the integer occupies, 0 if the marker is unknown
 */
size_t BinaryCodec::peek_length(size_t offset, int64_t* value) const
{
    size_t readable = m_cursor.writer_index() - std::min(offset, m_cursor.writer_index());

    if (readable == 0)
    {
        WXB_THROW(BufferUnderrun, "No bytes left for a length-encoded integer at offset " << offset);
    }

    uint8_t data[LENENC_MAX_SIZE];
    m_cursor.copy_data(offset, 1, data);
    uint8_t marker = data[0];
    size_t width = 0;

    if (marker <= LENENC_MAX_1BYTE)
    {
        *value = marker;
        return 1;
    }

    switch (marker)
    {
    case LENENC_NULL:
        *value = NULL_LENGTH;
        return 1;

    case LENENC_2BYTE:
        width = 3;
        break;

    case LENENC_3BYTE:
        width = 4;
        break;

    case LENENC_8BYTE:
        width = 9;
        break;

    default:
        *value = marker;
        return 0;
    }

    if (readable < width)
    {
        WXB_THROW(BufferUnderrun, "Length-encoded integer with marker 0x" << std::hex << (int)marker
                                                                         << std::dec << " needs " << width
                                                                         << " bytes, only " << readable
                                                                         << " readable");
    }

    m_cursor.copy_data(offset, width, data);

    switch (marker)
    {
    case LENENC_2BYTE:
        *value = get_byte2(data + 1);
        break;

    case LENENC_3BYTE:
        // The 3-byte form carries lengths up to 2^24 - 1, so it is not sign-extended.
        *value = get_byte3(data + 1);
        break;

    default:
        *value = get_byte8(data + 1);
        break;
    }

    return width;
}

std::string BinaryCodec::peek_string(size_t offset, size_t length, const Charset& charset) const
{
    size_t readable = m_cursor.writer_index() - std::min(offset, m_cursor.writer_index());

    if (length > readable)
    {
        WXB_THROW(BufferUnderrun, "Cannot read a string of " << length << " bytes at offset " << offset
                                                             << ", only " << readable << " readable");
    }

    std::vector<uint8_t> bytes(length);
    m_cursor.copy_data(offset, length, bytes.data());
    return charset.decode(bytes);
}

int64_t BinaryCodec::read_binary_length()
{
    int64_t value;
    size_t width = peek_length(m_cursor.reader_index(), &value);

    if (width == 0)
    {
        m_cursor.skip_bytes(1);
        WXB_WARNING("Unknown length encoding marker 0x%02x at offset %lu, the buffer is misaligned or corrupt.",
                    (unsigned)value, m_cursor.reader_index() - 1);
        WXB_THROWCode(UnknownLengthEncoding, value, "Unknown length encoding marker " << value);
    }

    m_cursor.skip_bytes(width);
    return value;
}

void BinaryCodec::write_length(int64_t length)
{
    check_length(length, "length");

    uint8_t data[LENENC_MAX_SIZE];
    size_t n = encode_length(length, data);
    m_cursor.write_bytes(data, n);
}

void BinaryCodec::write_null()
{
    m_cursor.write_byte(LENENC_NULL);
}

std::string BinaryCodec::read_fixed_string(int64_t length, const Charset& charset)
{
    check_length(length, "string length");

    std::string rval = peek_string(m_cursor.reader_index(), length, charset);
    m_cursor.skip_bytes(length);
    return rval;
}

std::optional<std::string> BinaryCodec::read_nullable_length_encoded_string(const Charset& charset)
{
    size_t start = m_cursor.reader_index();
    int64_t length;
    size_t width = peek_length(start, &length);

    if (width == 0)
    {
        // Consumes the marker and throws.
        read_binary_length();
    }

    if (length == NULL_LENGTH)
    {
        m_cursor.skip_bytes(width);
        return {};
    }

    check_length(length, "string length");

    std::string rval = peek_string(start + width, length, charset);
    m_cursor.skip_bytes(width + length);
    return rval;
}

std::string BinaryCodec::read_length_encoded_string(const Charset& charset)
{
    int64_t length;

    if (peek_length(m_cursor.reader_index(), &length) == 1 && length == NULL_LENGTH)
    {
        WXB_THROW(InvalidLength, "NULL length at offset " << m_cursor.reader_index()
                                                          << " where a string is required");
    }

    return *read_nullable_length_encoded_string(charset);
}

void BinaryCodec::write_length_encoded_string(const std::string& value, const Charset& charset)
{
    std::vector<uint8_t> bytes = charset.encode(value);

    std::vector<uint8_t> staged(length_encoded_size(bytes.size()) + bytes.size());
    size_t n = encode_length(bytes.size(), staged.data());
    std::copy(bytes.begin(), bytes.end(), staged.begin() + n);

    m_cursor.write_bytes(staged.data(), staged.size());
}

std::string BinaryCodec::read_cstring(const Charset& charset)
{
    size_t start = m_cursor.reader_index();
    std::vector<uint8_t> rest(m_cursor.readable_bytes());
    m_cursor.copy_data(start, rest.size(), rest.data());

    auto it = std::find(rest.begin(), rest.end(), 0);

    if (it == rest.end())
    {
        WXB_THROW(BufferUnderrun, "No NUL terminator in the " << rest.size()
                                                              << " bytes readable at offset " << start);
    }

    std::string rval = charset.decode(rest.data(), it - rest.begin());
    m_cursor.skip_bytes(it - rest.begin() + 1);
    return rval;
}

std::string BinaryCodec::read_until_eof(const Charset& charset)
{
    size_t length = m_cursor.readable_bytes();
    std::string rval = peek_string(m_cursor.reader_index(), length, charset);
    m_cursor.skip_bytes(length);
    return rval;
}

void BinaryCodec::write_cstring(const std::string& value, const Charset& charset)
{
    std::vector<uint8_t> bytes = charset.encode(value);

    if (std::find(bytes.begin(), bytes.end(), 0) != bytes.end())
    {
        WXB_THROW(CodecError, "A NUL-terminated string cannot contain NUL bytes");
    }

    bytes.push_back(0);
    m_cursor.write_bytes(bytes);
}

int32_t BinaryCodec::read_3byte_int()
{
    uint8_t data[3];
    m_cursor.read_bytes(data, sizeof(data));

    uint32_t value = get_byte3(data);

    if (value & 0x800000)
    {
        value |= 0xff000000;
    }

    return value;
}

void BinaryCodec::write_long_int(int64_t value)
{
    uint8_t data[3];
    set_byte3(data, value & 0xffffff);
    m_cursor.write_bytes(data, sizeof(data));
}

void BinaryCodec::write_packet_length(uint8_t sequence)
{
    wiresql::write_packet_length(m_cursor, sequence, m_max_packet_size);
    WXB_DEBUG("Packet %u has a payload of %lu bytes.",
              (unsigned)sequence, m_cursor.writer_index() - MYSQL_HEADER_LEN);
}
}
