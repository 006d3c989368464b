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
#pragma once

#include <wiresql/ccdefs.hh>
#include <optional>
#include <string>
#include <wiresql/charset.hh>
#include <wiresql/cursor.hh>
#include <wiresql/packet.hh>

namespace wiresql
{

/**
 * Length-encoded integer markers. A first byte up to LENENC_MAX_1BYTE is the value itself.
 */
enum LenencMarker : uint8_t
{
    LENENC_MAX_1BYTE = 0xfa,
    LENENC_NULL      = 0xfb,
    LENENC_2BYTE     = 0xfc,
    LENENC_3BYTE     = 0xfd,
    LENENC_8BYTE     = 0xfe,
};

/**
 * @class BinaryCodec
 *
 * Reads and writes the variable-width values of the MySQL client/server protocol
 * over a ByteCursor: length-encoded integers and strings, fixed-length strings,
 * NUL-terminated strings, 3-byte integers and the packet length header.
 *
 * Every read either consumes all the bytes of the value or throws before consuming
 * anything. Every write stages its bytes first, so a failure leaves the cursor untouched.
 * The only exception is an unknown length marker, which is consumed before
 * UnknownLengthEncoding is thrown.
 */
class BinaryCodec
{
public:
    /** Value returned by read_binary_length() for the NULL marker. */
    static constexpr int64_t NULL_LENGTH = -1;

    /**
     * Constructor
     *
     * @param cursor           The cursor to read from and write to. Must outlive the codec.
     * @param max_packet_size  Largest payload accepted by write_packet_length().
     */
    explicit BinaryCodec(ByteCursor& cursor, uint32_t max_packet_size = MYSQL_PACKET_LENGTH_MAX);

    ByteCursor& cursor() const
    {
        return m_cursor;
    }

    /**
     * Read a length-encoded integer.
     *
     * @return The value, or NULL_LENGTH if the marker was the NULL marker. A value
     *         of 2^63 or more written with the 8-byte form is returned as negative.
     *
     * @throws UnknownLengthEncoding, BufferUnderrun
     */
    int64_t read_binary_length();

    /**
     * Write a length-encoded integer in its shortest form.
     *
     * @throws InvalidLength if @c length is negative.
     */
    void write_length(int64_t length);

    // Writes the NULL marker.
    void write_null();

    std::string read_fixed_string(int64_t length, const Charset& charset);

    /**
     * Read a length-encoded string.
     *
     * @throws InvalidLength if the length is NULL.
     */
    std::string read_length_encoded_string(const Charset& charset);

    // As above but returns an empty optional for a NULL length.
    std::optional<std::string> read_nullable_length_encoded_string(const Charset& charset);

    void write_length_encoded_string(const std::string& value, const Charset& charset);

    std::string read_cstring(const Charset& charset);
    std::string read_until_eof(const Charset& charset);
    void        write_cstring(const std::string& value, const Charset& charset);

    /**
     * Read a 3-byte little-endian integer, sign-extending it if bit 23 is set.
     */
    int32_t read_3byte_int();

    /**
     * Write the low 24 bits of @c value as a 3-byte little-endian integer.
     */
    void write_long_int(int64_t value);

    /**
     * Fill in the packet header reserved at offset 0 of the cursor.
     *
     * @see wiresql::write_packet_length
     */
    void write_packet_length(uint8_t sequence = 0);

private:
    size_t      peek_length(size_t offset, int64_t* value) const;
    std::string peek_string(size_t offset, size_t length, const Charset& charset) const;

    ByteCursor& m_cursor;
    uint32_t    m_max_packet_size;
};

/**
 * @return Number of bytes write_length() uses for @c length.
 */
size_t length_encoded_size(uint64_t length);
}
