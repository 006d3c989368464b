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
#include <vector>

namespace wiresql
{

/**
 * @class ByteCursor
 *
 * A byte buffer with independent reader and writer positions. Bytes between the
 * reader index and the writer index are readable; writing appends at the writer index.
 *
 * All multi-byte integers are little-endian, as on the MySQL wire. Reads either
 * consume all the bytes they need or throw BufferUnderrun without consuming anything.
 */
class ByteCursor
{
public:
    virtual ~ByteCursor() = default;

    /**
     * @return Absolute offset of the next byte to read.
     */
    virtual size_t reader_index() const = 0;

    /**
     * @return Absolute offset of the next byte to write.
     */
    virtual size_t writer_index() const = 0;

    /**
     * Copy bytes without consuming them. Copies less than requested if the writer
     * index is reached first.
     *
     * @param index    Absolute offset of the first byte to copy
     * @param n_bytes  Number of bytes to copy
     * @param dst      Destination
     *
     * @return Number of bytes copied
     */
    virtual size_t copy_data(size_t index, size_t n_bytes, uint8_t* dst) const = 0;

    /**
     * Advance the reader index.
     *
     * @param n_bytes  Number of bytes to skip, at most readable_bytes()
     */
    virtual void skip_bytes(size_t n_bytes) = 0;

    /**
     * Append bytes at the writer index, growing the storage if needed.
     */
    virtual void write_bytes(const uint8_t* src, size_t n_bytes) = 0;

    /**
     * Absolute access to a written byte. The reader and writer indexes are not moved.
     *
     * @param index  Offset below writer_index()
     */
    virtual uint8_t get_byte(size_t index) const = 0;
    virtual void    set_byte(size_t index, uint8_t value) = 0;

    size_t readable_bytes() const
    {
        return writer_index() - reader_index();
    }

    void                 read_bytes(uint8_t* dst, size_t n_bytes);
    std::vector<uint8_t> read_bytes(size_t n_bytes);
    uint8_t              read_byte();
    uint16_t             read_unsigned_short();
    int64_t              read_long();

    void write_bytes(const std::vector<uint8_t>& bytes)
    {
        write_bytes(bytes.data(), bytes.size());
    }

    void write_byte(uint8_t value);
    void write_short(uint16_t value);
    void write_long(int64_t value);

protected:
    ByteCursor() = default;
    ByteCursor(const ByteCursor&) = default;
    ByteCursor& operator=(const ByteCursor&) = default;
};
}
