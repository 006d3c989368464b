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
#include <memory>
#include <tuple>
#include <vector>
#include <wiresql/cursor.hh>

namespace wiresql
{

/**
 * A growable byte buffer with independent reader and writer indexes.
 *
 * The indexes are absolute offsets from the start of the storage and stay valid
 * when the storage grows, so a header reserved at offset 0 can be filled in after
 * the payload has been written.
 */
class Buffer final : public ByteCursor
{
public:
    using ByteCursor::write_bytes;

    /**
     * Create an empty buffer.
     *
     * @param capacity  Bytes to allocate up front
     */
    explicit Buffer(size_t capacity = 0);

    /**
     * Create a buffer with the given data. The contents are copied and are all readable.
     *
     * @param data      Pointer to data
     * @param datasize  Size of the data
     */
    Buffer(const uint8_t* data, size_t datasize);

    explicit Buffer(const std::vector<uint8_t>& data)
        : Buffer(data.data(), data.size())
    {
    }

    Buffer(Buffer&& rhs) noexcept;
    Buffer& operator=(Buffer&& rhs) noexcept;

    /**
     * Create a buffer for one MySQL packet. The header bytes are reserved and zeroed, and
     * the payload is written after them. The header is filled in with write_packet_length().
     *
     * @param payload_capacity  Payload bytes to allocate up front
     *
     * @return The buffer, with both indexes at MYSQL_HEADER_LEN
     */
    static Buffer packet_buffer(size_t payload_capacity = 0);

    size_t reader_index() const override
    {
        return m_reader;
    }

    size_t writer_index() const override
    {
        return m_writer;
    }

    size_t  copy_data(size_t index, size_t n_bytes, uint8_t* dst) const override;
    void    skip_bytes(size_t n_bytes) override;
    void    write_bytes(const uint8_t* src, size_t n_bytes) override;
    uint8_t get_byte(size_t index) const override;
    void    set_byte(size_t index, uint8_t value) override;

    /**
     * @return Pointer to the first readable byte
     */
    const uint8_t* data() const
    {
        return m_data.get() + m_reader;
    }

    /**
     * @return Number of readable bytes
     */
    size_t length() const
    {
        return m_writer - m_reader;
    }

    bool empty() const
    {
        return m_writer == m_reader;
    }

    size_t capacity() const
    {
        return m_capacity;
    }

    /**
     * Prepare the buffer for writing. Reserves more space if needed. write_complete should be
     * called once the write is ready.
     *
     * @param n_bytes  How many bytes may be written
     *
     * @return Pointer to the start of the write and the space available
     */
    std::tuple<uint8_t*, size_t> prepare_to_write(size_t n_bytes);

    /**
     * Tell the buffer that the write is complete. Advances the writer index. Writing more than
     * there is space for is an error.
     *
     * @param n_bytes  How much to advance the index
     */
    void write_complete(size_t n_bytes);

    void append(const uint8_t* new_data, size_t n_bytes)
    {
        write_bytes(new_data, n_bytes);
    }

    // Appends the readable bytes of another buffer.
    void append(const Buffer& buffer)
    {
        write_bytes(buffer.data(), buffer.length());
    }

    /**
     * Consume readable bytes.
     *
     * @param n_bytes  Number of bytes to consume
     *
     * @return Pointer to the next readable byte
     */
    const uint8_t* consume(size_t n_bytes);

    /**
     * Compare the readable contents of two buffers.
     *
     * @return Negative if this is shorter or sorts before @c rhs, 0 if equal, positive otherwise
     */
    int compare(const Buffer& rhs) const;

    // Readable byte at offset @c ind from the reader index.
    const uint8_t& operator[](size_t ind) const;

    // Moves both indexes to the start. The storage is kept.
    void reset();

    // Releases the storage.
    void clear();

private:
    std::unique_ptr<uint8_t[]> m_data;
    size_t                     m_capacity {0};
    size_t                     m_reader {0};
    size_t                     m_writer {0};
};
}
