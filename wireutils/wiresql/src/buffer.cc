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

#include <wiresql/buffer.hh>

#include <algorithm>
#include <cstring>
#include <wirebase/assert.hh>
#include <wiresql/error.hh>
#include <wiresql/packet.hh>

namespace
{
const size_t MIN_ALLOCATION = 64;
}

namespace wiresql
{

Buffer::Buffer(size_t capacity)
{
    if (capacity > 0)
    {
        m_data.reset(new uint8_t[capacity]);
        m_capacity = capacity;
    }
}

Buffer::Buffer(const uint8_t* data, size_t datasize)
    : Buffer(datasize)
{
    append(data, datasize);
}

Buffer::Buffer(Buffer&& rhs) noexcept
    : m_data(std::move(rhs.m_data))
    , m_capacity(rhs.m_capacity)
    , m_reader(rhs.m_reader)
    , m_writer(rhs.m_writer)
{
    rhs.m_capacity = rhs.m_reader = rhs.m_writer = 0;
}

Buffer& Buffer::operator=(Buffer&& rhs) noexcept
{
    if (this != &rhs)
    {
        m_data = std::move(rhs.m_data);
        m_capacity = rhs.m_capacity;
        m_reader = rhs.m_reader;
        m_writer = rhs.m_writer;
        rhs.m_capacity = rhs.m_reader = rhs.m_writer = 0;
    }

    return *this;
}

// static
Buffer Buffer::packet_buffer(size_t payload_capacity)
{
    Buffer buffer(MYSQL_HEADER_LEN + payload_capacity);
    const uint8_t header[MYSQL_HEADER_LEN] = {};
    buffer.append(header, sizeof(header));
    buffer.consume(MYSQL_HEADER_LEN);
    return buffer;
}

size_t Buffer::copy_data(size_t index, size_t n_bytes, uint8_t* dst) const
{
    size_t copied_bytes = 0;

    if (index < m_writer)
    {
        copied_bytes = std::min(m_writer - index, n_bytes);
        memcpy(dst, m_data.get() + index, copied_bytes);
    }

    return copied_bytes;
}

void Buffer::skip_bytes(size_t n_bytes)
{
    consume(n_bytes);
}

void Buffer::write_bytes(const uint8_t* src, size_t n_bytes)
{
    if (n_bytes > 0)
    {
        const uint8_t* pStart = m_data.get();

        if (pStart && src >= pStart && src < pStart + m_capacity)
        {
            // The source is in this buffer, and growing would free it.
            size_t offset = src - pStart;
            auto [ptr, _1] = prepare_to_write(n_bytes);
            memmove(ptr, m_data.get() + offset, n_bytes);
        }
        else
        {
            auto [ptr, _1] = prepare_to_write(n_bytes);
            memcpy(ptr, src, n_bytes);
        }

        write_complete(n_bytes);
    }
}

uint8_t Buffer::get_byte(size_t index) const
{
    if (index >= m_writer)
    {
        WXB_THROW(BufferUnderrun, "Offset " << index << " is beyond the " << m_writer << " written bytes");
    }

    return m_data[index];
}

void Buffer::set_byte(size_t index, uint8_t value)
{
    if (index >= m_writer)
    {
        WXB_THROW(BufferUnderrun, "Offset " << index << " is beyond the " << m_writer << " written bytes");
    }

    m_data[index] = value;
}

std::tuple<uint8_t*, size_t> Buffer::prepare_to_write(size_t n_bytes)
{
    if (m_capacity - m_writer < n_bytes)
    {
        // The indexes are absolute, so the written bytes keep their offsets in the new storage.
        size_t new_capacity = std::max({m_writer + n_bytes, 2 * m_capacity, MIN_ALLOCATION});
        std::unique_ptr<uint8_t[]> new_data(new uint8_t[new_capacity]);

        if (m_writer > 0)
        {
            memcpy(new_data.get(), m_data.get(), m_writer);
        }

        m_data = std::move(new_data);
        m_capacity = new_capacity;
    }

    return {m_data.get() + m_writer, m_capacity - m_writer};
}

void Buffer::write_complete(size_t n_bytes)
{
    m_writer += n_bytes;
    wxb_assert(m_writer <= m_capacity);
}

const uint8_t* Buffer::consume(size_t n_bytes)
{
    if (n_bytes > length())
    {
        WXB_THROW(BufferUnderrun, "Cannot consume " << n_bytes << " bytes, only " << length()
                                                    << " readable");
    }

    m_reader += n_bytes;
    return data();
}

int Buffer::compare(const Buffer& rhs) const
{
    size_t llen = length();
    size_t rlen = rhs.length();

    return (llen == rlen) ? (llen ? memcmp(data(), rhs.data(), llen) : 0) : ((llen > rlen) ? 1 : -1);
}

const uint8_t& Buffer::operator[](size_t ind) const
{
    wxb_assert(m_reader + ind < m_writer);
    return m_data[m_reader + ind];
}

void Buffer::reset()
{
    m_reader = 0;
    m_writer = 0;
}

void Buffer::clear()
{
    m_data.reset();
    m_capacity = 0;
    m_reader = 0;
    m_writer = 0;
}
}
