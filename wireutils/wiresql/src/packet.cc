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

#include <wiresql/packet.hh>
#include <wirebase/assert.hh>
#include <wiresql/cursor.hh>
#include <wiresql/error.hh>

#include <algorithm>

namespace wiresql
{

void set_byte2(uint8_t* buffer, uint16_t val)
{
    buffer[0] = val;
    buffer[1] = val >> 8;
}

void set_byte3(uint8_t* buffer, uint32_t val)
{
    buffer[0] = val;
    buffer[1] = val >> 8;
    buffer[2] = val >> 16;
}

void set_byte8(uint8_t* buffer, uint64_t val)
{
    for (int i = 0; i < 8; i++)
    {
        buffer[i] = val >> (8 * i);
    }
}

uint16_t get_byte2(const uint8_t* buffer)
{
    return (uint16_t)buffer[0] | ((uint16_t)buffer[1] << 8);
}

uint32_t get_byte3(const uint8_t* buffer)
{
    return (uint32_t)buffer[0] | ((uint32_t)buffer[1] << 8) | ((uint32_t)buffer[2] << 16);
}

uint64_t get_byte8(const uint8_t* buffer)
{
    uint64_t rval = 0;

    for (int i = 7; i >= 0; i--)
    {
        rval = (rval << 8) | buffer[i];
    }

    return rval;
}

HeaderData get_header(const uint8_t* buffer)
{
    HeaderData rval;
    rval.pl_length = get_byte3(buffer);
    rval.seq = buffer[3];
    return rval;
}

uint8_t* write_header(uint8_t* buffer, uint32_t pl_size, uint8_t seq)
{
    wxb_assert(pl_size <= MYSQL_PACKET_LENGTH_MAX);
    set_byte3(buffer, pl_size);
    buffer += 3;
    *buffer++ = seq;
    return buffer;
}

HeaderData read_header(ByteCursor& cursor)
{
    uint8_t header[MYSQL_HEADER_LEN];
    cursor.read_bytes(header, sizeof(header));
    return get_header(header);
}

void write_packet_length(ByteCursor& cursor, uint8_t seq, uint32_t max_payload)
{
    size_t end = cursor.writer_index();

    if (end < MYSQL_HEADER_LEN)
    {
        WXB_THROW(BufferUnderrun, "Packet of " << end << " bytes has no room for the "
                                               << MYSQL_HEADER_LEN << "-byte header");
    }

    size_t payload = end - MYSQL_HEADER_LEN;
    uint32_t limit = std::min<uint32_t>(max_payload, MYSQL_PACKET_LENGTH_MAX);

    if (payload > limit)
    {
        WXB_THROW(PacketTooLarge, "Packet payload of " << payload << " bytes exceeds the maximum of "
                                                       << limit << " bytes");
    }

    uint8_t header[MYSQL_HEADER_LEN];
    write_header(header, payload, seq);

    for (size_t i = 0; i < MYSQL_HEADER_LEN; i++)
    {
        cursor.set_byte(i, header[i]);
    }
}
}
