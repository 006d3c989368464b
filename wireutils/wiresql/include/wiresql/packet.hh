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

/** Length of the MySQL packet header */
#define MYSQL_HEADER_LEN 4

/** Maximum length of a MySQL packet payload */
#define MYSQL_PACKET_LENGTH_MAX 0x00ffffff

namespace wiresql
{
class ByteCursor;

/**
 * Protocol packing and unpacking functions. The functions read or write unsigned integers from/to
 * MySQL-protocol buffers. MySQL saves integers in lsb-first format, so a conversion to host format
 * may be required.
 */

void     set_byte2(uint8_t* buffer, uint16_t val);
void     set_byte3(uint8_t* buffer, uint32_t val);
void     set_byte8(uint8_t* buffer, uint64_t val);
uint16_t get_byte2(const uint8_t* buffer);
uint32_t get_byte3(const uint8_t* buffer);
uint64_t get_byte8(const uint8_t* buffer);

struct HeaderData
{
    uint32_t pl_length {0};
    uint8_t  seq {0};
};
HeaderData get_header(const uint8_t* buffer);

/**
 * Write MySQL-header to buffer.
 *
 * @param buffer Destination buffer
 * @param pl_size Payload size, max 2^24 - 1
 * @param seq Sequence number
 * @return Pointer to next byte
 */
uint8_t* write_header(uint8_t* buffer, uint32_t pl_size, uint8_t seq);

/**
 * Read a packet header, consuming it.
 *
 * @param cursor  Cursor positioned at a header
 *
 * @return The payload length and the sequence number
 */
HeaderData read_header(ByteCursor& cursor);

/**
 * Finalize a packet whose header bytes were reserved at offset 0 of the cursor.
 *
 * The payload length is everything written after the header. The length and the sequence
 * number are written into the reserved bytes; the writer index is not moved.
 *
 * @param cursor       The packet
 * @param seq          Sequence number
 * @param max_payload  Largest accepted payload, at most MYSQL_PACKET_LENGTH_MAX
 *
 * @throws BufferUnderrun if the header was not reserved, PacketTooLarge if the payload
 *         exceeds @c max_payload.
 */
void write_packet_length(ByteCursor& cursor, uint8_t seq = 0, uint32_t max_payload = MYSQL_PACKET_LENGTH_MAX);
}
