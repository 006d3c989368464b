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

#include <wiresql/cursor.hh>
#include <wiresql/error.hh>
#include <wiresql/packet.hh>

namespace wiresql
{

void ByteCursor::read_bytes(uint8_t* dst, size_t n_bytes)
{
    size_t readable = readable_bytes();

    if (n_bytes > readable)
    {
        WXB_THROW(BufferUnderrun, "Cannot read " << n_bytes << " bytes at offset " << reader_index()
                                                 << ", only " << readable << " readable");
    }

    copy_data(reader_index(), n_bytes, dst);
    skip_bytes(n_bytes);
}

std::vector<uint8_t> ByteCursor::read_bytes(size_t n_bytes)
{
    std::vector<uint8_t> rval(n_bytes);
    read_bytes(rval.data(), n_bytes);
    return rval;
}

uint8_t ByteCursor::read_byte()
{
    uint8_t value;
    read_bytes(&value, 1);
    return value;
}

uint16_t ByteCursor::read_unsigned_short()
{
    uint8_t data[2];
    read_bytes(data, sizeof(data));
    return get_byte2(data);
}

int64_t ByteCursor::read_long()
{
    uint8_t data[8];
    read_bytes(data, sizeof(data));
    return get_byte8(data);
}

void ByteCursor::write_byte(uint8_t value)
{
    write_bytes(&value, 1);
}

void ByteCursor::write_short(uint16_t value)
{
    uint8_t data[2];
    set_byte2(data, value);
    write_bytes(data, sizeof(data));
}

void ByteCursor::write_long(int64_t value)
{
    uint8_t data[8];
    set_byte8(data, value);
    write_bytes(data, sizeof(data));
}
}
