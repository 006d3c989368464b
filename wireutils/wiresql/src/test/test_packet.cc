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

// To ensure that wxb_assert asserts also when building in non-debug mode.
#if !defined (SS_DEBUG)
#define SS_DEBUG
#endif
#if defined (NDEBUG)
#undef NDEBUG
#endif
#include <cstdio>
#include <vector>
#include <wirebase/log.hh>
#include <wiresql/buffer.hh>
#include <wiresql/codec.hh>
#include <wiresql/error.hh>
#include <wiresql/packet.hh>

using namespace wiresql;
using Bytes = std::vector<uint8_t>;

namespace
{
int fails = 0;

void test(bool result, int line)
{
    if (!result)
    {
        fails++;
        printf("Test failure on line %i\n", line);
    }
}

#define TEST(t) test(t, __LINE__)

Bytes header_of(const Buffer& buffer)
{
    Bytes rval(MYSQL_HEADER_LEN);
    buffer.copy_data(0, MYSQL_HEADER_LEN, rval.data());
    return rval;
}

void test_byte_packing()
{
    printf("Testing byte packing\n");
    uint8_t data[8];

    set_byte2(data, 0x0102);
    TEST(data[0] == 0x02 && data[1] == 0x01);
    TEST(get_byte2(data) == 0x0102);

    set_byte3(data, 0x010203);
    TEST(data[0] == 0x03 && data[1] == 0x02 && data[2] == 0x01);
    TEST(get_byte3(data) == 0x010203);

    set_byte8(data, 0x0102030405060708ULL);
    TEST(data[0] == 0x08 && data[7] == 0x01);
    TEST(get_byte8(data) == 0x0102030405060708ULL);

    uint8_t header[MYSQL_HEADER_LEN];
    TEST(write_header(header, 0x123456, 7) == header + MYSQL_HEADER_LEN);
    auto hd = get_header(header);
    TEST(hd.pl_length == 0x123456);
    TEST(hd.seq == 7);
}

void test_packet_length()
{
    printf("Testing packet length\n");
    Buffer buffer = Buffer::packet_buffer();
    TEST(buffer.writer_index() == MYSQL_HEADER_LEN);
    TEST(buffer.reader_index() == MYSQL_HEADER_LEN);

    BinaryCodec codec(buffer);
    codec.write_length_encoded_string("hello", Charset::utf8mb4());
    size_t writer = buffer.writer_index();

    codec.write_packet_length(3);
    TEST(header_of(buffer) == Bytes({6, 0, 0, 3}));
    TEST(buffer.writer_index() == writer);

    // The default sequence is 0 and the header can be rewritten.
    codec.write_packet_length();
    TEST(header_of(buffer) == Bytes({6, 0, 0, 0}));

    // A payload longer than 255 bytes uses all three length bytes.
    Buffer big = Buffer::packet_buffer();
    Bytes payload(0x010203, 'x');
    big.write_bytes(payload);
    write_packet_length(big, 1);
    TEST(header_of(big) == Bytes({0x03, 0x02, 0x01, 1}));

    Buffer read(header_of(big));
    auto hd = read_header(read);
    TEST(hd.pl_length == 0x010203);
    TEST(hd.seq == 1);
    TEST(read.empty());

    // An empty payload.
    Buffer empty = Buffer::packet_buffer();
    write_packet_length(empty, 9);
    TEST(header_of(empty) == Bytes({0, 0, 0, 9}));
}

void test_packet_errors()
{
    printf("Testing packet errors\n");
    Buffer no_header(Bytes({1, 2}));
    bool caught = false;

    try
    {
        write_packet_length(no_header, 0);
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }
    TEST(caught);

    Buffer buffer = Buffer::packet_buffer();
    buffer.write_bytes(Bytes(100, 'a'));

    caught = false;
    try
    {
        BinaryCodec(buffer, 99).write_packet_length(0);
    }
    catch (const PacketTooLarge&)
    {
        caught = true;
    }
    TEST(caught);
    TEST(header_of(buffer) == Bytes({0, 0, 0, 0}));

    BinaryCodec(buffer, 100).write_packet_length(0);
    TEST(header_of(buffer) == Bytes({100, 0, 0, 0}));

    Buffer huge = Buffer::packet_buffer();
    huge.write_bytes(Bytes(MYSQL_PACKET_LENGTH_MAX + 1, 0));
    caught = false;
    try
    {
        write_packet_length(huge, 0);
    }
    catch (const PacketTooLarge&)
    {
        caught = true;
    }
    TEST(caught);

    Buffer short_header(Bytes({1, 2, 3}));
    caught = false;
    try
    {
        read_header(short_header);
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }
    TEST(caught);
    TEST(short_header.reader_index() == 0);
}
}

int main(int argc, char* argv[])
{
    wxb::Log log(WXB_LOG_TARGET_STDOUT);

    test_byte_packing();
    test_packet_length();
    test_packet_errors();

    return fails;
}
