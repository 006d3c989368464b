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

using namespace wiresql;
using Bytes = std::vector<uint8_t>;

namespace
{
int fails = 0;

void test(bool result, const char* msg)
{
    if (!result)
    {
        fails++;
        printf("%s\n", msg);
    }
}

void test(bool result, int line)
{
    if (!result)
    {
        fails++;
        printf("Test failure on line %i\n", line);
    }
}

#define TEST(t) test(t, __LINE__)

Bytes written(const Buffer& buffer)
{
    return Bytes(buffer.data(), buffer.data() + buffer.length());
}

Bytes encode(int64_t value)
{
    Buffer buffer;
    BinaryCodec(buffer).write_length(value);
    return written(buffer);
}

int64_t decode(const Bytes& bytes, size_t* consumed = nullptr)
{
    Buffer buffer(bytes);
    int64_t rval = BinaryCodec(buffer).read_binary_length();

    if (consumed)
    {
        *consumed = buffer.reader_index();
    }

    return rval;
}

void test_widths()
{
    printf("Testing encoded widths\n");

    TEST(encode(0) == Bytes({0x00}));
    TEST(encode(250) == Bytes({0xfa}));
    TEST(encode(251) == Bytes({0xfc, 0xfb, 0x00}));
    TEST(encode(300) == Bytes({0xfc, 0x2c, 0x01}));
    TEST(encode(65535) == Bytes({0xfc, 0xff, 0xff}));
    TEST(encode(65536) == Bytes({0xfd, 0x00, 0x00, 0x01}));
    TEST(encode(16777215) == Bytes({0xfd, 0xff, 0xff, 0xff}));
    TEST(encode(16777216) == Bytes({0xfe, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));
    TEST(encode(INT64_MAX) == Bytes({0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f}));

    TEST(length_encoded_size(250) == 1);
    TEST(length_encoded_size(251) == 3);
    TEST(length_encoded_size(65536) == 4);
    TEST(length_encoded_size(16777216) == 9);
}

void test_round_trip()
{
    printf("Testing round trips\n");
    const int64_t values[] =
    {
        0, 1, 250, 251, 252, 255, 256, 65535, 65536, 0x7fffff, 0x800000, 16777215, 16777216,
        0xffffffffLL, 0x100000000LL, INT64_MAX
    };

    for (auto value : values)
    {
        size_t consumed = 0;
        Bytes bytes = encode(value);

        if (decode(bytes, &consumed) != value || consumed != bytes.size())
        {
            printf("Value %ld did not survive a round trip.\n", value);
            fails++;
        }
    }

    // Several values written back to back are read back in order.
    Buffer buffer;
    BinaryCodec codec(buffer);
    for (auto value : values)
    {
        codec.write_length(value);
    }

    for (auto value : values)
    {
        TEST(codec.read_binary_length() == value);
    }
    TEST(buffer.empty());
}

void test_null()
{
    printf("Testing the NULL marker\n");
    size_t consumed = 0;

    TEST(decode({0xfb, 0x01, 0x02, 0x03}, &consumed) == BinaryCodec::NULL_LENGTH);
    test(consumed == 1, "NULL marker should consume exactly one byte");

    Buffer buffer;
    BinaryCodec codec(buffer);
    codec.write_null();
    TEST(written(buffer) == Bytes({0xfb}));

    bool caught = false;
    try
    {
        codec.write_length(BinaryCodec::NULL_LENGTH);
    }
    catch (const InvalidLength&)
    {
        caught = true;
    }
    test(caught, "Writing a negative length should throw InvalidLength");
    test(buffer.writer_index() == 1, "A rejected length should write nothing");
}

void test_unknown_marker()
{
    printf("Testing unknown markers\n");
    Buffer buffer(Bytes({0xff, 0x01, 0x02}));
    bool caught = false;

    try
    {
        BinaryCodec(buffer).read_binary_length();
    }
    catch (const UnknownLengthEncoding& e)
    {
        caught = true;
        TEST(e.marker() == 255);
        TEST(e.code() == 255);
    }

    test(caught, "Marker 0xff should throw UnknownLengthEncoding");
    test(buffer.reader_index() == 1, "Only the marker should be consumed");

    // It is a CodecError as well.
    Buffer again(Bytes({0xff}));
    caught = false;
    try
    {
        BinaryCodec(again).read_binary_length();
    }
    catch (const CodecError&)
    {
        caught = true;
    }
    TEST(caught);
}

void test_underrun()
{
    printf("Testing short input\n");
    const Bytes short_inputs[] =
    {
        {},
        {0xfc, 0x01},
        {0xfd, 0x01, 0x02},
        {0xfe, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07},
    };

    for (const auto& bytes : short_inputs)
    {
        Buffer buffer(bytes);
        bool caught = false;

        try
        {
            BinaryCodec(buffer).read_binary_length();
        }
        catch (const BufferUnderrun&)
        {
            caught = true;
        }

        test(caught, "Short input should throw BufferUnderrun");
        test(buffer.reader_index() == 0, "Short input should not be consumed");
    }
}

void test_wide_values()
{
    printf("Testing the 3- and 8-byte forms\n");

    // The 3-byte form is unsigned.
    TEST(decode({0xfd, 0xff, 0xff, 0xff}) == 16777215);
    TEST(decode({0xfd, 0x00, 0x00, 0x80}) == 0x800000);

    // Values of 2^63 and above come back negative.
    TEST(decode({0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}) == -1);
    TEST(decode({0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80}) == INT64_MIN);
}

void test_3byte_int()
{
    printf("Testing 3-byte integers\n");
    Buffer buffer(Bytes({0xff, 0xff, 0xff, 0xff, 0xff, 0x7f, 0x00, 0x00, 0x80, 0x01, 0x02, 0x03}));
    BinaryCodec codec(buffer);

    TEST(codec.read_3byte_int() == -1);
    TEST(codec.read_3byte_int() == 8388607);
    TEST(codec.read_3byte_int() == -8388608);
    TEST(codec.read_3byte_int() == 0x030201);
    TEST(buffer.empty());

    Buffer out;
    BinaryCodec writer(out);
    writer.write_long_int(0x030201);
    writer.write_long_int(0x7f030201);      // Bits above 23 are dropped.
    writer.write_long_int(-1);
    TEST(written(out) == Bytes({0x01, 0x02, 0x03, 0x01, 0x02, 0x03, 0xff, 0xff, 0xff}));

    TEST(writer.read_3byte_int() == 0x030201);
    TEST(writer.read_3byte_int() == 0x030201);
    TEST(writer.read_3byte_int() == -1);

    Buffer two(Bytes({0x01, 0x02}));
    bool caught = false;
    try
    {
        BinaryCodec(two).read_3byte_int();
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }
    TEST(caught);
    TEST(two.reader_index() == 0);
}
}

int main(int argc, char* argv[])
{
    wxb::Log log(WXB_LOG_TARGET_STDOUT);

    test_widths();
    test_round_trip();
    test_null();
    test_unknown_marker();
    test_underrun();
    test_wide_values();
    test_3byte_int();

    return fails;
}
