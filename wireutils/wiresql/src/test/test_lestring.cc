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
#include <cstring>
#include <string>
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

Buffer from_text(const char* text)
{
    return Buffer(reinterpret_cast<const uint8_t*>(text), strlen(text));
}

void test_fixed_string()
{
    printf("Testing fixed-length strings\n");
    Charset utf8("UTF-8");
    Buffer buffer = from_text("hellothere");
    BinaryCodec codec(buffer);

    TEST(codec.read_fixed_string(5, utf8) == "hello");
    TEST(buffer.reader_index() == 5);
    TEST(codec.read_fixed_string(0, utf8) == "");
    TEST(buffer.reader_index() == 5);

    bool caught = false;
    try
    {
        codec.read_fixed_string(6, utf8);
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }
    test(caught, "Reading past the end should throw BufferUnderrun");
    test(buffer.reader_index() == 5, "A failed read should consume nothing");

    caught = false;
    try
    {
        codec.read_fixed_string(-1, utf8);
    }
    catch (const InvalidLength&)
    {
        caught = true;
    }
    test(caught, "A negative length should throw InvalidLength");

    TEST(codec.read_fixed_string(5, utf8) == "there");
    TEST(buffer.empty());
}

void test_length_encoded_string()
{
    printf("Testing length-encoded strings\n");
    Charset utf8 = Charset::utf8mb4();
    Buffer buffer;
    BinaryCodec codec(buffer);

    codec.write_length_encoded_string("sqlwire", utf8);
    TEST(written(buffer) == Bytes({7, 's', 'q', 'l', 'w', 'i', 'r', 'e'}));
    TEST(codec.read_length_encoded_string(utf8) == "sqlwire");
    TEST(buffer.empty());

    // "å" is two bytes in UTF-8.
    codec.write_length_encoded_string("\xc3\xa5", utf8);
    TEST(written(buffer) == Bytes({2, 0xc3, 0xa5}));
    TEST(codec.read_length_encoded_string(utf8) == "\xc3\xa5");

    std::string empty;
    codec.write_length_encoded_string(empty, utf8);
    TEST(written(buffer) == Bytes({0}));
    TEST(codec.read_length_encoded_string(utf8) == empty);

    std::string long_value(300, 'x');
    codec.write_length_encoded_string(long_value, utf8);
    TEST(buffer.length() == 303);
    TEST(buffer[0] == 0xfc && buffer[1] == 0x2c && buffer[2] == 0x01);
    TEST(codec.read_length_encoded_string(utf8) == long_value);

    std::string big_value(70000, 'y');
    codec.write_length_encoded_string(big_value, utf8);
    TEST(buffer[0] == 0xfd);
    TEST(codec.read_length_encoded_string(utf8) == big_value);
    TEST(buffer.empty());
}

void test_null_string()
{
    printf("Testing NULL strings\n");
    Charset utf8 = Charset::utf8mb4();
    Buffer buffer(Bytes({0xfb, 0x01, 'a'}));
    BinaryCodec codec(buffer);

    bool caught = false;
    try
    {
        codec.read_length_encoded_string(utf8);
    }
    catch (const InvalidLength&)
    {
        caught = true;
    }
    test(caught, "A NULL length should throw InvalidLength");
    test(buffer.reader_index() == 0, "A NULL length should not be consumed by a failed read");

    auto value = codec.read_nullable_length_encoded_string(utf8);
    TEST(!value);
    TEST(buffer.reader_index() == 1);

    value = codec.read_nullable_length_encoded_string(utf8);
    TEST(value && *value == "a");
    TEST(buffer.empty());
}

void test_truncated_string()
{
    printf("Testing truncated strings\n");
    Buffer buffer(Bytes({5, 'a', 'b'}));
    BinaryCodec codec(buffer);
    bool caught = false;

    try
    {
        codec.read_length_encoded_string(Charset::utf8mb4());
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }

    TEST(caught);
    test(buffer.reader_index() == 0, "The length of a truncated string should not be consumed");
}

void test_atomic_write()
{
    printf("Testing that failed writes write nothing\n");
    Charset ascii("ascii");
    Buffer buffer;
    BinaryCodec codec(buffer);
    codec.write_length_encoded_string("ok", ascii);
    size_t before = buffer.writer_index();

    bool caught = false;
    try
    {
        codec.write_length_encoded_string("f\xc3\xb6\xc3\xb6", ascii);
    }
    catch (const CharsetError&)
    {
        caught = true;
    }
    test(caught, "Non-ASCII text should not be encodable as ASCII");
    test(buffer.writer_index() == before, "A failed write should leave the writer index unchanged");

    caught = false;
    try
    {
        // Not valid UTF-8.
        codec.write_length_encoded_string("\xff\xfe", Charset::utf8mb4());
    }
    catch (const CharsetError&)
    {
        caught = true;
    }
    TEST(caught);
    TEST(buffer.writer_index() == before);
}

void test_invalid_bytes()
{
    printf("Testing undecodable bytes\n");
    Buffer buffer(Bytes({2, 0xc3, 0x28}));
    BinaryCodec codec(buffer);
    bool caught = false;

    try
    {
        codec.read_length_encoded_string(Charset::utf8mb4());
    }
    catch (const CharsetError&)
    {
        caught = true;
    }

    TEST(caught);
    TEST(buffer.reader_index() == 0);

    // The same bytes are fine as binary.
    TEST(codec.read_length_encoded_string(Charset::binary()) == "\xc3\x28");
}

void test_cstring()
{
    printf("Testing NUL-terminated strings\n");
    Charset utf8 = Charset::utf8mb4();
    Buffer buffer;
    BinaryCodec codec(buffer);

    codec.write_cstring("root", utf8);
    codec.write_cstring("", utf8);
    TEST(written(buffer) == Bytes({'r', 'o', 'o', 't', 0, 0}));

    TEST(codec.read_cstring(utf8) == "root");
    TEST(buffer.reader_index() == 5);
    TEST(codec.read_cstring(utf8) == "");
    TEST(buffer.empty());

    buffer.append(reinterpret_cast<const uint8_t*>("abc"), 3);
    bool caught = false;
    try
    {
        codec.read_cstring(utf8);
    }
    catch (const BufferUnderrun&)
    {
        caught = true;
    }
    test(caught, "A string without a terminator should throw BufferUnderrun");
    TEST(buffer.length() == 3);

    TEST(codec.read_until_eof(utf8) == "abc");
    TEST(buffer.empty());
    TEST(codec.read_until_eof(utf8) == "");

    caught = false;
    size_t before = buffer.writer_index();
    try
    {
        codec.write_cstring(std::string("a\0b", 3), utf8);
    }
    catch (const CodecError&)
    {
        caught = true;
    }
    test(caught, "A C-string value with a NUL byte should be rejected");
    TEST(buffer.writer_index() == before);
}
}

int main(int argc, char* argv[])
{
    wxb::Log log(WXB_LOG_TARGET_STDOUT);

    test_fixed_string();
    test_length_encoded_string();
    test_null_string();
    test_truncated_string();
    test_atomic_write();
    test_invalid_bytes();
    test_cstring();

    return fails;
}
