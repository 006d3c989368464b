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
#include <memory>
#include <vector>
#include <wirebase/log.hh>
#include <wiresql/buffer.hh>
#include <wiresql/codec.hh>
#include <wiresql/encoder.hh>
#include <wiresql/error.hh>

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

void test_string_encoder()
{
    printf("Testing the string encoder\n");
    std::unique_ptr<BinaryEncoder> encoder(new StringEncoder(Charset::utf8mb4()));
    TEST(encoder->encodes_to() == FIELD_TYPE_VARCHAR);
    TEST(encoder->encodes_to() == 15);

    Buffer buffer;
    encoder->encode("abc", buffer);
    encoder->encode("", buffer);
    TEST(Bytes(buffer.data(), buffer.data() + buffer.length()) == Bytes({3, 'a', 'b', 'c', 0}));

    BinaryCodec codec(buffer);
    TEST(codec.read_length_encoded_string(Charset::utf8mb4()) == "abc");
    TEST(codec.read_length_encoded_string(Charset::utf8mb4()) == "");
}

void test_encoder_charset()
{
    printf("Testing the string encoder charset\n");
    StringEncoder encoder(Charset("latin1"));
    TEST(encoder.charset().name() == "latin1");

    Buffer buffer = Buffer::packet_buffer();
    encoder.encode("\xc3\xa9t\xc3\xa9", buffer);
    TEST(buffer.length() == 4);
    TEST(buffer[0] == 3 && buffer[1] == 0xe9 && buffer[2] == 't' && buffer[3] == 0xe9);

    BinaryCodec(buffer).write_packet_length(0);
    TEST(buffer.get_byte(0) == 4);

    bool caught = false;
    size_t before = buffer.writer_index();
    try
    {
        encoder.encode("\xe6\x97\xa5", buffer);
    }
    catch (const CharsetError&)
    {
        caught = true;
    }
    TEST(caught);
    TEST(buffer.writer_index() == before);
}
}

int main(int argc, char* argv[])
{
    wxb::Log log(WXB_LOG_TARGET_STDOUT);

    test_string_encoder();
    test_encoder_charset();

    return fails;
}
