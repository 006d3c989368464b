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

#define WXB_MODULE_NAME "lenenc"

#include "commands.hh"

#include <vector>
#include <wirebase/hexdump.hh>
#include <wirebase/log.hh>
#include <wirebase/string.hh>
#include <wiresql/buffer.hh>
#include <wiresql/codec.hh>
#include <wiresql/error.hh>

using std::endl;
using std::string;

namespace
{

string written_hex(const wxq::Buffer& buffer)
{
    return wxb::to_hex(buffer.data(), buffer.length());
}

bool to_buffer(const string& hex, wxq::Buffer* pBuffer)
{
    std::vector<uint8_t> bytes;

    if (!wxb::from_hex(hex, &bytes))
    {
        WXB_ERROR("'%s' is not a hexadecimal byte string.", hex.c_str());
        return false;
    }

    pBuffer->append(bytes.data(), bytes.size());
    return true;
}

void warn_trailing(const wxq::Buffer& buffer)
{
    if (!buffer.empty())
    {
        WXB_WARNING("%zu trailing bytes were ignored.", buffer.length());
    }
}

lenenc::ExitCode run(const wxq::CodecConfig& config, uint8_t seq,
                     const string& command, const string& arg, std::ostream& out)
{
    wxq::Charset charset = config.charset();
    wxq::Buffer buffer;
    wxq::BinaryCodec codec(buffer, config.max_packet_size());

    if (command == "int")
    {
        long value;

        if (!wxb::get_long(arg, &value))
        {
            WXB_ERROR("'%s' is not an integer.", arg.c_str());
            return lenenc::EXIT_USAGE;
        }

        codec.write_length(value);
        out << written_hex(buffer) << endl;
    }
    else if (command == "str")
    {
        codec.write_length_encoded_string(arg, charset);
        out << written_hex(buffer) << endl;
    }
    else if (command == "packet")
    {
        wxq::Buffer packet = wxq::Buffer::packet_buffer(arg.length());
        wxq::BinaryCodec packet_codec(packet, config.max_packet_size());

        packet_codec.write_length_encoded_string(arg, charset);
        packet_codec.write_packet_length(seq);

        std::vector<uint8_t> bytes(packet.writer_index());
        packet.copy_data(0, bytes.size(), bytes.data());
        wxb::hexdump(out, bytes.data(), bytes.size());
    }
    else if (command == "decode-int")
    {
        if (!to_buffer(arg, &buffer))
        {
            return lenenc::EXIT_USAGE;
        }

        int64_t value = codec.read_binary_length();

        if (value == wxq::BinaryCodec::NULL_LENGTH)
        {
            out << "NULL" << endl;
        }
        else
        {
            out << value << endl;
        }

        warn_trailing(buffer);
    }
    else if (command == "decode-str")
    {
        if (!to_buffer(arg, &buffer))
        {
            return lenenc::EXIT_USAGE;
        }

        auto value = codec.read_nullable_length_encoded_string(charset);
        out << (value ? *value : "NULL") << endl;
        warn_trailing(buffer);
    }
    else
    {
        WXB_ERROR("Unknown command '%s'.", command.c_str());
        return lenenc::EXIT_USAGE;
    }

    return lenenc::EXIT_OK;
}
}

namespace lenenc
{

ExitCode run_command(const wxq::CodecConfig& config, uint8_t seq,
                     const string& command, const string& arg, std::ostream& out)
{
    wxb::LogScope scope(command.c_str());
    ExitCode rc = EXIT_CODEC;

    try
    {
        rc = run(config, seq, command, arg, out);
    }
    catch (const wxq::CodecError& e)
    {
        WXB_ERROR("%s", e.what());
    }

    return rc;
}
}
