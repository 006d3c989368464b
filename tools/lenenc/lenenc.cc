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

/**
 * @file lenenc.cc - Encode and decode MySQL length-encoded values from the command line
 */

#include <wiresql/ccdefs.hh>

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <wirebase/log.hh>
#include <wirebase/string.hh>
#include <wiresql/config.hh>

#include "commands.hh"

using lenenc::EXIT_USAGE;

namespace
{

struct option options[] =
{
    {"help",     no_argument,       nullptr, 'h'},
    {"config",   required_argument, nullptr, 'c'},
    {"charset",  required_argument, nullptr, 'C'},
    {"sequence", required_argument, nullptr, 's'},
    {"debug",    no_argument,       nullptr, 'd'},
    {nullptr,    0,                 nullptr, 0  }
};

void print_usage(const char* executable)
{
    const char msg[] =
        R"(Usage: %s [-h] [-c FILE] [-C CHARSET] [-s SEQ] [-d] COMMAND ARG

Encode and decode values of the MySQL client/server protocol.

  -h, --help             Display this help.
  -c, --config=FILE      Read settings from FILE.
  -C, --charset=CHARSET  Charset of the text (default: utf8mb4).
  -s, --sequence=SEQ     Sequence number of the packet (default: 0).
  -d, --debug            Enable debug logging.

Commands:
  int N           Print N as a length-encoded integer in hex.
  str TEXT        Print TEXT as a length-encoded string in hex.
  packet TEXT     Print a hexdump of a packet whose payload is TEXT as a
                  length-encoded string.
  decode-int HEX  Print the length-encoded integer in HEX.
  decode-str HEX  Print the length-encoded string in HEX.

Exit status is 0 on success, 1 on usage or configuration error and
2 if the value cannot be encoded or decoded.
)";

    printf(msg, executable);
}
}

int main(int argc, char** argv)
{
    std::ios::sync_with_stdio();

    wxq::CodecConfig config;
    const char* config_file = nullptr;
    const char* charset = nullptr;
    bool debug = false;
    long seq = 0;

    int c;
    while ((c = getopt_long(argc, argv, "hc:C:s:d", options, NULL)) != -1)
    {
        switch (c)
        {
        case 'h':
            print_usage(argv[0]);
            return EXIT_SUCCESS;

        case 'c':
            config_file = optarg;
            break;

        case 'C':
            charset = optarg;
            break;

        case 's':
            if (!wxb::get_long(optarg, &seq) || seq < 0 || seq > 255)
            {
                fprintf(stderr, "Invalid sequence number '%s', must be between 0 and 255.\n", optarg);
                return EXIT_USAGE;
            }
            break;

        case 'd':
            debug = true;
            break;

        default:
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (argc - optind != 2)
    {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // The log is not initialized yet, so these errors go to stderr.
    if ((config_file && !config.load(config_file)) || (charset && !config.set_charset(charset)))
    {
        return EXIT_USAGE;
    }

    if (debug)
    {
        config.set_log_debug(true);
    }

    std::unique_ptr<wxb::Log> sLog;

    try
    {
        const char* logdir = config.log_target() == WXB_LOG_TARGET_FS ? config.logdir().c_str() : nullptr;
        sLog.reset(new wxb::Log("lenenc", logdir, "lenenc.log", config.log_target()));
    }
    catch (const std::runtime_error& e)
    {
        fprintf(stderr, "%s\n", e.what());
        return EXIT_USAGE;
    }

    config.apply_log_settings();

    return lenenc::run_command(config, seq, argv[optind], argv[optind + 1], std::cout);
}
