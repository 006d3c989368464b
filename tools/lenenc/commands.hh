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
#include <ostream>
#include <string>
#include <wiresql/config.hh>

namespace lenenc
{

enum ExitCode
{
    EXIT_OK    = 0,
    EXIT_USAGE = 1,     // Bad command line, argument or configuration
    EXIT_CODEC = 2,     // The value could not be encoded or decoded
};

/**
 * Run one command of the tool.
 *
 * @param config   Charset and packet size limit to use
 * @param seq      Sequence number for the packet command
 * @param command  int, str, packet, decode-int or decode-str
 * @param arg      The argument of the command
 * @param out      Where the result is printed
 *
 * @return The exit code of the tool. Errors are logged.
 */
ExitCode run_command(const wiresql::CodecConfig& config, uint8_t seq,
                     const std::string& command, const std::string& arg, std::ostream& out);
}
