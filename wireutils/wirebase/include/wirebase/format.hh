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

#include <wirebase/ccdefs.hh>

#include <cstdarg>
#include <cstdint>
#include <string>
#include <sys/time.h>

namespace wirebase
{

/**
 * Format parameters to a string. Uses printf-formatting.
 *
 * @param format Format string
 * @param ... Items to convert according to format string
 * @return The result string
 */
std::string string_printf(const char* format, ...) wxb_attribute((format (printf, 1, 2)));

std::string string_vprintf(const char* format, va_list args);

/**
 * Format a timestamp the way it is written to the log.
 *
 * @param tv             The time.
 * @param highprecision  If true, milliseconds are included.
 *
 * @return The formatted timestamp, including trailing spaces.
 */
std::string format_timestamp(const struct timeval& tv, bool highprecision);
}
