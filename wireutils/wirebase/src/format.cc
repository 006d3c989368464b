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
#include <wirebase/format.hh>

#include <cstdio>
#include <ctime>
#include <wirebase/assert.hh>
#include <wirebase/log.hh>

namespace wirebase
{

std::string string_printf(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    std::string rval = wxb::string_vprintf(format, args);
    va_end(args);
    return rval;
}

std::string string_vprintf(const char* format, va_list args)
{
    /* Use 'vsnprintf' for the formatted printing. It outputs the optimal buffer length - 1. */
    va_list args_copy;
    va_copy(args_copy, args);
    int characters = vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);

    std::string rval;
    if (characters < 0)
    {
        // Encoding (programmer) error.
        wxb_assert(!true);
        fprintf(stderr, "Could not format '%s'.\n", format);
    }
    else if (characters > 0)
    {
        // 'characters' does not include the \0-byte.
        rval.resize(characters);
        vsnprintf(&rval[0], characters + 1, format, args);
    }
    return rval;
}

std::string format_timestamp(const struct timeval& tv, bool highprecision)
{
    struct tm tm;
    localtime_r(&tv.tv_sec, &tm);
    char buf[100];
    WXB_AT_DEBUG(int rc);

    if (highprecision)
    {
        int msec = tv.tv_usec / 1000;
        WXB_AT_DEBUG(rc = ) snprintf(buf, sizeof(buf),
                                     "%04d-%02d-%02d %02d:%02d:%02d.%03d   ",
                                     tm.tm_year + 1900,
                                     tm.tm_mon + 1,
                                     tm.tm_mday,
                                     tm.tm_hour,
                                     tm.tm_min,
                                     tm.tm_sec,
                                     msec);
    }
    else
    {
        WXB_AT_DEBUG(rc = ) snprintf(buf, sizeof(buf),
                                     "%04d-%02d-%02d %02d:%02d:%02d   ",
                                     tm.tm_year + 1900,
                                     tm.tm_mon + 1,
                                     tm.tm_mday,
                                     tm.tm_hour,
                                     tm.tm_min,
                                     tm.tm_sec);
    }

    wxb_assert(rc < (int)sizeof(buf) && rc > 0);

    return buf;
}
}
