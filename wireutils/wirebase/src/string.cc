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
#include <wirebase/string.hh>
#include <ctype.h>
#include <errno.h>
#include <string.h>
#include <limits>

using std::string;

namespace
{

thread_local char errbuf[512];      // Enough for all errors

const char hex_lower[] = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    else if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    else if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }

    return -1;
}
}

const char* wxb_strerror(int error)
{
#if defined (_GNU_SOURCE) && defined (__GLIBC__)
    return strerror_r(error, errbuf, sizeof(errbuf));
#else
    strerror_r(error, errbuf, sizeof(errbuf));
    return errbuf;
#endif
}

namespace wirebase
{

bool get_long(const char* s, int base, long* value)
{
    errno = 0;
    char* end;
    long l = strtol(s, &end, base);

    bool rv = (*s != 0 && *end == 0 && errno == 0);

    if (rv && value)
    {
        *value = l;
    }

    return rv;
}

bool get_uint64(const char* s, uint64_t* value)
{
    errno = 0;
    char* end = nullptr;

    // strtoull happily accepts a leading minus sign.
    if (*s == '-')
    {
        return false;
    }

    auto ll = strtoull(s, &end, 10);

    bool rv = (*s != 0 && *end == 0 && errno == 0);
    if (rv && value)
    {
        *value = ll;
    }
    return rv;
}

bool get_bool(const std::string& s, bool* value)
{
    string str = lower_case_copy(trimmed_copy(s));
    bool rv = true;

    if (str == "true" || str == "yes" || str == "on" || str == "1")
    {
        *value = true;
    }
    else if (str == "false" || str == "no" || str == "off" || str == "0")
    {
        *value = false;
    }
    else
    {
        rv = false;
    }

    return rv;
}

std::string to_hex(const uint8_t* data, size_t len)
{
    std::string out;
    out.reserve(len * 2);

    for (size_t i = 0; i < len; i++)
    {
        out += hex_lower[data[i] >> 4];
        out += hex_lower[data[i] & 0x0F];
    }

    return out;
}

bool from_hex(const std::string& hex, std::vector<uint8_t>* out)
{
    int high = -1;

    for (char c : hex)
    {
        if (isspace((unsigned char)c))
        {
            if (high != -1)
            {
                // A byte must not be split by whitespace.
                return false;
            }
            continue;
        }

        int v = hex_value(c);

        if (v == -1)
        {
            return false;
        }

        if (high == -1)
        {
            high = v;
        }
        else
        {
            out->push_back((high << 4) | v);
            high = -1;
        }
    }

    return high == -1;
}
}
