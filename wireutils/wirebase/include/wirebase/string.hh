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
#include <algorithm>
#include <cctype>
#include <string>
#include <sstream>
#include <cstring>
#include <vector>

/**
 * Thread-safe (but not re-entrant) strerror.
 *
 * @param error  An errno value.
 *
 * @return  The corresponding string.
 */
const char* wxb_strerror(int error);

namespace wirebase
{

/**
 * @brief Left trim a string.
 *
 * @param s  The string to be trimmed.
 */
inline void ltrim(std::string& s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) {
                                        return !std::isspace(c);
                                    }));
}

/**
 * @brief Right trim a string.
 *
 * @param s  The string to be trimmed.
 */
inline void rtrim(std::string& s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) {
                             return !std::isspace(c);
                         }).base(), s.end());
}

/**
 * @brief Left and right trim a string.
 *
 * @param s  The string to be trimmed.
 */
inline void trim(std::string& s)
{
    ltrim(s);
    rtrim(s);
}

/**
 * @brief Left and right trim a string, returning a copy.
 *
 * @param original  The string to be trimmed.
 *
 * @return A trimmed copy of @c original.
 */
inline std::string trimmed_copy(const std::string& original)
{
    std::string s(original);
    trim(s);
    return s;
}

inline std::string lower_case_copy(const std::string& str)
{
    std::string rval(str);
    std::transform(rval.begin(), rval.end(), rval.begin(), [](unsigned char c) {
                       return std::tolower(c);
                   });
    return rval;
}

/**
 * Tokenize a string
 *
 * @param str   String to tokenize
 * @param delim List of delimiters (see strtok(3))
 *
 * @return List of tokenized strings
 */
inline std::vector<std::string> strtok(std::string str, const char* delim)
{
    std::vector<std::string> ret;
    char* saveptr;
    char* tok = strtok_r(&str[0], delim, &saveptr);

    while (tok)
    {
        ret.emplace_back(tok);
        tok = strtok_r(NULL, delim, &saveptr);
    }

    return ret;
}

/**
 * Convert a string to a long, in the given base.
 *
 * @param s      The string. Must be non-empty and consist only of digits of the base.
 * @param base   The base.
 * @param value  On successful return, the value.
 *
 * @return True if the string could be converted, false otherwise.
 */
bool get_long(const char* s, int base, long* value);

inline bool get_long(const std::string& s, int base, long* value)
{
    return get_long(s.c_str(), base, value);
}

inline bool get_long(const std::string& s, long* value)
{
    return get_long(s.c_str(), 10, value);
}

bool get_uint64(const char* s, uint64_t* value);

inline bool get_uint64(const std::string& s, uint64_t* value)
{
    return get_uint64(s.c_str(), value);
}

/**
 * Convert a string to a boolean.
 *
 * Accepted values are true/false, yes/no, on/off and 1/0, case insensitively.
 *
 * @param s      The string.
 * @param value  On successful return, the value.
 *
 * @return True if the string was a boolean value, false otherwise.
 */
bool get_bool(const std::string& s, bool* value);

/**
 * Convert bytes to a lowercase hexadecimal string, two characters per byte.
 *
 * @param data  The bytes.
 * @param len   Number of bytes.
 *
 * @return The hex string.
 */
std::string to_hex(const uint8_t* data, size_t len);

/**
 * Convert a hexadecimal string to bytes. Whitespace between the bytes is ignored.
 *
 * @param hex  The hex string.
 * @param out  The decoded bytes are appended here.
 *
 * @return True if the string was valid hex with an even number of digits.
 */
bool from_hex(const std::string& hex, std::vector<uint8_t>* out);
}
