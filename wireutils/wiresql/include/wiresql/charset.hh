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
#include <string>
#include <vector>

namespace wiresql
{

/**
 * @class Charset
 *
 * A character encoding used on the wire. Text is held as UTF-8 in the program and
 * converted to and from the wire encoding with iconv(3).
 *
 * MySQL charset names (utf8mb4, latin1, ucs2, ...) are mapped to their iconv
 * counterparts. Any other name is passed to iconv as is. The charset @c binary
 * passes bytes through unchanged.
 */
class Charset
{
public:
    /**
     * Constructor
     *
     * @param name  MySQL or iconv charset name, case insensitive.
     *
     * @throws CharsetError if the charset is not supported.
     */
    explicit Charset(const std::string& name);

    static Charset utf8mb4()
    {
        return Charset("utf8mb4");
    }

    static Charset binary()
    {
        return Charset("binary");
    }

    /**
     * @return The name the charset was created with, in lower case.
     */
    const std::string& name() const
    {
        return m_name;
    }

    /**
     * @return The iconv name of the encoding, empty for binary.
     */
    const std::string& iconv_name() const
    {
        return m_iconv_name;
    }

    bool is_binary() const
    {
        return m_iconv_name.empty();
    }

    /**
     * Convert UTF-8 text to bytes in this charset.
     *
     * @throws CharsetError if the text is not valid UTF-8 or is not representable.
     */
    std::vector<uint8_t> encode(const std::string& text) const;

    /**
     * Convert bytes in this charset to UTF-8 text.
     *
     * @throws CharsetError if the bytes are not valid in this charset.
     */
    std::string decode(const uint8_t* data, size_t len) const;

    std::string decode(const std::vector<uint8_t>& data) const
    {
        return decode(data.data(), data.size());
    }

private:
    std::string m_name;
    std::string m_iconv_name;
};
}
