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

#define WXB_MODULE_NAME "charset"

#include <wiresql/charset.hh>

#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <unordered_map>
#include <wirebase/log.hh>
#include <wirebase/string.hh>
#include <wiresql/error.hh>

namespace
{
const char UTF8[] = "UTF-8";

// MySQL's latin1 is CP1252 with the five bytes CP1252 leaves undefined mapped to the
// C1 control characters of the same value.
const char CP1252[] = "CP1252";

const std::unordered_map<std::string, std::string> mysql_charsets =
{
    {"utf8mb4", "UTF-8"      },
    {"utf8mb3", "UTF-8"      },
    {"utf8",    "UTF-8"      },
    {"latin1",  CP1252       },
    {"latin2",  "ISO-8859-2" },
    {"ascii",   "ASCII"      },
    {"ucs2",    "UCS-2BE"    },
    {"utf16",   "UTF-16BE"   },
    {"utf16le", "UTF-16LE"   },
    {"utf32",   "UTF-32BE"   },
    {"cp1250",  "CP1250"     },
    {"cp1251",  "CP1251"     },
    {"greek",   "ISO-8859-7" },
    {"hebrew",  "ISO-8859-8" },
    {"koi8r",   "KOI8-R"     },
    {"sjis",    "SHIFT_JIS"  },
    {"gbk",     "GBK"        },
    {"big5",    "BIG5"       },
    {"binary",  ""           },
};

// Owns one conversion descriptor.
class Converter
{
public:
    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    Converter(const std::string& to, const std::string& from)
        : m_cd(iconv_open(to.c_str(), from.c_str()))
    {
    }

    ~Converter()
    {
        if (ok())
        {
            iconv_close(m_cd);
        }
    }

    bool ok() const
    {
        return m_cd != (iconv_t)-1;
    }

    /**
     * Convert the whole input.
     *
     * @param in    Input bytes
     * @param len   Input length
     * @param out   The converted bytes are stored here
     *
     * @return 0 on success, otherwise the errno of the failure and the failing offset in @c pos.
     */
    int convert(const char* in, size_t len, std::string* out, size_t* pos)
    {
        out->resize(len * 4 + 16);

        char* inbuf = const_cast<char*>(in);
        size_t inleft = len;
        size_t used = 0;
        int err = 0;

        // Once all input is converted, a call with a null input flushes any shift state.
        bool flushed = false;

        while (err == 0 && !flushed)
        {
            char* outbuf = &(*out)[0] + used;
            size_t outleft = out->size() - used;
            bool flushing = inleft == 0;

            size_t rc = flushing ?
                iconv(m_cd, nullptr, nullptr, &outbuf, &outleft) :
                iconv(m_cd, &inbuf, &inleft, &outbuf, &outleft);

            used = outbuf - out->data();

            if (rc != (size_t)-1)
            {
                flushed = flushing;
            }
            else if (errno == E2BIG)
            {
                out->resize(out->size() * 2);
            }
            else
            {
                err = errno;
                *pos = inbuf - in;
            }
        }

        out->resize(used);
        return err;
    }

private:
    iconv_t m_cd;
};

bool is_cp1252_gap(uint8_t c)
{
    return c == 0x81 || c == 0x8d || c == 0x8f || c == 0x90 || c == 0x9d;
}

// Returns the number of input bytes handled, 0 if the input at @c in is left to iconv.
using Passthrough = size_t (*)(const char* in, size_t left, std::string* out);

size_t decode_cp1252_gap(const char* in, size_t left, std::string* out)
{
    if (!is_cp1252_gap(in[0]))
    {
        return 0;
    }

    // U+0080 .. U+00BF in UTF-8
    out->push_back('\xc2');
    out->push_back(in[0]);
    return 1;
}

size_t encode_cp1252_gap(const char* in, size_t left, std::string* out)
{
    if (left < 2 || (uint8_t)in[0] != 0xc2 || !is_cp1252_gap(in[1]))
    {
        return 0;
    }

    out->push_back(in[1]);
    return 2;
}

/**
 * Convert with iconv, except for the sequences @c passthrough handles.
 *
 * @return 0 on success, otherwise the errno of the failure and the failing offset in @c pos.
 */
int convert(Converter& converter, const char* in, size_t len, Passthrough passthrough,
            std::string* out, size_t* pos)
{
    size_t start = 0;
    size_t i = passthrough ? 0 : len;

    while (true)
    {
        std::string handled;
        size_t n = (passthrough && i < len) ? passthrough(in + i, len - i, &handled) : 0;

        if (n == 0 && i < len)
        {
            ++i;
            continue;
        }

        if (i > start)
        {
            std::string part;

            if (int err = converter.convert(in + start, i - start, &part, pos))
            {
                *pos += start;
                return err;
            }

            out->append(part);
        }

        if (n == 0)
        {
            break;
        }

        out->append(handled);
        i += n;
        start = i;
    }

    return 0;
}
}

namespace wiresql
{

Charset::Charset(const std::string& name)
    : m_name(wxb::lower_case_copy(wxb::trimmed_copy(name)))
{
    auto it = mysql_charsets.find(m_name);

    if (it != mysql_charsets.end())
    {
        m_iconv_name = it->second;
    }
    else if (Converter(m_name, UTF8).ok())
    {
        m_iconv_name = m_name;
    }
    else
    {
        WXB_THROW(CharsetError, "Unknown charset '" << name << "'");
    }

    WXB_DEBUG("Charset '%s' uses iconv encoding '%s'.", m_name.c_str(), m_iconv_name.c_str());
}

std::vector<uint8_t> Charset::encode(const std::string& text) const
{
    if (is_binary())
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    Converter converter(m_iconv_name, UTF8);

    if (!converter.ok())
    {
        int err = errno;
        WXB_THROW(CharsetError, "Cannot convert from UTF-8 to " << m_iconv_name << ": " << wxb_strerror(err));
    }

    std::string out;
    size_t pos = 0;

    Passthrough passthrough = m_iconv_name == CP1252 ? encode_cp1252_gap : nullptr;

    if (int err = convert(converter, text.data(), text.length(), passthrough, &out, &pos))
    {
        WXB_THROW(CharsetError, "Text is not representable in charset '" << m_name << "' at byte "
                                                                         << pos << ": " << wxb_strerror(err));
    }

    return std::vector<uint8_t>(out.begin(), out.end());
}

std::string Charset::decode(const uint8_t* data, size_t len) const
{
    const char* in = reinterpret_cast<const char*>(data);

    if (is_binary())
    {
        return std::string(in, len);
    }

    Converter converter(UTF8, m_iconv_name);

    if (!converter.ok())
    {
        int err = errno;
        WXB_THROW(CharsetError, "Cannot convert from " << m_iconv_name << " to UTF-8: " << wxb_strerror(err));
    }

    std::string out;
    size_t pos = 0;

    Passthrough passthrough = m_iconv_name == CP1252 ? decode_cp1252_gap : nullptr;

    if (int err = convert(converter, in, len, passthrough, &out, &pos))
    {
        WXB_THROW(CharsetError, "Invalid byte sequence for charset '" << m_name << "' at byte "
                                                                      << pos << ": " << wxb_strerror(err));
    }

    return out;
}
}
