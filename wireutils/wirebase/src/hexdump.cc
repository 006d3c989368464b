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
#include <wirebase/hexdump.hh>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace wirebase
{

/*
 *  "\x05\x00\x00\x01\x04sqlw"
 *  00000000  05 00 00 01 04 73 71 6c  77                       |.....sqlw|
 *  00000009
 */
std::ostream& hexdump(std::ostream& out, const void* pBytes, int len)
{
    using namespace std;

    const int BYTES_PER_ROW = 16;
    const size_t NUMERIC_CHAR_WIDTH = 10 + BYTES_PER_ROW * 3 + 2;   // nchars up to the first pipe symbol

    const uint8_t* const pBegin = static_cast<const uint8_t*>(pBytes);
    const uint8_t* const pEnd = pBegin + len;

    bool already_said_same = false;
    const uint8_t* pPrev;
    const uint8_t* pCurr;
    for (pPrev = pCurr = pBegin; pCurr < pEnd; pPrev = pCurr, pCurr += BYTES_PER_ROW)
    {
        // Identical consecutive rows are collapsed into a single '*'.
        if (pPrev != pCurr && memcmp(pPrev, pCurr, min(BYTES_PER_ROW, int(pEnd - pCurr))) == 0)
        {
            if (!already_said_same)
            {
                out << "*\n";
                already_said_same = true;
            }
            continue;
        }
        already_said_same = false;

        std::ostringstream oss;
        oss << setw(8) << setfill('0') << right << hex << (pCurr - pBegin) << ' ';

        for (const uint8_t* ptr = pCurr; ptr < pEnd && ptr < pCurr + BYTES_PER_ROW; ++ptr)
        {
            if ((ptr - pCurr) % 8 == 0)
            {
                oss << ' ';
            }
            oss << setw(2) << int(*ptr) << ' ';
        }

        if (oss.str().size() < NUMERIC_CHAR_WIDTH)
        {
            oss << std::string(NUMERIC_CHAR_WIDTH - oss.str().size(), ' ');
        }

        oss << '|';
        for (const uint8_t* ptr = pCurr; ptr < pEnd && ptr < pCurr + BYTES_PER_ROW; ++ptr)
        {
            oss << char(std::isprint(*ptr) ? *ptr : '.');
        }
        oss << "|\n";

        out << oss.str();
    }

    // The end address on its own line
    out << setw(8) << setfill('0') << right << hex << len << '\n';

    return out;
}

std::string hexdump(const void* pBytes, int len)
{
    std::ostringstream ss;
    hexdump(ss, pBytes, len);
    return ss.str();
}
}
