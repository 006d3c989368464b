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
#include <iosfwd>
#include <string>

namespace wirebase
{

/**
 * @brief hexdump - Same output as command line hexdump -C.
 * @param out     - output stream
 * @param pBytes  - ptr to the buffer
 * @param len     - length of the buffer
 * @return std::ostream &out
 */
std::ostream& hexdump(std::ostream& out, const void* pBytes, int len);

/**
 * Overload for wxb::hexdump that returns a string
 *
 * @param pBytes Pointer to the start of the memory
 * @param len    Length of the memory in bytes
 *
 * @return Human-readable hexdump of the memory
 */
std::string hexdump(const void* pBytes, int len);
}
