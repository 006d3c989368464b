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

#include <wiresql/encoder.hh>
#include <wiresql/codec.hh>

namespace wiresql
{

void StringEncoder::encode(const std::string& value, ByteCursor& cursor) const
{
    BinaryCodec(cursor).write_length_encoded_string(value, m_charset);
}
}
