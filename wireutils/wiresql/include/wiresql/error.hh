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
#include <wirebase/exception.hh>

namespace wiresql
{

/**
 * Root of all errors raised by the codec. The more specific errors below derive from it,
 * so a caller that does not care about the reason can catch just this one.
 */
DEFINE_EXCEPTION(CodecError);

// A read requested more bytes than are readable.
DEFINE_SUB_EXCEPTION(CodecError, BufferUnderrun);

// A negative length, or a NULL length where a value is required.
DEFINE_SUB_EXCEPTION(CodecError, InvalidLength);

// Unknown charset, or text that cannot be converted.
DEFINE_SUB_EXCEPTION(CodecError, CharsetError);

// The payload does not fit in a packet.
DEFINE_SUB_EXCEPTION(CodecError, PacketTooLarge);

/**
 * The first byte of a length-encoded integer was not a valid marker. The offending
 * byte is stored as the error code.
 */
struct UnknownLengthEncoding : CodecError
{
    using CodecError::CodecError;

    uint8_t marker() const
    {
        return code();
    }
};
}
