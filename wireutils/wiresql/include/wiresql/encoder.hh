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
#include <wiresql/charset.hh>
#include <wiresql/cursor.hh>

namespace wiresql
{

/**
 * MySQL column types, as sent in the binary protocol.
 */
enum FieldType : uint8_t
{
    FIELD_TYPE_DECIMAL     = 0,
    FIELD_TYPE_TINY        = 1,
    FIELD_TYPE_SHORT       = 2,
    FIELD_TYPE_LONG        = 3,
    FIELD_TYPE_FLOAT       = 4,
    FIELD_TYPE_DOUBLE      = 5,
    FIELD_TYPE_NULL        = 6,
    FIELD_TYPE_TIMESTAMP   = 7,
    FIELD_TYPE_LONGLONG    = 8,
    FIELD_TYPE_INT24       = 9,
    FIELD_TYPE_DATE        = 10,
    FIELD_TYPE_TIME        = 11,
    FIELD_TYPE_DATETIME    = 12,
    FIELD_TYPE_YEAR        = 13,
    FIELD_TYPE_VARCHAR     = 15,
    FIELD_TYPE_BIT         = 16,
    FIELD_TYPE_NEWDECIMAL  = 246,
    FIELD_TYPE_BLOB        = 252,
    FIELD_TYPE_VAR_STRING  = 253,
    FIELD_TYPE_STRING      = 254,
};

/**
 * @class BinaryEncoder
 *
 * Encodes a statement parameter for the binary protocol.
 */
class BinaryEncoder
{
public:
    virtual ~BinaryEncoder() = default;

    /**
     * Write the value.
     *
     * @param value   The value in its text form
     * @param cursor  Where the value is written
     */
    virtual void encode(const std::string& value, ByteCursor& cursor) const = 0;

    /**
     * @return The column type the value is sent as.
     */
    virtual FieldType encodes_to() const = 0;
};

/**
 * Sends a value as a length-encoded string of type VARCHAR.
 */
class StringEncoder : public BinaryEncoder
{
public:
    explicit StringEncoder(const Charset& charset)
        : m_charset(charset)
    {
    }

    void encode(const std::string& value, ByteCursor& cursor) const override;

    FieldType encodes_to() const override
    {
        return FIELD_TYPE_VARCHAR;
    }

    const Charset& charset() const
    {
        return m_charset;
    }

private:
    Charset m_charset;
};
}
