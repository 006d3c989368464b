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
#include <sstream>
#include <stdexcept>
#include <string>

namespace wirebase
{

/**
 * Base of the exception families declared with DEFINE_EXCEPTION. Besides the message,
 * an exception carries a type specific code and the place it was thrown from.
 */
class Exception : public std::runtime_error
{
public:
    Exception(const std::string& msg, int code, const char* file, int line, const char* type)
        : std::runtime_error(msg)
        , m_code(code)
        , m_line(line)
        , m_file(file)
        , m_type(type)
    {
    }

    // -1 unless the exception was raised with WXB_THROWCode.
    int code() const
    {
        return m_code;
    }

    const char* file() const
    {
        return m_file;
    }

    int line() const
    {
        return m_line;
    }

    // Name of the most derived type, as given to the throw macro.
    std::string type() const
    {
        return m_type;
    }

private:
    int         m_code;
    int         m_line;
    const char* m_file;
    const char* m_type;
};
}

/**
 * Declare an exception type deriving directly from wirebase::Exception.
 */
#define DEFINE_EXCEPTION(Type) \
    struct Type : public wirebase::Exception \
    { \
        using wirebase::Exception::Exception; \
    }

/**
 * Declare an exception type deriving from an earlier declared one.
 */
#define DEFINE_SUB_EXCEPTION(Super, Sub) \
    struct Sub : public Super \
    { \
        using Super::Super; \
    }

/**
 * Throw @c Type with a message built by streaming, e.g.
 *
 *     WXB_THROW(BufferUnderrun, "Need " << n << " bytes");
 */
#define WXB_THROWCode(Type, code, msg_str) \
    do { \
        std::ostringstream wxb_throw_os__; \
        wxb_throw_os__ << msg_str; \
        throw Type(wxb_throw_os__.str(), code, __FILE__, __LINE__, #Type); \
    } while (false)

#define WXB_THROW(Type, msg_str) WXB_THROWCode(Type, -1, msg_str)
