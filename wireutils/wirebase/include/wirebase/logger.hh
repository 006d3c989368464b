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

#include <memory>
#include <mutex>
#include <string>

namespace wirebase
{

/**
 * Destination of formatted log lines. The log owns exactly one logger at a time.
 */
class Logger
{
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    virtual ~Logger() = default;

    /**
     * Write one formatted line, including its newline.
     *
     * @return True if all of @c len bytes were written.
     */
    virtual bool write(const char* msg, int len) = 0;

    /**
     * Name written in the banners of file logs. Defaults to the program name.
     */
    static void set_ident(const std::string& ident);

protected:
    Logger() = default;
};

/**
 * Appends to a file. A banner is written when the file is opened and when it is closed.
 */
class FileLogger final : public Logger
{
public:
    /**
     * @return The logger, or an empty pointer if the file could not be opened.
     */
    static std::unique_ptr<Logger> create(const std::string& filename);

    ~FileLogger() override;

    bool write(const char* msg, int len) override;

private:
    FileLogger(int fd, const std::string& filename);

    bool write_all(const char* msg, size_t len);
    void write_banner(const std::string& text, bool closing);

    int         m_fd;
    std::string m_filename;
    std::mutex  m_lock;
};

class StdoutLogger final : public Logger
{
public:
    static std::unique_ptr<Logger> create()
    {
        return std::unique_ptr<Logger>(new StdoutLogger);
    }

    bool write(const char* msg, int len) override;

private:
    StdoutLogger() = default;
};
}
