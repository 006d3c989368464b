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
#include <wirebase/logger.hh>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <wirebase/string.hh>

// The logger cannot report its own failures through the log.
#define LOGGER_ERROR(format, ...) fprintf(stderr, "logger: " format "\n", ##__VA_ARGS__)

namespace
{

struct this_unit
{
    static const size_t MAX_IDENT_LEN = 256;

    // A plain array, so that it outlives the std::string statics of log.cc.
    char ident[MAX_IDENT_LEN + 1];
} this_unit;

std::string ident()
{
    return this_unit.ident[0] ? this_unit.ident : program_invocation_short_name;
}

// Write failures are reported at most once a minute.
bool report_write_failure()
{
    using Clock = std::chrono::steady_clock;
    static Clock::time_point next;
    auto now = Clock::now();

    if (now < next)
    {
        return false;
    }

    next = now + std::chrono::minutes(1);
    return true;
}

std::string local_time(const char* format)
{
    time_t t = time(nullptr);
    struct tm tm;
    localtime_r(&t, &tm);

    char buf[64];
    strftime(buf, sizeof(buf), format, &tm);
    return buf;
}
}

namespace wirebase
{

// static
void Logger::set_ident(const std::string& ident)
{
    size_t len = std::min(ident.length(), this_unit.MAX_IDENT_LEN);
    memcpy(this_unit.ident, ident.data(), len);
    this_unit.ident[len] = '\0';
}

bool StdoutLogger::write(const char* msg, int len)
{
    return ::write(STDOUT_FILENO, msg, len) == len;
}

// static
std::unique_ptr<Logger> FileLogger::create(const std::string& filename)
{
    int fd = open(filename.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                  S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH);

    if (fd == -1)
    {
        LOGGER_ERROR("Cannot open '%s': %d, %s", filename.c_str(), errno, wxb_strerror(errno));
        return nullptr;
    }

    std::unique_ptr<FileLogger> sLogger(new FileLogger(fd, filename));
    sLogger->write_banner(ident() + "  " + filename + "  " + local_time("%a %b %e %H:%M:%S %Y"), false);
    return sLogger;
}

FileLogger::FileLogger(int fd, const std::string& filename)
    : m_fd(fd)
    , m_filename(filename)
{
}

FileLogger::~FileLogger()
{
    std::lock_guard<std::mutex> guard(m_lock);
    write_banner(local_time("%Y-%m-%d %H:%M:%S") + "   " + ident() + " is shut down.", true);
    ::close(m_fd);
}

bool FileLogger::write(const char* msg, int len)
{
    std::lock_guard<std::mutex> guard(m_lock);
    bool ok = write_all(msg, len);

    if (!ok && report_write_failure())
    {
        LOGGER_ERROR("Cannot write to '%s': %d, %s", m_filename.c_str(), errno, wxb_strerror(errno));
    }

    return ok;
}

bool FileLogger::write_all(const char* msg, size_t len)
{
    while (len > 0)
    {
        ssize_t rc = ::write(m_fd, msg, len);

        if (rc == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }

            return false;
        }

        msg += rc;
        len -= rc;
    }

    return true;
}

// The opening banner is preceded by an empty line, both are underlined.
void FileLogger::write_banner(const std::string& text, bool closing)
{
    std::string banner = closing ? "" : "\n";
    banner += text;
    banner += '\n';
    banner.append(text.length(), '-');
    banner += '\n';

    if (!write_all(banner.data(), banner.length()))
    {
        LOGGER_ERROR("Cannot write the log banner to '%s': %d, %s",
                     m_filename.c_str(), errno, wxb_strerror(errno));
    }
}
}
