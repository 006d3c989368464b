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

#include <wirebase/log.hh>

#include <sys/time.h>
#include <syslog.h>

#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>

#include <wirebase/assert.hh>
#include <wirebase/format.hh>
#include <wirebase/logger.hh>

/**
 * Variable holding the enabled priorities information.
 */
int wxb_log_enabled_priorities = (1 << LOG_ERR) | (1 << LOG_NOTICE) | (1 << LOG_WARNING);

namespace
{

// A message that is logged 10 times in 1 second will be suppressed for 10 seconds.
static WXB_LOG_THROTTLING DEFAULT_LOG_THROTTLING = {10, 1000, 10000};

// BUFSIZ comes from the system. It equals with block size or its multiplication.
const int MAX_LOGSTRLEN = BUFSIZ;

// Current monotonic raw time in milliseconds.
uint64_t time_monotonic_ms()
{
    struct timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);

    return now.tv_sec * 1000 + now.tv_nsec / 1000000;
}

std::string_view level_to_prefix(int level)
{
    assert((level & ~LOG_PRIMASK) == 0);

    switch (level)
    {
    case LOG_EMERG:
        return "emerg  : ";

    case LOG_ALERT:
        return "alert  : ";

    case LOG_CRIT:
        return "crit   : ";

    case LOG_ERR:
        return "error  : ";

    case LOG_WARNING:
        return "warning: ";

    case LOG_NOTICE:
        return "notice : ";

    case LOG_INFO:
        return "info   : ";

    case LOG_DEBUG:
        return "debug  : ";

    default:
        assert(!true);
        return "error  : ";
    }
}

enum message_suppression_t
{
    MESSAGE_NOT_SUPPRESSED,     // Message is not suppressed.
    MESSAGE_SUPPRESSED,         // Message is suppressed for the first time (for this round)
    MESSAGE_STILL_SUPPRESSED,   // Message is still suppressed (for this round)
    MESSAGE_UNSUPPRESSED,       // Message was suppressed but the suppression is now over
};

struct MessageRegistryKey
{
    const char* filename;
    int         linenumber;

    bool operator==(const MessageRegistryKey& other) const
    {
        return filename == other.filename   // Yes, we compare the pointer values and not the strings.
               && linenumber == other.linenumber;
    }
};

struct MessageRegistryKeyHash
{
    size_t operator()(const MessageRegistryKey& key) const
    {
        return std::hash<const void*>()(key.filename) ^ (std::hash<int>()(key.linenumber) << 1);
    }
};

class MessageRegistryStats
{
public:
    std::pair<message_suppression_t, size_t> update_suppression(const WXB_LOG_THROTTLING& t)
    {
        message_suppression_t rv = MESSAGE_NOT_SUPPRESSED;

        std::lock_guard<std::mutex> guard(m_lock);
        uint64_t now_ms = time_monotonic_ms();

        size_t old_count = m_count - t.count;
        ++m_count;

        if (m_count < t.count)
        {
            // t.count times has not been reached, still ok to log.
        }
        else if (m_count == t.count)
        {
            // t.count times has been reached. Was it within the window?
            if (now_ms - m_first_ms < t.window_ms)
            {
                rv = MESSAGE_SUPPRESSED;
            }
            else
            {
                // Not within the window, reset the situation.
                m_first_ms = now_ms;
                m_count = 1;
            }
        }
        else
        {
            // In suppression mode.
            if (now_ms - m_first_ms < (t.window_ms + t.suppress_ms))
            {
                rv = MESSAGE_STILL_SUPPRESSED;

                if (now_ms - m_first_ms < t.window_ms)
                {
                    // Still within the trigger window, reset the timer.
                    m_first_ms = now_ms;
                }
            }
            else
            {
                // We have exited the suppression window, reset the situation.
                m_first_ms = now_ms;
                m_count = 1;
                rv = MESSAGE_UNSUPPRESSED;
            }
        }

        return {rv, old_count};
    }

private:
    std::mutex m_lock;
    uint64_t   m_first_ms {time_monotonic_ms()};    /** When the message was logged first in this window. */
    size_t     m_count {0};                         /** How many times the message has been logged. */
};

class MessageRegistry
{
public:
    MessageRegistry(const MessageRegistry&) = delete;
    MessageRegistry& operator=(const MessageRegistry&) = delete;

    MessageRegistry() = default;

    std::pair<message_suppression_t, size_t> get_status(const char* file, int line,
                                                        const WXB_LOG_THROTTLING& t)
    {
        std::pair<message_suppression_t, size_t> rv = {MESSAGE_NOT_SUPPRESSED, 0};

        if ((t.count != 0) && (t.window_ms != 0) && (t.suppress_ms != 0))
        {
            MessageRegistryStats* stats;

            {
                std::lock_guard<std::mutex> guard(m_lock);
                stats = &m_registry[MessageRegistryKey {file, line}];
            }

            rv = stats->update_suppression(t);
        }

        return rv;
    }

private:
    std::mutex m_lock;
    std::unordered_map<MessageRegistryKey, MessageRegistryStats, MessageRegistryKeyHash> m_registry;
};

struct this_unit
{
    using SLogger = std::unique_ptr<wxb::Logger>;
    using SMessageRegistry = std::unique_ptr<MessageRegistry>;

    bool               do_highprecision {false};
    bool               do_syslog {false};
    WXB_LOG_THROTTLING throttling {DEFAULT_LOG_THROTTLING};
    SLogger            sLogger;
    SMessageRegistry   sMessage_registry;
} this_unit;

// "error  : " is logged as "error".
std::string level_to_string(int level)
{
    std::string name(level_to_prefix(level));
    return name.substr(0, name.find_first_of(" :"));
}

int log_message(message_suppression_t status,
                size_t msg_count,
                int priority,
                const char* zModname,
                std::string_view message)
{
    // The log format looks as follows:
    //
    // timestamp   prefix : [\[module\] ][(scope); ]message[suppression]
    int level = priority & LOG_PRIMASK;

    struct timeval now;
    gettimeofday(&now, NULL);

    std::string line = wxb::format_timestamp(now, this_unit.do_highprecision);
    line.append(level_to_prefix(level));
    auto body_start = line.length();

    if (zModname)
    {
        line.append("[").append(zModname).append("] ");
    }

    if (auto zScope = wxb::LogScope::current_scope())
    {
        line.append("(").append(zScope).append("); ");
    }

    // Messages are written on a single line.
    for (char c : message)
    {
        if (c == '\n')
        {
            line.append("\\n");
        }
        else
        {
            line.push_back(c);
        }
    }

    if (status == MESSAGE_SUPPRESSED)
    {
        line.append(wxb::string_printf(" (subsequent similar messages suppressed for %lu milliseconds)",
                                       this_unit.throttling.suppress_ms));
    }
    else if (status == MESSAGE_UNSUPPRESSED)
    {
        line.append(wxb::string_printf(" (%lu similar messages were previously suppressed)", msg_count));
    }

    if (line.length() > (size_t)MAX_LOGSTRLEN)
    {
        line.resize(MAX_LOGSTRLEN);
    }

    line.push_back('\n');

    // Debug messages are never logged into syslog
    if (this_unit.do_syslog && level != LOG_DEBUG)
    {
        syslog(priority, "%s", line.c_str() + body_start);
    }

    return this_unit.sLogger->write(line.c_str(), line.length()) ? 0 : -1;
}
}

bool wxb_log_init(const char* ident, const char* logdir, const char* filename, wxb_log_target_t target)
{
    assert(!wxb_log_inited());

    // Using /dev/null as the default allows total suppression of logging
    std::string filepath = "/dev/null";

    if (logdir)
    {
        std::string suffix;

        if (!filename)
        {
#ifdef __GNUC__
            suffix = program_invocation_short_name;
#else
            suffix = "messages";
#endif
            suffix += ".log";
        }
        else
        {
            suffix = filename;
        }

        filepath = std::string(logdir) + "/" + suffix;
    }

    if (!ident)
    {
#ifdef __GNUC__
        ident = program_invocation_short_name;
#else
        ident = "wxb_log";
#endif
    }

    wxb::Logger::set_ident(ident);
    this_unit.sMessage_registry.reset(new(std::nothrow) MessageRegistry);

    switch (target)
    {
    case WXB_LOG_TARGET_FS:
        this_unit.sLogger = wxb::FileLogger::create(filepath);
        break;

    case WXB_LOG_TARGET_STDOUT:
        this_unit.sLogger = wxb::StdoutLogger::create();
        break;

    default:
        assert(!true);
        break;
    }

    if (this_unit.sLogger && this_unit.sMessage_registry)
    {
        openlog(ident, LOG_PID | LOG_ODELAY, LOG_USER);
    }
    else
    {
        this_unit.sLogger.reset();
        this_unit.sMessage_registry.reset();
    }

    return this_unit.sLogger && this_unit.sMessage_registry;
}

void wxb_log_finish()
{
    assert(this_unit.sLogger && this_unit.sMessage_registry);

    closelog();
    this_unit.sLogger.reset();
    this_unit.sMessage_registry.reset();
}

bool wxb_log_inited()
{
    return this_unit.sLogger && this_unit.sMessage_registry;
}

void wxb_log_set_highprecision_enabled(bool enabled)
{
    this_unit.do_highprecision = enabled;
}

bool wxb_log_is_highprecision_enabled()
{
    return this_unit.do_highprecision;
}

void wxb_log_set_syslog_enabled(bool enabled)
{
    this_unit.do_syslog = enabled;
}

bool wxb_log_is_syslog_enabled()
{
    return this_unit.do_syslog;
}

void wxb_log_set_throttling(const WXB_LOG_THROTTLING* throttling)
{
    // No locking; it does not have any real impact, even if the struct
    // is used right when its values are modified.
    this_unit.throttling = *throttling;

    if ((this_unit.throttling.count == 0)
        || (this_unit.throttling.window_ms == 0)
        || (this_unit.throttling.suppress_ms == 0))
    {
        WXB_INFO("Log throttling has been disabled.");
    }
    else
    {
        WXB_INFO("A message that is logged %lu times in %lu milliseconds, "
                 "will be suppressed for %lu milliseconds.",
                 this_unit.throttling.count,
                 this_unit.throttling.window_ms,
                 this_unit.throttling.suppress_ms);
    }
}

void wxb_log_get_throttling(WXB_LOG_THROTTLING* throttling)
{
    *throttling = this_unit.throttling;
}

bool wxb_log_set_priority_enabled(int level, bool enable)
{
    bool rv = false;
    const char* text = (enable ? "enable" : "disable");

    if ((level & ~LOG_PRIMASK) == 0)
    {
        int bit = (1 << level);

        if (enable)
        {
            wxb_log_enabled_priorities |= bit;
        }
        else
        {
            wxb_log_enabled_priorities &= ~bit;
        }

        WXB_INFO("The logging of %s messages has been %sd.", level_to_string(level).c_str(), text);
        rv = true;
    }
    else
    {
        WXB_ERROR("Attempt to %s unknown syslog priority %d.", text, level);
    }

    return rv;
}

int wxb_log_message(int priority,
                    const char* modname,
                    const char* file,
                    int line,
                    const char* function,
                    const char* format,
                    ...)
{
    int err = 0;
    int level = priority & LOG_PRIMASK;

    if ((priority & ~(LOG_PRIMASK | LOG_FACMASK)) != 0)
    {
        return -1;
    }

    char message[MAX_LOGSTRLEN + 1];

    va_list valist;
    va_start(valist, format);
    int nMessage = vsnprintf(message, sizeof(message), format, valist);
    va_end(valist);

    if (nMessage < 0)
    {
        return -1;
    }

    // If the string got truncated, the return value from vsnprintf is the size that would've been
    // printed if there was enough space.
    nMessage = std::min(nMessage, (int)sizeof(message) - 1);

    // If there is redirection and the redirectee handles the message,
    // the regular logging is bypassed.
    if (auto redirect = wxb::LogRedirect::current_redirect())
    {
        if (redirect(level, std::string_view(message, nMessage)))
        {
            return 0;
        }
    }

    if (!wxb_log_inited())
    {
        // Library code may log before the hosting program has set up the log.
        fprintf(stderr, "%s%.*s\n", level_to_prefix(level).data(), nMessage, message);
        return 0;
    }

    message_suppression_t status = MESSAGE_NOT_SUPPRESSED;
    size_t msg_count = 0;

    // Only errors and warnings are throttled, and not at all if info messages are enabled
    // as it would cause messages to be lost that bring context to other messages.
    if (!wxb_log_is_priority_enabled(LOG_INFO) && (level == LOG_ERR || level == LOG_WARNING))
    {
        std::tie(status, msg_count) = this_unit.sMessage_registry->get_status(file, line,
                                                                             this_unit.throttling);
    }

    if (status != MESSAGE_STILL_SUPPRESSED)
    {
        err = log_message(status, msg_count, priority, modname, std::string_view(message, nMessage));
    }

    return err;
}

namespace wirebase
{
thread_local LogScope* LogScope::s_current_scope {nullptr};
thread_local LogRedirect::Func LogRedirect::s_redirect {nullptr};

LogRedirect::LogRedirect(Func func)
{
    wxb_assert(s_redirect == nullptr);
    s_redirect = func;
}

LogRedirect::~LogRedirect()
{
    s_redirect = nullptr;
}

// static
LogRedirect::Func LogRedirect::current_redirect()
{
    return s_redirect;
}
}
