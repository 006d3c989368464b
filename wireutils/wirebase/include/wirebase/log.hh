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

#include <assert.h>
#include <syslog.h>
#include <unistd.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * If WXB_MODULE_NAME is defined before log.hh is included, then all
 * logged messages will be prefixed with that string enclosed in square brackets.
 * For instance, the following
 *
 *     #define WXB_MODULE_NAME "codec"
 *     #include <wirebase/log.hh>
 *
 * will lead to every logged message looking like:
 *
 *     2023-08-12 13:49:11   error  : [codec] The gadget was not ready
 */
#if !defined (WXB_MODULE_NAME)
#define WXB_MODULE_NAME NULL
#endif

enum wxb_log_target_t
{
    WXB_LOG_TARGET_FS,      // File system
    WXB_LOG_TARGET_STDOUT,  // Standard output
};

struct WXB_LOG_THROTTLING
{
    size_t count;       // Maximum number of a specific message...
    size_t window_ms;   // ...during this many milliseconds.
    size_t suppress_ms; // If exceeded, suppress such messages for this many ms.
};

extern int wxb_log_enabled_priorities;

/**
 * @brief Initialize the log
 *
 * This function must be called before any of the log function should be
 * used.
 *
 * @param ident     The syslog ident. If NULL, then the program name is used.
 * @param logdir    The directory for the log file. If NULL, file output is discarded.
 * @param filename  The name of the log-file. If NULL, the program name will be used
 *                  if it can be deduced, otherwise the name will be "messages.log".
 * @param target    Logging target
 *
 * @return true if succeed, otherwise false
 */
bool wxb_log_init(const char* ident, const char* logdir, const char* filename, wxb_log_target_t target);

/**
 * @brief Initialize the log
 *
 * This function initializes the log using
 * - the program name as the syslog ident,
 * - the current directory as the logdir, and
 * - the default log name (program name + ".log").
 *
 * @param target  The specified target for the logging.
 *
 * @return True if succeeded, false otherwise.
 */
inline bool wxb_log_init(wxb_log_target_t target = WXB_LOG_TARGET_FS)
{
    return wxb_log_init(nullptr, ".", nullptr, target);
}

/**
 * @brief Finalize the log
 *
 * A successfull call to @c wxb_log_init() should be followed by a call
 * to this function before the process exits.
 */
void wxb_log_finish();

/**
 * @brief Has the log been initialized.
 *
 * @return True if the log has been initialized, false otherwise.
 */
bool wxb_log_inited();

/**
 * Enable/disable a particular syslog priority.
 *
 * @param priority  One of the LOG_ERR etc. constants from sys/syslog.h.
 * @param enabled   True if the priority should be enabled, false if it should be disabled.
 *
 * @return True if the priority was valid, false otherwise.
 */
bool wxb_log_set_priority_enabled(int priority, bool enabled);

/**
 * Query whether a particular syslog priority is enabled.
 *
 * @param priority  One of the LOG_ERR etc. constants from sys/syslog.h.
 *
 * @return True if enabled, false otherwise.
 */
static inline bool wxb_log_is_priority_enabled(int priority)
{
    assert((priority & ~LOG_PRIMASK) == 0);
    return ((wxb_log_enabled_priorities & (1 << priority)) != 0) || (priority == LOG_ALERT);
}

/**
 * Enable/disable syslog logging.
 *
 * @param enabled True, if syslog logging should be enabled, false if it should be disabled.
 */
void wxb_log_set_syslog_enabled(bool enabled);

bool wxb_log_is_syslog_enabled();

/**
 * Enable/disable highprecision logging.
 *
 * @param enabled True, if high precision logging should be enabled, false if it should be disabled.
 */
void wxb_log_set_highprecision_enabled(bool enabled);

bool wxb_log_is_highprecision_enabled();

/**
 * Set the log throttling parameters.
 *
 * @param throttling The throttling parameters.
 */
void wxb_log_set_throttling(const WXB_LOG_THROTTLING* throttling);

/**
 * Get the log throttling parameters.
 *
 * @param throttling The throttling parameters.
 */
void wxb_log_get_throttling(WXB_LOG_THROTTLING* throttling);

/**
 * Log a message of a particular priority.
 *
 * @param priority One of the syslog constants: LOG_ERR, LOG_WARNING, ...
 * @param modname  The name of the module.
 * @param file     The name of the file where the message was logged.
 * @param line     The line where the message was logged.
 * @param function The function where the message was logged.
 * @param format   The printf format of the following arguments.
 * @param ...      Optional arguments according to the format.
 *
 * @return 0 for success, non-zero otherwise.
 */
int wxb_log_message(int priority,
                    const char* modname,
                    const char* file,
                    int line,
                    const char* function,
                    const char* format,
                    ...) wxb_attribute((format(printf, 6, 7)));

/**
 * Log an error, warning, notice, info, or debug  message.
 *
 * @attention Should typically not be called directly. Use some of the
 *            WXB_ERROR, WXB_WARNING, etc. macros instead.
 */
#define WXB_LOG_MESSAGE(priority, format, ...) \
    (wxb_log_is_priority_enabled(priority)  \
     ? wxb_log_message(priority, WXB_MODULE_NAME, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)  \
     : 0)

/**
 * Log an alert, error, warning, notice, info, or debug  message.
 *
 * WXB_ALERT   Not throttled  To be used when the system is about to go down in flames.
 * WXB_ERROR   Throttled      For errors.
 * WXB_WARNING Throttled      For warnings.
 * WXB_NOTICE  Not Throttled  For messages deemed important, typically used during startup.
 * WXB_INFO    Not Throttled  For information thought to be of value for investigating some problem.
 * WXB_DEBUG   Not Throttled  For debugging messages during development.
 */
#define WXB_ALERT(format, ...)   WXB_LOG_MESSAGE(LOG_ALERT, format, ##__VA_ARGS__)
#define WXB_ERROR(format, ...)   WXB_LOG_MESSAGE(LOG_ERR, format, ##__VA_ARGS__)
#define WXB_WARNING(format, ...) WXB_LOG_MESSAGE(LOG_WARNING, format, ##__VA_ARGS__)
#define WXB_NOTICE(format, ...)  WXB_LOG_MESSAGE(LOG_NOTICE, format, ##__VA_ARGS__)
#define WXB_INFO(format, ...)    WXB_LOG_MESSAGE(LOG_INFO, format, ##__VA_ARGS__)
#define WXB_DEBUG(format, ...)   WXB_LOG_MESSAGE(LOG_DEBUG, format, ##__VA_ARGS__)

namespace wirebase
{

/**
 * @class Log
 *
 * A simple utility RAII class where the constructor initializes the log and
 * the destructor finalizes it.
 */
class Log
{
    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

public:
    Log(const char* ident,
        const char* logdir,
        const char* filename,
        wxb_log_target_t target)
    {
        if (!wxb_log_init(ident, logdir, filename, target))
        {
            throw std::runtime_error("Failed to initialize the log.");
        }
    }

    Log(wxb_log_target_t target = WXB_LOG_TARGET_FS)
        : Log(nullptr, ".", nullptr, target)
    {
    }

    ~Log()
    {
        wxb_log_finish();
    }
};

// RAII class for setting and clearing the "scope" of the log messages. Adds the given object name to log
// messages as long as the object is alive.
class LogScope
{
public:
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    explicit LogScope(const char* name)
        : m_prev_scope(s_current_scope)
        , m_name(name)
    {
        s_current_scope = this;
    }

    ~LogScope()
    {
        s_current_scope = m_prev_scope;
    }

    static const char* current_scope()
    {
        return s_current_scope ? s_current_scope->m_name : nullptr;
    }

private:
    LogScope*   m_prev_scope;
    const char* m_name;

    static thread_local LogScope* s_current_scope;
};

// Class for redirecting the thread-local log message stream to a different handler. Only one of these should
// be constructed in the callstack.
class LogRedirect
{
public:
    LogRedirect(const LogRedirect&) = delete;
    LogRedirect& operator=(const LogRedirect&) = delete;

    /**
     * The message handler type
     *
     * @param level Syslog log level of the message
     * @param msg   The message itself
     *
     * @return True if the message was consumed (i.e. it should not be logged)
     */
    using Func = bool (*)(int level, std::string_view msg);

    explicit LogRedirect(Func func);
    ~LogRedirect();

    static Func current_redirect();

private:
    static thread_local Func s_redirect;
};

#define WXB_STREAM_LOG_HELPER(CWXBLOGLEVEL__, wxb_msg_str__) \
    do { \
        if (!wxb_log_is_priority_enabled(CWXBLOGLEVEL__)) \
        { \
            break; \
        } \
        thread_local std::ostringstream os; \
        os.str(std::string()); \
        os << wxb_msg_str__; \
        wxb_log_message(CWXBLOGLEVEL__, WXB_MODULE_NAME, __FILE__, __LINE__, \
                        __func__, "%s", os.str().c_str()); \
    } while (false)

#define WXB_SALERT(wxb_msg_str__)   WXB_STREAM_LOG_HELPER(LOG_ALERT, wxb_msg_str__)
#define WXB_SERROR(wxb_msg_str__)   WXB_STREAM_LOG_HELPER(LOG_ERR, wxb_msg_str__)
#define WXB_SWARNING(wxb_msg_str__) WXB_STREAM_LOG_HELPER(LOG_WARNING, wxb_msg_str__)
#define WXB_SNOTICE(wxb_msg_str__)  WXB_STREAM_LOG_HELPER(LOG_NOTICE, wxb_msg_str__)
#define WXB_SINFO(wxb_msg_str__)    WXB_STREAM_LOG_HELPER(LOG_INFO, wxb_msg_str__)
#define WXB_SDEBUG(wxb_msg_str__)   WXB_STREAM_LOG_HELPER(LOG_DEBUG, wxb_msg_str__)
}
