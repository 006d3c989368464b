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
#include <wirebase/ini.hh>
#include <wirebase/log.hh>
#include <wiresql/charset.hh>

namespace wiresql
{

/**
 * @class CodecConfig
 *
 * Codec and logging settings, read from an INI file:
 *
 *     [codec]
 *     charset=utf8mb4
 *     max_packet_size=16777215
 *
 *     [log]
 *     target=stdout
 *     logdir=.
 *     info=false
 *     debug=false
 *     syslog=false
 *     highprecision=false
 *     throttling=10,1000,10000
 *
 * The throttling value is "count,window_ms,suppress_ms": an error or warning logged count
 * times within window_ms is suppressed for suppress_ms. A zero disables throttling.
 *
 * All settings are optional. A value of the form $NAME is replaced with the value of the
 * environment variable NAME.
 */
class CodecConfig
{
public:
    static constexpr const char* DEFAULT_CHARSET = "utf8mb4";

    /**
     * Load settings from a file. Errors are logged. If any setting is invalid, no setting
     * is changed.
     *
     * @param filename  The file to read
     *
     * @return True if the file was read and all settings were valid.
     */
    bool load(const std::string& filename);

    /**
     * Load settings from INI text. Otherwise like load().
     */
    bool parse(const std::string& text);

    const std::string& charset_name() const
    {
        return m_charset;
    }

    /**
     * @return The configured charset.
     *
     * @throws CharsetError if the charset set with set_charset() is not supported.
     */
    Charset charset() const
    {
        return Charset(m_charset);
    }

    /**
     * Override the charset.
     *
     * @return True if the charset is supported.
     */
    bool set_charset(const std::string& name);

    uint32_t max_packet_size() const
    {
        return m_max_packet_size;
    }

    wxb_log_target_t log_target() const
    {
        return m_log_target;
    }

    const std::string& logdir() const
    {
        return m_logdir;
    }

    bool log_info() const
    {
        return m_log_info;
    }

    bool log_debug() const
    {
        return m_log_debug;
    }

    void set_log_debug(bool enabled)
    {
        m_log_debug = enabled;
    }

    bool log_syslog() const
    {
        return m_log_syslog;
    }

    bool log_highprecision() const
    {
        return m_log_highprecision;
    }

    const WXB_LOG_THROTTLING& log_throttling() const
    {
        return m_log_throttling;
    }

    /**
     * Enable the configured priorities and apply the other log settings.
     */
    void apply_log_settings() const;

private:
    enum class SetResult
    {
        OK,
        UNKNOWN,
        INVALID,
    };

    bool      configure(wxb::ini::ParseResult&& result, const char* source);
    SetResult set_codec_value(const std::string& key, const std::string& value);
    SetResult set_log_value(const std::string& key, const std::string& value);

    std::string        m_charset {DEFAULT_CHARSET};
    uint32_t           m_max_packet_size {0x00ffffff};
    wxb_log_target_t   m_log_target {WXB_LOG_TARGET_STDOUT};
    std::string        m_logdir {"."};
    bool               m_log_info {false};
    bool               m_log_debug {false};
    bool               m_log_syslog {false};
    bool               m_log_highprecision {false};
    WXB_LOG_THROTTLING m_log_throttling {10, 1000, 10000};
};
}
