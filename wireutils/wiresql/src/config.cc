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

#define WXB_MODULE_NAME "config"

#include <wiresql/config.hh>

#include <wirebase/string.hh>
#include <wiresql/error.hh>
#include <wiresql/packet.hh>

namespace wiresql
{

bool CodecConfig::load(const std::string& filename)
{
    return configure(wxb::ini::parse_file(filename), filename.c_str());
}

bool CodecConfig::parse(const std::string& text)
{
    return configure(wxb::ini::parse_text(text), "configuration text");
}

bool CodecConfig::configure(wxb::ini::ParseResult&& result, const char* source)
{
    auto errors = std::move(result.errors);

    if (errors.empty())
    {
        errors = wxb::ini::substitute_env_vars(result.config);
    }

    for (const auto& error : errors)
    {
        WXB_ERROR("%s: %s", source, error.c_str());
    }

    if (!errors.empty())
    {
        return false;
    }

    // Settings are applied to a copy so that a failure leaves this one unchanged.
    CodecConfig copy(*this);
    bool ok = true;

    for (const auto& section : result.config)
    {
        using Setter = SetResult (CodecConfig::*)(const std::string&, const std::string&);
        Setter setter = nullptr;

        if (section.first == "codec")
        {
            setter = &CodecConfig::set_codec_value;
        }
        else if (section.first == "log")
        {
            setter = &CodecConfig::set_log_value;
        }
        else
        {
            WXB_ERROR("%s: Unknown section '%s'.", source, section.first.c_str());
            ok = false;
            continue;
        }

        for (const auto& setting : section.second)
        {
            const std::string& key = setting.first;
            const std::string& value = setting.second;

            switch ((copy.*setter)(key, wxb::trimmed_copy(value)))
            {
            case SetResult::OK:
                break;

            case SetResult::UNKNOWN:
                WXB_ERROR("%s: Unknown setting '%s' in section '%s'.", source,
                          key.c_str(), section.first.c_str());
                ok = false;
                break;

            case SetResult::INVALID:
                WXB_ERROR("%s: Invalid value '%s' for '%s' in section '%s'.", source,
                          value.c_str(), key.c_str(), section.first.c_str());
                ok = false;
                break;
            }
        }
    }

    if (ok)
    {
        *this = copy;
        WXB_INFO("%s: charset=%s, max_packet_size=%u", source, m_charset.c_str(), m_max_packet_size);
    }

    return ok;
}

bool CodecConfig::set_charset(const std::string& name)
{
    bool rval = false;

    try
    {
        Charset charset(name);
        m_charset = charset.name();
        rval = true;
    }
    catch (const CharsetError& e)
    {
        WXB_ERROR("%s", e.what());
    }

    return rval;
}

CodecConfig::SetResult CodecConfig::set_codec_value(const std::string& key, const std::string& value)
{
    bool valid = false;

    if (key == "charset")
    {
        try
        {
            m_charset = Charset(value).name();
            valid = true;
        }
        catch (const CharsetError&)
        {
            // Reported by the caller as an invalid value.
        }
    }
    else if (key == "max_packet_size")
    {
        uint64_t size;

        if (wxb::get_uint64(value, &size) && size > 0 && size <= MYSQL_PACKET_LENGTH_MAX)
        {
            m_max_packet_size = size;
            valid = true;
        }
    }
    else
    {
        return SetResult::UNKNOWN;
    }

    return valid ? SetResult::OK : SetResult::INVALID;
}

namespace
{
// "count,window_ms,suppress_ms"
bool get_throttling(const std::string& value, WXB_LOG_THROTTLING* pThrottling)
{
    auto parts = wxb::strtok(value, ",");
    uint64_t numbers[3];

    if (parts.size() != 3)
    {
        return false;
    }

    for (size_t i = 0; i < parts.size(); i++)
    {
        if (!wxb::get_uint64(wxb::trimmed_copy(parts[i]), &numbers[i]))
        {
            return false;
        }
    }

    pThrottling->count = numbers[0];
    pThrottling->window_ms = numbers[1];
    pThrottling->suppress_ms = numbers[2];
    return true;
}
}

CodecConfig::SetResult CodecConfig::set_log_value(const std::string& key, const std::string& value)
{
    bool valid = true;

    if (key == "target")
    {
        if (value == "stdout")
        {
            m_log_target = WXB_LOG_TARGET_STDOUT;
        }
        else if (value == "file")
        {
            m_log_target = WXB_LOG_TARGET_FS;
        }
        else
        {
            valid = false;
        }
    }
    else if (key == "logdir")
    {
        m_logdir = value;
        valid = !value.empty();
    }
    else if (key == "info")
    {
        valid = wxb::get_bool(value, &m_log_info);
    }
    else if (key == "debug")
    {
        valid = wxb::get_bool(value, &m_log_debug);
    }
    else if (key == "syslog")
    {
        valid = wxb::get_bool(value, &m_log_syslog);
    }
    else if (key == "highprecision")
    {
        valid = wxb::get_bool(value, &m_log_highprecision);
    }
    else if (key == "throttling")
    {
        valid = get_throttling(value, &m_log_throttling);
    }
    else
    {
        return SetResult::UNKNOWN;
    }

    return valid ? SetResult::OK : SetResult::INVALID;
}

void CodecConfig::apply_log_settings() const
{
    wxb_log_set_priority_enabled(LOG_INFO, m_log_info || m_log_debug);
    wxb_log_set_priority_enabled(LOG_DEBUG, m_log_debug);
    wxb_log_set_syslog_enabled(m_log_syslog);
    wxb_log_set_highprecision_enabled(m_log_highprecision);
    wxb_log_set_throttling(&m_log_throttling);
}
}
