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
#include <wirebase/ini.hh>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <ini.h>

#include <wirebase/format.hh>
#include <wirebase/string.hh>

using wxb::string_printf;

namespace
{

// Receives the settings from inih in file order.
struct Collector
{
    using Settings = wxb::ini::Settings;

    wxb::ini::Config         config;
    std::vector<std::string> errors;
    std::string              section;               // Section of the previous callback
    std::string              name;                  // Setting of the previous callback
    std::string*             pValue {nullptr};      // Where a continuation line goes, if anywhere
    bool                     started {false};
    bool                     ignore_section {false};

    void start_section(const char* header)
    {
        started = true;
        section = header;
        name.clear();
        pValue = nullptr;
        ignore_section = true;

        if (section.empty())
        {
            errors.push_back("Settings were given outside of any section.");
        }
        else if (config.count(section))
        {
            errors.push_back(string_printf("Section '%s' is a duplicate.", section.c_str()));
        }
        else
        {
            config[section];
            ignore_section = false;
        }
    }

    void add(const char* key, const char* value)
    {
        Settings& settings = config[section];

        if (pValue && name == key)
        {
            // inih reports each continuation line as a new value for the same name.
            pValue->append(value);
        }
        else if (!*key)
        {
            errors.push_back(string_printf("A setting in section '%s' has no name.", section.c_str()));
            pValue = nullptr;
        }
        else if (settings.count(key))
        {
            errors.push_back(string_printf("Setting '%s' in section '%s' is a duplicate.",
                                           key, section.c_str()));
            pValue = nullptr;
        }
        else
        {
            pValue = &settings.emplace(key, value).first->second;
        }

        name = key;
    }
};

int collect(void* userdata, const char* section, const char* name, const char* value)
{
    auto* pCollector = static_cast<Collector*>(userdata);

    if (!pCollector->started || pCollector->section != section)
    {
        pCollector->start_section(section);
    }

    if (!pCollector->ignore_section)
    {
        pCollector->add(name, value ? value : "");
    }

    return 1;
}

std::string line_of(const std::string& text, int lineno)
{
    std::istringstream in(text);
    std::string line;

    for (int i = 0; i < lineno && std::getline(in, line); i++)
    {
    }

    return line;
}
}

namespace wirebase
{
namespace ini
{

ParseResult parse_text(const std::string& text)
{
    Collector collector;
    int rc = ini_parse_string(text.c_str(), collect, &collector);
    ParseResult rval;

    if (rc == 0)
    {
        rval.config = std::move(collector.config);
        rval.errors = std::move(collector.errors);
    }
    else if (rc > 0)
    {
        rval.errors.push_back(string_printf("Syntax error at line %i (%s).", rc, line_of(text, rc).c_str()));
    }
    else
    {
        rval.errors.push_back("Parser memory allocation error.");
    }

    return rval;
}

ParseResult parse_file(const std::string& filename)
{
    std::ifstream file(filename);

    if (!file)
    {
        int eno = errno;
        ParseResult rval;
        rval.errors.push_back(string_printf("Failed to open '%s': %d, %s",
                                            filename.c_str(), eno, wxb_strerror(eno)));
        return rval;
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad())
    {
        ParseResult rval;
        rval.errors.push_back(string_printf("Failed to read '%s'.", filename.c_str()));
        return rval;
    }

    return parse_text(ss.str());
}

std::vector<std::string> substitute_env_vars(Config& config)
{
    std::vector<std::string> errors;

    for (auto& section : config)
    {
        for (auto& setting : section.second)
        {
            std::string& value = setting.second;

            if (value.length() < 2 || value[0] != '$')
            {
                continue;
            }

            if (const char* env_value = getenv(value.c_str() + 1))
            {
                value = env_value;
            }
            else
            {
                errors.push_back(string_printf("Setting '%s' in section '%s' refers to environment "
                                               "variable '%s', which is not set.",
                                               setting.first.c_str(), section.first.c_str(),
                                               value.c_str() + 1));
            }
        }
    }

    return errors;
}
}
}
