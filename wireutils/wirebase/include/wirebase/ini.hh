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
#include <map>
#include <string>
#include <vector>

/**
 * @file ini.hh
 *
 * Reading of INI files with inih. Section and setting names are case sensitive and
 * must be unique. Settings must be inside a section. A line that starts with
 * whitespace continues the value of the previous setting.
 */

namespace wirebase
{
namespace ini
{

// Values by setting name.
using Settings = std::map<std::string, std::string>;

// Settings by section name.
using Config = std::map<std::string, Settings>;

struct ParseResult
{
    Config                   config;
    std::vector<std::string> errors;    // Empty if the text was valid.
};

/**
 * Parse configuration text.
 *
 * On a syntax error, the result contains only the error. Duplicates and settings outside
 * sections are reported as errors, and the rest of the text is still parsed.
 */
ParseResult parse_text(const std::string& text);

/**
 * Parse a configuration file.
 *
 * @see parse_text
 */
ParseResult parse_file(const std::string& filename);

/**
 * Replace values of the form "$NAME" with the value of the environment variable NAME.
 *
 * @return Errors for variables that were not set. Such values are left as they are.
 */
std::vector<std::string> substitute_env_vars(Config& config);
}
}
