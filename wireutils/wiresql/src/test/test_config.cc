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

// To ensure that wxb_assert asserts also when building in non-debug mode.
#if !defined (SS_DEBUG)
#define SS_DEBUG
#endif
#if defined (NDEBUG)
#undef NDEBUG
#endif
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <wirebase/log.hh>
#include <wiresql/config.hh>

using namespace wiresql;

namespace
{
int fails = 0;

void test(bool result, int line)
{
    if (!result)
    {
        fails++;
        printf("Test failure on line %i\n", line);
    }
}

#define TEST(t) test(t, __LINE__)

std::vector<std::string> errors;

bool capture(int level, std::string_view msg)
{
    if (level == LOG_ERR)
    {
        errors.emplace_back(msg);
    }

    return true;
}

void test_defaults()
{
    printf("Testing defaults\n");
    CodecConfig config;

    TEST(config.charset_name() == "utf8mb4");
    TEST(config.max_packet_size() == 16777215);
    TEST(config.log_target() == WXB_LOG_TARGET_STDOUT);
    TEST(config.logdir() == ".");
    TEST(!config.log_info());
    TEST(!config.log_debug());
    TEST(!config.log_syslog());
    TEST(!config.log_highprecision());

    // An empty configuration is valid.
    TEST(config.parse(""));
}

void test_valid()
{
    printf("Testing a valid configuration\n");
    CodecConfig config;
    bool ok = config.parse(R"(
[codec]
charset = latin1
max_packet_size = 1024

[log]
target=file
logdir=/var/log/sqlwire
info=yes
debug=off
syslog=true
highprecision=1
throttling = 5, 100, 200
)");

    TEST(ok);
    TEST(config.charset_name() == "latin1");
    TEST(config.charset().iconv_name() == "CP1252");
    TEST(config.max_packet_size() == 1024);
    TEST(config.log_target() == WXB_LOG_TARGET_FS);
    TEST(config.logdir() == "/var/log/sqlwire");
    TEST(config.log_info());
    TEST(!config.log_debug());
    TEST(config.log_syslog());
    TEST(config.log_highprecision());
    TEST(config.log_throttling().count == 5);
    TEST(config.log_throttling().window_ms == 100);
    TEST(config.log_throttling().suppress_ms == 200);
}

void test_invalid()
{
    printf("Testing invalid configurations\n");
    const char* invalid[] =
    {
        "[codec]\ncharset=klingon\n",
        "[codec]\nmax_packet_size=0\n",
        "[codec]\nmax_packet_size=16777216\n",
        "[codec]\nmax_packet_size=-5\n",
        "[codec]\nunknown=1\n",
        "[log]\ntarget=network\n",
        "[log]\ninfo=sometimes\n",
        "[log]\nthrottling=1,2\n",
        "[log]\nthrottling=1,2,x\n",
        "[server]\naddress=localhost\n",
        "[codec]\ncharset=latin1\ncharset=utf8\n",
        "[codec\ncharset=latin1\n",
        "charset=latin1\n",
    };

    for (auto text : invalid)
    {
        CodecConfig config;
        errors.clear();

        if (config.parse(text))
        {
            printf("Configuration was accepted:\n%s\n", text);
            fails++;
        }
        else if (errors.empty())
        {
            printf("No error was logged for:\n%s\n", text);
            fails++;
        }
    }

    // Each bad setting is reported once.
    const char* once[] =
    {
        "[codec]\nunknown=1\n",
        "[codec]\ncharset=klingon\n",
        "[log]\ntarget=network\n",
    };

    for (auto text : once)
    {
        CodecConfig config;
        errors.clear();
        TEST(!config.parse(text));

        if (errors.size() != 1)
        {
            printf("Expected one error, got %zu for:\n%s\n", errors.size(), text);
            fails++;
        }
    }

    errors.clear();
    CodecConfig unknown;
    unknown.parse("[log]\nverbose=true\n");
    TEST(errors.size() == 1 && errors[0].find("Unknown setting 'verbose'") != std::string::npos);

    // A failed load changes nothing.
    CodecConfig config;
    TEST(!config.parse("[codec]\ncharset=latin1\nmax_packet_size=abc\n"));
    TEST(config.charset_name() == "utf8mb4");
    TEST(config.max_packet_size() == 16777215);
}

void test_file()
{
    printf("Testing configuration files\n");
    std::string path = "/tmp/test_config_" + std::to_string(getpid()) + ".cnf";

    {
        std::ofstream out(path);
        out << "# Codec settings\n"
            << "[codec]\n"
            << "charset=$TEST_CONFIG_CHARSET\n";
    }

    setenv("TEST_CONFIG_CHARSET", "ucs2", 1);

    CodecConfig config;
    TEST(config.load(path));
    TEST(config.charset_name() == "ucs2");

    unsetenv("TEST_CONFIG_CHARSET");
    errors.clear();
    TEST(!config.load(path));
    TEST(errors.size() == 1);

    remove(path.c_str());

    errors.clear();
    TEST(!config.load(path));
    TEST(!errors.empty());
}

void test_overrides()
{
    printf("Testing overrides\n");
    CodecConfig config;

    TEST(config.set_charset("UTF16LE"));
    TEST(config.charset_name() == "utf16le");

    errors.clear();
    TEST(!config.set_charset("klingon"));
    TEST(config.charset_name() == "utf16le");
    TEST(errors.size() == 1);

    config.set_log_debug(true);
    TEST(config.log_debug());

    config.apply_log_settings();
    TEST(wxb_log_is_priority_enabled(LOG_DEBUG));
    TEST(wxb_log_is_priority_enabled(LOG_INFO));

    config.set_log_debug(false);
    config.apply_log_settings();
    TEST(!wxb_log_is_priority_enabled(LOG_DEBUG));
    TEST(!wxb_log_is_priority_enabled(LOG_INFO));

    TEST(config.parse("[log]\nsyslog=true\nhighprecision=true\nthrottling=3,50,70\n"));
    config.apply_log_settings();
    TEST(wxb_log_is_syslog_enabled());
    TEST(wxb_log_is_highprecision_enabled());

    WXB_LOG_THROTTLING throttling;
    wxb_log_get_throttling(&throttling);
    TEST(throttling.count == 3 && throttling.window_ms == 50 && throttling.suppress_ms == 70);

    TEST(config.parse("[log]\nsyslog=false\nhighprecision=false\nthrottling=0,0,0\n"));
    config.apply_log_settings();
    TEST(!wxb_log_is_syslog_enabled());
    TEST(!wxb_log_is_highprecision_enabled());
    wxb_log_get_throttling(&throttling);
    TEST(throttling.count == 0);
}
}

int main(int argc, char* argv[])
{
    wxb::LogRedirect redirect(capture);

    test_defaults();
    test_valid();
    test_invalid();
    test_file();
    test_overrides();

    return fails;
}
