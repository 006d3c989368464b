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
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <wirebase/log.hh>

#if defined (SS_DEBUG)

#define wxb_assert(exp) \
        do {if (exp) {} else { \
                const char* wxb_impl_debug_expr = #exp; \
                fprintf(stderr, \
                        "debug assert at %s:%d failed: %s\n", \
                        (char*)__FILE__, \
                        __LINE__, \
                        wxb_impl_debug_expr); \
                if (wxb_log_inited()) { \
                    WXB_ERROR("debug assert at %s:%d failed: %s\n", (char*)__FILE__, __LINE__, \
                              wxb_impl_debug_expr); \
                } \
                raise(SIGABRT);}} while (false)

#define WXB_AT_DEBUG(exp) exp

#else /* SS_DEBUG */

#define wxb_assert(exp)

#define WXB_AT_DEBUG(exp)
#endif /* SS_DEBUG */
