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

/**
 * @file ccdefs.hh
 *
 * Included first by every wirebase and wiresql header. Settings that must be in effect
 * before any system header is read belong here.
 */

#if !defined (__cplusplus)
#error wirebase requires a C++ compiler.
#endif

// program_invocation_short_name and the GNU strerror_r need this.
#undef _GNU_SOURCE
#define _GNU_SOURCE 1

#include <cstddef>
#include <cstdint>
#include <string>

#ifdef __GNUC__
#define wxb_attribute(a) __attribute__ (a)
#else
#define wxb_attribute(a)
#endif

namespace wirebase
{
}

namespace wxb = wirebase;
