//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    ndebug.h
//! \details: debug print and color macros
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_NDEBUG_H
#define _HLAT_NDEBUG_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
#include <stdio.h>
//! ----------------------------------------------------------------------------
//! ANSI Color Code Strings
//!
//! Taken from:
//! http://pueblo.sourceforge.net/doc/manual/ansi_color_codes.html
//! ----------------------------------------------------------------------------
#define ANSI_COLOR_OFF          "\033[0m"
#define ANSI_COLOR_FG_RED       "\033[01;31m"
#define ANSI_COLOR_FG_GREEN     "\033[01;32m"
#define ANSI_COLOR_FG_YELLOW    "\033[01;33m"
#define ANSI_COLOR_FG_BLUE      "\033[01;34m"
#define ANSI_COLOR_FG_MAGENTA   "\033[01;35m"
#define ANSI_COLOR_FG_CYAN      "\033[01;36m"
#define ANSI_COLOR_FG_WHITE     "\033[01;37m"
//! ----------------------------------------------------------------------------
//! debug macros
//! ----------------------------------------------------------------------------
#ifndef NDBG_PRINT
#define NDBG_PRINT(...) \
        do { \
                fprintf(stdout, "%s:%s.%d: ", __FILE__, __FUNCTION__, __LINE__); \
                fprintf(stdout, __VA_ARGS__);               \
                fflush(stdout); \
        } while(0)
#endif
//! ----------------------------------------------------------------------------
//! Macros
//! ----------------------------------------------------------------------------
#ifndef CHECK_FOR_NULL_ERROR
#define CHECK_FOR_NULL_ERROR(_data) \
        do {\
                if (!_data) {\
                        return HLAT_STATUS_ERROR;\
                }\
        } while(0)
#endif
#endif
