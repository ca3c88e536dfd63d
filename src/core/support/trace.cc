//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    trace.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "support/trace.h"
#include <ctype.h>
#include <errno.h>
#include <string.h>
#include <strings.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! Externs
//! ----------------------------------------------------------------------------
trc_log_level_t g_trc_log_level = TRC_LOG_LEVEL_NONE;
FILE* g_trc_log_file = stdout;
FILE* g_trc_out_file = stdout;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void trc_log_level_set(trc_log_level_t a_level)
{
        g_trc_log_level = a_level;
}
//! ----------------------------------------------------------------------------
//! \details: Open trace log file for appending
//! \return:  HLAT_STATUS_OK on success HLAT_STATUS_ERROR on failure
//! \param:   a_file: path to log file
//! ----------------------------------------------------------------------------
int32_t trc_log_file_open(const std::string &a_file)
{
        // WARNING DON'T USE TRC MACROS HERE -WILL BE RECURSIVE
        FILE *l_file = fopen(a_file.c_str(), "a");
        if (!l_file)
        {
                fprintf(stderr, "Error opening trace logging file: %s. Reason: %s\n",
                        a_file.c_str(),
                        strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        g_trc_log_file = l_file;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t trc_log_file_close(void)
{
        if (!g_trc_log_file ||
           (g_trc_log_file == stdout) ||
           (g_trc_log_file == stderr))
        {
                return HLAT_STATUS_OK;
        }
        int l_s;
        l_s = fclose(g_trc_log_file);
        g_trc_log_file = nullptr;
        if (l_s != 0)
        {
                fprintf(stderr, "Error closing trace logging file. Reason: %s\n",
                        strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! level strings
//! ----------------------------------------------------------------------------
#ifndef ARRAY_SIZE
  #define ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))
#endif
#ifndef ELEM_AT
  #define ELEM_AT(a, i, v) ((unsigned int) (i) < ARRAY_SIZE(a) ? (a)[(i)] : (v))
#endif
static const char *s_trc_log_level_strs[] =
{
#define XX(num, name, string) #string,
        TRC_LOG_LEVEL_MAP(XX)
#undef XX
};
static const char *s_trc_log_level_names[] =
{
#define XX(num, name, string) #name,
        TRC_LOG_LEVEL_MAP(XX)
#undef XX
};
const char *trc_log_level_str(trc_log_level_t a_level)
{
        return ELEM_AT(s_trc_log_level_strs, a_level, "?");
}
//! ----------------------------------------------------------------------------
//! \details: map a level name (case insensitive) ie "debug" to level
//! \return:  HLAT_STATUS_OK on match HLAT_STATUS_ERROR otherwise
//! \param:   a_str: level name
//! \param:   ao_level: matched level
//! ----------------------------------------------------------------------------
int32_t trc_log_level_parse(const char *a_str, trc_log_level_t &ao_level)
{
        if (!a_str)
        {
                return HLAT_STATUS_ERROR;
        }
        for (uint32_t i_l = 0; i_l < ARRAY_SIZE(s_trc_log_level_names); ++i_l)
        {
                if (strcasecmp(a_str, s_trc_log_level_names[i_l]) == 0)
                {
                        ao_level = (trc_log_level_t)i_l;
                        return HLAT_STATUS_OK;
                }
        }
        return HLAT_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: hex dump
//! \return:  NA
//! \param:   TODO
//! ----------------------------------------------------------------------------
void trc_mem_display(FILE *a_file, const uint8_t* a_mem_buf, uint32_t a_length)
{
        char l_display_line[256] = "";
        unsigned int l_bytes_displayed = 0;
        char l_byte_display[8] = "";
        char l_ascii_display[17]="";
        while (l_bytes_displayed < a_length)
        {
                unsigned int l_col = 0;
                snprintf(l_display_line, sizeof(l_display_line), "0x%08X ", l_bytes_displayed);
                strcat(l_display_line, " ");
                while ((l_col < 16) && (l_bytes_displayed < a_length))
                {
                        snprintf(l_byte_display, sizeof(l_byte_display), "%02X", (unsigned char) a_mem_buf[l_bytes_displayed]);
                        strcat(l_display_line, l_byte_display);
                        if (isprint(a_mem_buf[l_bytes_displayed]))
                                l_ascii_display[l_col] = a_mem_buf[l_bytes_displayed];
                        else
                                l_ascii_display[l_col] = '.';
                        l_col++;
                        l_bytes_displayed++;
                        if (!(l_col % 4))
                                strcat(l_display_line, " ");
                }
                if ((l_col < 16) && (l_bytes_displayed >= a_length))
                {
                        while (l_col < 16)
                        {
                                strcat(l_display_line, "..");
                                l_ascii_display[l_col] = '.';
                                l_col++;
                                if (!(l_col % 4))
                                        strcat(l_display_line, " ");
                        }
                }
                l_ascii_display[l_col] = '\0';
                strcat(l_display_line, " ");
                strcat(l_display_line, l_ascii_display);
                fprintf(a_file, "%s\n", l_display_line);
        }
}
} // namespace ns_hlat {
