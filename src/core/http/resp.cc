//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    resp.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "http/resp.h"
#include "http/cb.h"
#include "support/ndebug.h"
#include "support/trace.h"
#include "http_parser.h"
#include <string.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
resp::resp(void):
        m_http_parser_settings(nullptr),
        m_http_parser(nullptr),
        m_save(false),
        m_complete(false),
        m_status(0),
        m_http_major(0),
        m_http_minor(0),
        m_body_len(0),
        m_status_str(),
        m_headers(),
        m_header_val_last(false),
        m_body(),
        m_last_error()
{
        m_http_parser_settings = new http_parser_settings();
        m_http_parser = new http_parser();
        init(m_save);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
resp::~resp(void)
{
        if (m_http_parser_settings)
        {
                delete m_http_parser_settings;
                m_http_parser_settings = nullptr;
        }
        if (m_http_parser)
        {
                delete m_http_parser;
                m_http_parser = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: reset for a new response
//! \return:  NA
//! \param:   a_save: save status line, headers and body for display
//! ----------------------------------------------------------------------------
void resp::init(bool a_save)
{
        m_save = a_save;
        m_complete = false;
        m_status = 0;
        m_http_major = 0;
        m_http_minor = 0;
        m_body_len = 0;
        m_status_str.clear();
        m_headers.clear();
        m_header_val_last = false;
        m_body.clear();
        m_last_error.clear();
        http_parser_settings_init(m_http_parser_settings);
        m_http_parser_settings->on_status = hp_on_status;
        m_http_parser_settings->on_headers_complete = hp_on_headers_complete;
        m_http_parser_settings->on_body = hp_on_body;
        m_http_parser_settings->on_message_complete = hp_on_message_complete;
        if (m_save)
        {
                m_http_parser_settings->on_message_begin = hp_on_message_begin;
                m_http_parser_settings->on_header_field = hp_on_header_field;
                m_http_parser_settings->on_header_value = hp_on_header_value;
        }
        http_parser_init(m_http_parser, HTTP_RESPONSE);
        m_http_parser->data = this;
}
//! ----------------------------------------------------------------------------
//! \details: feed bytes read off the connection
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on parse error
//! \param:   a_buf: bytes
//! \param:   a_len: length
//! ----------------------------------------------------------------------------
int32_t resp::parse(const char *a_buf, size_t a_len)
{
        size_t l_parse_status = 0;
        l_parse_status = http_parser_execute(m_http_parser,
                                             m_http_parser_settings,
                                             a_buf,
                                             a_len);
        // bytes after a complete message are ignored -Connection: close
        if (m_complete)
        {
                return HLAT_STATUS_OK;
        }
        if ((l_parse_status < a_len) ||
           (HTTP_PARSER_ERRNO(m_http_parser) != HPE_OK))
        {
                m_last_error = "parse error. Reason: ";
                m_last_error += http_errno_name((enum http_errno)m_http_parser->http_errno);
                m_last_error += ": ";
                m_last_error += http_errno_description((enum http_errno)m_http_parser->http_errno);
                TRC_ERROR("%s\n", m_last_error.c_str());
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: signal end of stream -completes close delimited bodies
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR if message
//!           truncated
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t resp::parse_eof(void)
{
        if (m_complete)
        {
                return HLAT_STATUS_OK;
        }
        http_parser_execute(m_http_parser,
                            m_http_parser_settings,
                            nullptr,
                            0);
        if (!m_complete)
        {
                m_last_error = "connection closed before response complete";
                if (HTTP_PARSER_ERRNO(m_http_parser) != HPE_OK)
                {
                        m_last_error += ". Reason: ";
                        m_last_error += http_errno_description((enum http_errno)m_http_parser->http_errno);
                }
                TRC_ERROR("%s\n", m_last_error.c_str());
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void resp::show(bool a_color) const
{
        if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_BLUE);
        TRC_OUTPUT("HTTP/%d.%d %u ", m_http_major, m_http_minor, m_status);
        if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_GREEN);
        TRC_OUTPUT("%s", m_status_str.c_str());
        if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_OFF);
        TRC_OUTPUT("\r\n");
        for (header_list_t::const_iterator i_h = m_headers.begin();
             i_h != m_headers.end();
             ++i_h)
        {
                if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_BLUE);
                TRC_OUTPUT("%s", i_h->first.c_str());
                if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_OFF);
                TRC_OUTPUT(": ");
                if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_GREEN);
                TRC_OUTPUT("%s", i_h->second.c_str());
                if (a_color) TRC_OUTPUT("%s", ANSI_COLOR_OFF);
                TRC_OUTPUT("\r\n");
        }
        TRC_OUTPUT("\r\n");
        if (!m_body.empty())
        {
                TRC_OUTPUT("%.*s\r\n", (int)m_body.length(), m_body.data());
        }
}
} //namespace ns_hlat {
