//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    cb.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "http/cb.h"
#include "http/resp.h"
#include "http_parser.h"
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#define CHECK_FOR_NULL_OK(_data) \
        do {\
                if (!_data) {\
                        return 0;\
                }\
        } while(0)
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_message_begin(http_parser* a_parser)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_status(http_parser* a_parser, const char *a_at, size_t a_length)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        l_resp->m_status = (uint16_t)a_parser->status_code;
        if (l_resp->m_save)
        {
                l_resp->m_status_str.append(a_at, a_length);
        }
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: field may arrive in pieces across reads
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_header_field(http_parser* a_parser, const char *a_at, size_t a_length)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        if (l_resp->m_save)
        {
                if (l_resp->m_headers.empty() ||
                   l_resp->m_header_val_last)
                {
                        l_resp->m_headers.push_back(header_t());
                }
                l_resp->m_headers.back().first.append(a_at, a_length);
                l_resp->m_header_val_last = false;
        }
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_header_value(http_parser* a_parser, const char *a_at, size_t a_length)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        if (l_resp->m_save &&
           !l_resp->m_headers.empty())
        {
                l_resp->m_headers.back().second.append(a_at, a_length);
                l_resp->m_header_val_last = true;
        }
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_headers_complete(http_parser* a_parser)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        l_resp->m_http_major = a_parser->http_major;
        l_resp->m_http_minor = a_parser->http_minor;
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: body is counted -saved only for display
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_body(http_parser* a_parser, const char *a_at, size_t a_length)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        l_resp->m_body_len += a_length;
        if (l_resp->m_save)
        {
                l_resp->m_body.append(a_at, a_length);
        }
        return 0;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int hp_on_message_complete(http_parser* a_parser)
{
        resp *l_resp = static_cast <resp *>(a_parser->data);
        CHECK_FOR_NULL_OK(l_resp);
        l_resp->m_complete = true;
        return 0;
}
} //namespace ns_hlat {
