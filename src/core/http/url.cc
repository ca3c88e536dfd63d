//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    url.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "http/url.h"
#include "support/trace.h"
#include "http_parser.h"
#include <stdio.h>
#include <stdlib.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string url_struct::target(void) const
{
        std::string l_target = m_path;
        if (l_target.empty())
        {
                l_target = "/";
        }
        if (!m_query.empty())
        {
                l_target += "?";
                l_target += m_query;
        }
        return l_target;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string url_struct::host_hdr(void) const
{
        std::string l_host = m_host;
        // ipv6 literal
        if (l_host.find(':') != std::string::npos)
        {
                l_host = "[" + l_host + "]";
        }
        if (((m_scheme == SCHEME_TCP) && (m_port == 80)) ||
           ((m_scheme == SCHEME_TLS) && (m_port == 443)))
        {
                return l_host;
        }
        l_host += ":";
        l_host += std::to_string(m_port);
        return l_host;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t parse_url(const std::string &a_url,
                  url_t &ao_url,
                  std::string *ao_error)
{
#define _SET_URL_ERROR(...) do { \
        char _buf[512]; \
        snprintf(_buf, sizeof(_buf), __VA_ARGS__); \
        TRC_ERROR("%s\n", _buf); \
        if (ao_error) { ao_error->assign(_buf); } \
} while(0)
        ao_url = url_t();
        if (a_url.empty())
        {
                _SET_URL_ERROR("url is empty");
                return HLAT_STATUS_ERROR;
        }
        std::string l_url_fixed = a_url;
        // Find scheme prefix "://"
        if (a_url.find("://", 0) == std::string::npos)
        {
                l_url_fixed = "http://" + a_url;
        }
        http_parser_url l_url;
        http_parser_url_init(&l_url);
        int l_status;
        l_status = http_parser_parse_url(l_url_fixed.c_str(), l_url_fixed.length(), 0, &l_url);
        if (l_status != 0)
        {
                _SET_URL_ERROR("error parsing url: %s", a_url.c_str());
                return HLAT_STATUS_ERROR;
        }
        for(uint32_t i_part = 0; i_part < UF_MAX; ++i_part)
        {
                if (!(l_url.field_set & (1 << i_part)) ||
                   ((l_url.field_data[i_part].len + l_url.field_data[i_part].off) > l_url_fixed.length()))
                {
                        continue;
                }
                std::string l_part = l_url_fixed.substr(l_url.field_data[i_part].off, l_url.field_data[i_part].len);
                switch(i_part)
                {
                case UF_SCHEMA:
                {
                        if (l_part == "http")
                        {
                                ao_url.m_scheme = SCHEME_TCP;
                        }
                        else if (l_part == "https")
                        {
                                ao_url.m_scheme = SCHEME_TLS;
                        }
                        else
                        {
                                _SET_URL_ERROR("scheme[%s] is unsupported", l_part.c_str());
                                return HLAT_STATUS_ERROR;
                        }
                        break;
                }
                case UF_HOST:
                {
                        ao_url.m_host = l_part;
                        break;
                }
                case UF_PORT:
                {
                        unsigned long l_port = strtoul(l_part.c_str(), nullptr, 10);
                        if ((l_port == 0) ||
                           (l_port > 65535))
                        {
                                _SET_URL_ERROR("invalid port: %s", l_part.c_str());
                                return HLAT_STATUS_ERROR;
                        }
                        ao_url.m_port = (uint16_t)l_port;
                        break;
                }
                case UF_PATH:
                {
                        ao_url.m_path = l_part;
                        break;
                }
                case UF_QUERY:
                {
                        ao_url.m_query = l_part;
                        break;
                }
                default:
                {
                        break;
                }
                }
        }
        if (ao_url.m_host.empty())
        {
                _SET_URL_ERROR("url has no host: %s", a_url.c_str());
                return HLAT_STATUS_ERROR;
        }
        // Default ports
        if (!ao_url.m_port)
        {
                ao_url.m_port = (ao_url.m_scheme == SCHEME_TLS) ? 443 : 80;
        }
        if (ao_url.m_path.empty())
        {
                ao_url.m_path = "/";
        }
#undef _SET_URL_ERROR
        return HLAT_STATUS_OK;
}
} //namespace ns_hlat {
