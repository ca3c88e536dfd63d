//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    url.h
//! \details: target url parsing/normalization
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_URL_H
#define _HLAT_URL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "nconn/scheme.h"
#include <stdint.h>
#include <string>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: parsed url
//! ----------------------------------------------------------------------------
typedef struct url_struct
{
        scheme_t m_scheme;
        std::string m_host;
        uint16_t m_port;
        std::string m_path;
        std::string m_query;
        url_struct():
                m_scheme(SCHEME_NONE),
                m_host(),
                m_port(0),
                m_path(),
                m_query()
        {}
        // request target -path[?query]
        std::string target(void) const;
        // value for Host header -port omitted when default
        std::string host_hdr(void) const;
} url_t;
//! ----------------------------------------------------------------------------
//! \details: parse url string -defaults scheme to http when no "://" and
//!           port to 80/443 when unspecified, empty path becomes "/"
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on failure
//! \param:   a_url: url string
//! \param:   ao_url: parsed url
//! \param:   ao_error: optional reason on failure
//! ----------------------------------------------------------------------------
int32_t parse_url(const std::string &a_url,
                  url_t &ao_url,
                  std::string *ao_error = nullptr);
} //namespace ns_hlat {
#endif
