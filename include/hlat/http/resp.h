//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    resp.h
//! \details: http response -parsed incrementally by http_parser
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_RESP_H
#define _HLAT_RESP_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <list>
#include <utility>
//! ----------------------------------------------------------------------------
//! External Fwd Decl's
//! ----------------------------------------------------------------------------
struct http_parser_settings;
struct http_parser;
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef std::pair<std::string, std::string> header_t;
typedef std::list<header_t> header_list_t;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class resp
{
public:
        // -------------------------------------------------
        // Public methods
        // -------------------------------------------------
        resp();
        ~resp();
        void init(bool a_save);
        int32_t parse(const char *a_buf, size_t a_len);
        int32_t parse_eof(void);
        // Getters
        uint16_t get_status(void) const { return m_status; }
        uint64_t get_body_len(void) const { return m_body_len; }
        const std::string &get_last_error(void) const { return m_last_error; }
        // Debug
        void show(bool a_color = false) const;
        // -------------------------------------------------
        // Public members
        // -------------------------------------------------
        http_parser_settings *m_http_parser_settings;
        http_parser *m_http_parser;
        bool m_save;
        bool m_complete;
        uint16_t m_status;
        int m_http_major;
        int m_http_minor;
        uint64_t m_body_len;
        // saved only when m_save
        std::string m_status_str;
        header_list_t m_headers;
        bool m_header_val_last;
        std::string m_body;
private:
        // -------------------------------------------------
        // Private methods
        // -------------------------------------------------
        // Disallow copy/assign
        resp& operator=(const resp &);
        resp(const resp &);
        // -------------------------------------------------
        // Private members
        // -------------------------------------------------
        std::string m_last_error;
};
} //namespace ns_hlat {
#endif
