//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    cb.h
//! \details: http_parser callbacks
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_CB_H
#define _HLAT_CB_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stddef.h>
//! ----------------------------------------------------------------------------
//! External Fwd Decl's
//! ----------------------------------------------------------------------------
struct http_parser;
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! callbacks
//! ----------------------------------------------------------------------------
int hp_on_message_begin(http_parser* a_parser);
int hp_on_status(http_parser* a_parser, const char *a_at, size_t a_length);
int hp_on_header_field(http_parser* a_parser, const char *a_at, size_t a_length);
int hp_on_header_value(http_parser* a_parser, const char *a_at, size_t a_length);
int hp_on_headers_complete(http_parser* a_parser);
int hp_on_body(http_parser* a_parser, const char *a_at, size_t a_length);
int hp_on_message_complete(http_parser* a_parser);
} //namespace ns_hlat {
#endif
