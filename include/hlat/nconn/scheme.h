//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    scheme.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_SCHEME_H
#define _HLAT_SCHEME_H
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! enums
//! ----------------------------------------------------------------------------
typedef enum scheme_enum {
        SCHEME_TCP = 0,
        SCHEME_TLS,
        SCHEME_NONE
} scheme_t;
} //namespace ns_hlat {
#endif
