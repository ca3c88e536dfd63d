//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nlookup.h
//! \details: blocking name resolution
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_NLOOKUP_H
#define _HLAT_NLOOKUP_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
#include <sys/socket.h>
#include <string>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
struct host_info;
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
bool is_ip_literal(const std::string &a_host);
int32_t nlookup(const std::string &a_host,
                uint16_t a_port,
                host_info &ao_host_info,
                int a_ai_family = AF_UNSPEC,
                std::string *ao_error = nullptr);
} //namespace ns_hlat {
#endif
