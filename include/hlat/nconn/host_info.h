//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    host_info.h
//! \details: resolved address of a host
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_HOST_INFO_H
#define _HLAT_HOST_INFO_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <sys/socket.h>
#include <string>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! host info
//! ----------------------------------------------------------------------------
struct host_info {
        struct sockaddr_storage m_sa;
        int m_sa_len;
        int m_sock_family;
        int m_sock_type;
        int m_sock_protocol;
        host_info();
        std::string get_addr_str(void) const;
};
} //namespace ns_hlat {
#endif
