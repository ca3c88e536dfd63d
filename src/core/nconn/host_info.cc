//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    host_info.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "nconn/host_info.h"
#include "support/trace.h"
#include <netdb.h>
#include <netinet/in.h>
#include <stdio.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
host_info::host_info():
        m_sa(),
        m_sa_len(sizeof(struct sockaddr_in)),
        m_sock_family(AF_INET),
        m_sock_type(SOCK_STREAM),
        m_sock_protocol(IPPROTO_TCP)
{
        ((struct sockaddr_in *)(&m_sa))->sin_family = AF_INET;
};
//! ----------------------------------------------------------------------------
//! \details: numeric "address:port" string
//! \return:  address string -empty on failure
//! \param:   NA
//! ----------------------------------------------------------------------------
std::string host_info::get_addr_str(void) const
{
        char l_hoststr[NI_MAXHOST] = "";
        char l_portstr[NI_MAXSERV] = "";
        int32_t l_s;
        l_s = getnameinfo((const struct sockaddr *)&m_sa,
                          m_sa_len,
                          l_hoststr,
                          sizeof(l_hoststr),
                          l_portstr,
                          sizeof(l_portstr),
                          NI_NUMERICHOST | NI_NUMERICSERV);
        if (l_s != 0)
        {
                TRC_ERROR("getnameinfo failed. Reason: %s\n", gai_strerror(l_s));
                return std::string();
        }
        std::string l_str;
        if (m_sock_family == AF_INET6)
        {
                l_str += "[";
                l_str += l_hoststr;
                l_str += "]";
        }
        else
        {
                l_str += l_hoststr;
        }
        l_str += ":";
        l_str += l_portstr;
        return l_str;
}
} //namespace ns_hlat {
