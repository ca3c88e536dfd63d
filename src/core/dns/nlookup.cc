//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nlookup.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "dns/nlookup.h"
#include "nconn/host_info.h"
#include "support/trace.h"
#include <unistd.h>
#include <netdb.h>
#include <string.h>
// for inet_pton
#include <arpa/inet.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: true if host is a literal IPv4 or IPv6 address -no resolution
//!           required
//! \return:  TODO
//! \param:   a_host: host (without brackets)
//! ----------------------------------------------------------------------------
bool is_ip_literal(const std::string &a_host)
{
        if (a_host.empty())
        {
                return false;
        }
        struct in_addr l_in4;
        struct in6_addr l_in6;
        if (inet_pton(AF_INET, a_host.c_str(), &l_in4) == 1)
        {
                return true;
        }
        if (inet_pton(AF_INET6, a_host.c_str(), &l_in6) == 1)
        {
                return true;
        }
        return false;
}
//! ----------------------------------------------------------------------------
//! \details: slow resolution -blocks calling thread in getaddrinfo
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on failure
//! \param:   a_host: host name or literal address
//! \param:   a_port: port to set in resolved address
//! \param:   ao_host_info: resolved address
//! \param:   a_ai_family: AF_INET/AF_INET6 to restrict, AF_UNSPEC prefers IPv4
//! \param:   ao_error: optional failure reason
//! ----------------------------------------------------------------------------
int32_t nlookup(const std::string &a_host,
                uint16_t a_port,
                host_info &ao_host_info,
                int a_ai_family,
                std::string *ao_error)
{
        ao_host_info.m_sa_len = sizeof(ao_host_info.m_sa);
        memset((void*) &(ao_host_info.m_sa), 0, ao_host_info.m_sa_len);
        // -------------------------------------------------
        // get address...
        // -------------------------------------------------
        struct addrinfo l_hints;
        memset(&l_hints, 0, sizeof(l_hints));
        l_hints.ai_family = a_ai_family;
        l_hints.ai_socktype = SOCK_STREAM;
        if (is_ip_literal(a_host))
        {
                l_hints.ai_flags |= AI_NUMERICHOST;
        }
        char l_portstr[10];
        snprintf(l_portstr, sizeof(l_portstr), "%d", (int) a_port);
        struct addrinfo* l_addrinfo = nullptr;
        int l_gaierr;
        l_gaierr = getaddrinfo(a_host.c_str(), l_portstr, &l_hints, &l_addrinfo);
        if (l_gaierr != 0)
        {
                TRC_ERROR("getaddrinfo '%s': %s\n", a_host.c_str(), gai_strerror(l_gaierr));
                if (ao_error)
                {
                        ao_error->assign("address lookup failed for host: ");
                        ao_error->append(a_host);
                        ao_error->append(". Reason: ");
                        ao_error->append(gai_strerror(l_gaierr));
                }
                return HLAT_STATUS_ERROR;
        }
        // Find the first IPv4 and IPv6 entries.
        struct addrinfo* l_addrinfo_v4 = nullptr;
        struct addrinfo* l_addrinfo_v6 = nullptr;
        for (struct addrinfo* i_addrinfo = l_addrinfo;
             i_addrinfo != nullptr;
             i_addrinfo = i_addrinfo->ai_next)
        {
                if ((i_addrinfo->ai_family == AF_INET) &&
                   !l_addrinfo_v4)
                {
                        l_addrinfo_v4 = i_addrinfo;
                }
                else if ((i_addrinfo->ai_family == AF_INET6) &&
                        !l_addrinfo_v6)
                {
                        l_addrinfo_v6 = i_addrinfo;
                }
        }
        // If there's an IPv4 address, use that, otherwise try IPv6.
        struct addrinfo* l_ai = l_addrinfo_v4 ? l_addrinfo_v4 : l_addrinfo_v6;
        if (!l_ai ||
           (sizeof(ao_host_info.m_sa) < l_ai->ai_addrlen))
        {
                TRC_ERROR("no valid address found for host %s\n", a_host.c_str());
                if (ao_error)
                {
                        ao_error->assign("no valid address found for host: ");
                        ao_error->append(a_host);
                }
                freeaddrinfo(l_addrinfo);
                return HLAT_STATUS_ERROR;
        }
        ao_host_info.m_sock_family = l_ai->ai_family;
        ao_host_info.m_sock_type = l_ai->ai_socktype;
        ao_host_info.m_sock_protocol = l_ai->ai_protocol;
        ao_host_info.m_sa_len = l_ai->ai_addrlen;
        memmove(&(ao_host_info.m_sa), l_ai->ai_addr, l_ai->ai_addrlen);
        // Set the port
        if (l_ai->ai_family == AF_INET)
        {
                ((sockaddr_in *)(&(ao_host_info.m_sa)))->sin_port = htons(a_port);
        }
        else
        {
                ((sockaddr_in6 *)(&(ao_host_info.m_sa)))->sin6_port = htons(a_port);
        }
        freeaddrinfo(l_addrinfo);
        return HLAT_STATUS_OK;
}
} //namespace ns_hlat {
