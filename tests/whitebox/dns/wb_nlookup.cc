//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_nlookup.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "catch2/catch.hpp"
#include "status.h"
#include "dns/nlookup.h"
#include "nconn/host_info.h"
#include <sys/socket.h>
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "ip literal", "[nlookup]" )
{
        SECTION("literals")
        {
                REQUIRE((ns_hlat::is_ip_literal("127.0.0.1") == true));
                REQUIRE((ns_hlat::is_ip_literal("::1") == true));
                REQUIRE((ns_hlat::is_ip_literal("fe80::1") == true));
        }
        SECTION("names")
        {
                REQUIRE((ns_hlat::is_ip_literal("") == false));
                REQUIRE((ns_hlat::is_ip_literal("localhost") == false));
                REQUIRE((ns_hlat::is_ip_literal("example.com") == false));
                REQUIRE((ns_hlat::is_ip_literal("127.0.0.1.example.com") == false));
        }
}
TEST_CASE( "nlookup", "[nlookup]" )
{
        SECTION("literal v4")
        {
                ns_hlat::host_info l_h;
                int32_t l_s;
                l_s = ns_hlat::nlookup("127.0.0.1", 8080, l_h);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_h.m_sock_family == AF_INET));
                REQUIRE((l_h.m_sock_type == SOCK_STREAM));
                REQUIRE((l_h.get_addr_str() == "127.0.0.1:8080"));
        }
        SECTION("literal v6")
        {
                ns_hlat::host_info l_h;
                int32_t l_s;
                l_s = ns_hlat::nlookup("::1", 443, l_h, AF_INET6);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_h.m_sock_family == AF_INET6));
                REQUIRE((l_h.get_addr_str() == "[::1]:443"));
        }
        SECTION("family mismatch")
        {
                ns_hlat::host_info l_h;
                int32_t l_s;
                l_s = ns_hlat::nlookup("127.0.0.1", 80, l_h, AF_INET6);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
        }
        SECTION("unresolvable")
        {
                ns_hlat::host_info l_h;
                std::string l_err;
                int32_t l_s;
                l_s = ns_hlat::nlookup("nonexistent.invalid", 80, l_h, AF_UNSPEC, &l_err);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                REQUIRE((l_err.find("nonexistent.invalid") != std::string::npos));
        }
}
