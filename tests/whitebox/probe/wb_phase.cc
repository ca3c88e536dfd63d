//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_phase.cc
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
#include "probe/phase.h"
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "derive phases", "[phase]" )
{
        SECTION("all checkpoints set")
        {
                ns_hlat::checkpoints_t l_cp;
                l_cp.m_dns_start = 1000;
                l_cp.m_dns_done = 1200;
                l_cp.m_conn_done = 1500;
                l_cp.m_got_conn = 1600;
                l_cp.m_first_byte = 2000;
                l_cp.m_done = 2600;
                ns_hlat::phase_t l_p;
                int32_t l_s;
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_p.m_dns_lookup == 200));
                REQUIRE((l_p.m_tcp_connection == 300));
                REQUIRE((l_p.m_connection_acquisition == 100));
                REQUIRE((l_p.m_server_processing == 400));
                REQUIRE((l_p.m_content_transfer == 600));
                REQUIRE((l_p.m_total == 1600));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("ip literal -no dns start")
        {
                ns_hlat::checkpoints_t l_cp;
                l_cp.m_dns_done = 1000;
                l_cp.m_conn_done = 1300;
                l_cp.m_got_conn = 1300;
                l_cp.m_first_byte = 1800;
                l_cp.m_done = 1900;
                ns_hlat::phase_t l_p;
                int32_t l_s;
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_p.m_dns_lookup == 0));
                REQUIRE((l_p.m_tcp_connection == 300));
                REQUIRE((l_p.m_connection_acquisition == 0));
                REQUIRE((l_p.m_total == 900));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("no first byte -empty body")
        {
                ns_hlat::checkpoints_t l_cp;
                l_cp.m_dns_start = 10;
                l_cp.m_dns_done = 20;
                l_cp.m_conn_done = 30;
                l_cp.m_got_conn = 40;
                l_cp.m_done = 90;
                ns_hlat::phase_t l_p;
                int32_t l_s;
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_p.m_server_processing == 50));
                REQUIRE((l_p.m_content_transfer == 0));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("out of order checkpoints are clamped")
        {
                ns_hlat::checkpoints_t l_cp;
                l_cp.m_dns_start = 100;
                l_cp.m_dns_done = 200;
                l_cp.m_conn_done = 150;
                l_cp.m_got_conn = 250;
                l_cp.m_first_byte = 300;
                l_cp.m_done = 280;
                ns_hlat::phase_t l_p;
                int32_t l_s;
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_p.m_dns_lookup == 100));
                REQUIRE((l_p.m_tcp_connection == 0));
                REQUIRE((l_p.m_connection_acquisition == 50));
                REQUIRE((l_p.m_server_processing == 50));
                REQUIRE((l_p.m_content_transfer == 0));
                REQUIRE((l_p.m_total == 200));
                REQUIRE((l_p.m_dns_lookup >= 0));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("incomplete checkpoints")
        {
                ns_hlat::checkpoints_t l_cp;
                l_cp.m_dns_start = 100;
                l_cp.m_dns_done = 200;
                l_cp.m_conn_done = 300;
                ns_hlat::phase_t l_p;
                int32_t l_s;
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                l_cp.clear();
                REQUIRE((l_cp.m_dns_done == 0));
                l_s = ns_hlat::derive_phases(l_cp, l_p);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
        }
}
