//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_aggregator.cc
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
#include "probe/aggregator.h"
#include "probe/result_set.h"
#include "support/time_util.h"
//! ----------------------------------------------------------------------------
//! \details: phase where every field is a_ns and total is the sum
//! \return:  phase
//! \param:   a_ns: per field value
//! ----------------------------------------------------------------------------
static ns_hlat::phase_t phase_of(int64_t a_ns)
{
        ns_hlat::phase_t l_p;
        l_p.m_dns_lookup = a_ns;
        l_p.m_tcp_connection = a_ns;
        l_p.m_connection_acquisition = a_ns;
        l_p.m_server_processing = a_ns;
        l_p.m_content_transfer = a_ns;
        l_p.m_total = 5*a_ns;
        return l_p;
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "summarize", "[aggregator]" )
{
        SECTION("single sample is unchanged")
        {
                ns_hlat::phase_vector_t l_v;
                ns_hlat::phase_t l_p;
                l_p.m_dns_lookup = 11;
                l_p.m_tcp_connection = 22;
                l_p.m_connection_acquisition = 33;
                l_p.m_server_processing = 44;
                l_p.m_content_transfer = 55;
                l_p.m_total = 165;
                l_v.push_back(l_p);
                ns_hlat::phase_t l_sum;
                int32_t l_s;
                l_s = ns_hlat::summarize(l_v, l_sum);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_sum.m_dns_lookup == 11));
                REQUIRE((l_sum.m_tcp_connection == 22));
                REQUIRE((l_sum.m_connection_acquisition == 33));
                REQUIRE((l_sum.m_server_processing == 44));
                REQUIRE((l_sum.m_content_transfer == 55));
                REQUIRE((l_sum.m_total == 165));
        }
        SECTION("mean of 1s 2s 3s")
        {
                ns_hlat::result_set l_rs;
                l_rs.add(phase_of(1*HLAT_NS_PER_S));
                l_rs.add(phase_of(2*HLAT_NS_PER_S));
                l_rs.add(phase_of(3*HLAT_NS_PER_S));
                ns_hlat::phase_t l_sum;
                ns_hlat::hlat_err_t l_err = ns_hlat::HLAT_ERR_INVALID_INPUT;
                int32_t l_s;
                l_s = ns_hlat::summarize(l_rs, l_sum, &l_err);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_err == ns_hlat::HLAT_ERR_NONE));
                REQUIRE((l_sum.m_dns_lookup == 2*HLAT_NS_PER_S));
                REQUIRE((l_sum.m_content_transfer == 2*HLAT_NS_PER_S));
                REQUIRE((l_sum.m_total == 10*HLAT_NS_PER_S));
        }
        SECTION("empty set")
        {
                ns_hlat::result_set l_rs;
                ns_hlat::probe_failure_t l_f;
                l_f.m_stage = ns_hlat::PROBE_STAGE_CONNECT;
                l_rs.add_failure(l_f);
                ns_hlat::phase_t l_sum;
                ns_hlat::hlat_err_t l_err = ns_hlat::HLAT_ERR_NONE;
                int32_t l_s;
                l_s = ns_hlat::summarize(l_rs, l_sum, &l_err);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                REQUIRE((l_err == ns_hlat::HLAT_ERR_EMPTY_RESULT_SET));
        }
        SECTION("truncating division")
        {
                ns_hlat::phase_vector_t l_v;
                l_v.push_back(phase_of(1));
                l_v.push_back(phase_of(2));
                ns_hlat::phase_t l_sum;
                int32_t l_s;
                l_s = ns_hlat::summarize(l_v, l_sum);
                REQUIRE((l_s == HLAT_STATUS_OK));
                // 3/2
                REQUIRE((l_sum.m_dns_lookup == 1));
                // 15/2
                REQUIRE((l_sum.m_total == 7));
                // mean total vs sum of mean phases
                int64_t l_phases = l_sum.m_dns_lookup +
                                   l_sum.m_tcp_connection +
                                   l_sum.m_connection_acquisition +
                                   l_sum.m_server_processing +
                                   l_sum.m_content_transfer;
                REQUIRE(((l_sum.m_total - l_phases) >= 0));
                REQUIRE(((l_sum.m_total - l_phases) <= 4));
        }
        SECTION("repeatable")
        {
                ns_hlat::phase_vector_t l_v;
                l_v.push_back(phase_of(7));
                l_v.push_back(phase_of(8));
                l_v.push_back(phase_of(10));
                ns_hlat::phase_t l_a;
                ns_hlat::phase_t l_b;
                REQUIRE((ns_hlat::summarize(l_v, l_a) == HLAT_STATUS_OK));
                REQUIRE((ns_hlat::summarize(l_v, l_b) == HLAT_STATUS_OK));
                REQUIRE((l_a.m_total == l_b.m_total));
                REQUIRE((l_a.m_dns_lookup == l_b.m_dns_lookup));
                REQUIRE((l_a.m_dns_lookup == 8));
        }
}
TEST_CASE( "result set", "[result_set]" )
{
        SECTION("completed counts measurements and failures")
        {
                ns_hlat::result_set l_rs;
                REQUIRE((l_rs.add(phase_of(1)) == 1));
                ns_hlat::probe_failure_t l_f;
                REQUIRE((l_rs.add_failure(l_f) == 2));
                REQUIRE((l_rs.add(phase_of(1)) == 3));
                REQUIRE((l_rs.get_size() == 2));
                REQUIRE((l_rs.get_num_failures() == 1));
                REQUIRE((l_rs.get_completed() == 3));
                l_rs.clear();
                REQUIRE((l_rs.get_completed() == 0));
        }
}
