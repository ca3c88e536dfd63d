//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_report.cc
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
#include "probe/report.h"
#include "probe/errors.h"
#include "support/time_util.h"
#include "rapidjson/document.h"
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "report", "[report]" )
{
        SECTION("seconds strings")
        {
                REQUIRE((ns_hlat::ns_to_s_str(HLAT_NS_PER_S) == "1"));
                REQUIRE((ns_hlat::ns_to_s_str(200*HLAT_NS_PER_MS) == "0.2"));
                REQUIRE((ns_hlat::ns_to_s_str(0) == "0"));
                REQUIRE((ns_hlat::ns_to_s_str(1500) == "1.5e-06"));
        }
        SECTION("text report")
        {
                ns_hlat::phase_t l_p;
                l_p.m_dns_lookup = 200*HLAT_NS_PER_MS;
                l_p.m_tcp_connection = 200*HLAT_NS_PER_MS;
                l_p.m_connection_acquisition = 0;
                l_p.m_server_processing = 200*HLAT_NS_PER_MS;
                l_p.m_content_transfer = 400*HLAT_NS_PER_MS;
                l_p.m_total = HLAT_NS_PER_S;
                std::string l_str;
                int32_t l_s;
                l_s = ns_hlat::report_text(l_p, l_str);
                REQUIRE((l_s == HLAT_STATUS_OK));
                const char l_expected[] =
                        "Average request time: 1s\n"
                        "DNS Lookup: 0.2s\n"
                        "TCP Connections: 0.2s\n"
                        "Connection Acquisition: 0s\n"
                        "Server Procesing: 0.2s\n"
                        "Server Tranfer: 0.4s\n";
                REQUIRE((l_str == l_expected));
        }
        SECTION("json report")
        {
                ns_hlat::phase_t l_p;
                l_p.m_dns_lookup = 250*HLAT_NS_PER_MS;
                l_p.m_server_processing = 500*HLAT_NS_PER_MS;
                l_p.m_total = 750*HLAT_NS_PER_MS;
                std::string l_str;
                int32_t l_s;
                l_s = ns_hlat::report_json(l_p, 3, 1, l_str);
                REQUIRE((l_s == HLAT_STATUS_OK));
                rapidjson::Document l_js;
                l_js.Parse(l_str.c_str());
                REQUIRE((l_js.HasParseError() == false));
                REQUIRE((l_js.IsObject()));
                REQUIRE((l_js["samples"].GetUint64() == 3));
                REQUIRE((l_js["failures"].GetUint64() == 1));
                REQUIRE((l_js["total-s"].GetDouble() == Approx(0.75)));
                REQUIRE((l_js["dns-lookup-s"].GetDouble() == Approx(0.25)));
                REQUIRE((l_js["tcp-connection-s"].GetDouble() == Approx(0.0)));
                REQUIRE((l_js["connection-acquisition-s"].GetDouble() == Approx(0.0)));
                REQUIRE((l_js["server-processing-s"].GetDouble() == Approx(0.5)));
                REQUIRE((l_js["content-transfer-s"].GetDouble() == Approx(0.0)));
        }
        SECTION("samples line")
        {
                REQUIRE((ns_hlat::report_samples_line(8, 2) == "Samples: 8 succeeded, 2 failed\n"));
        }
}
TEST_CASE( "error strings", "[errors]" )
{
        SECTION("run errors")
        {
                REQUIRE((std::string(ns_hlat::hlat_err_str(ns_hlat::HLAT_ERR_INVALID_INPUT)) == "invalid input"));
                REQUIRE((std::string(ns_hlat::hlat_err_str(ns_hlat::HLAT_ERR_ALL_PROBES_FAILED)) == "all probes failed"));
        }
        SECTION("stages")
        {
                REQUIRE((ns_hlat::probe_stage_from_conn_status(ns_hlat::CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE) == ns_hlat::PROBE_STAGE_RESOLVE));
                REQUIRE((ns_hlat::probe_stage_from_conn_status(ns_hlat::CONN_STATUS_ERROR_CONNECT_TLS) == ns_hlat::PROBE_STAGE_TLS));
                REQUIRE((ns_hlat::probe_stage_from_conn_status(ns_hlat::CONN_STATUS_ERROR_TIMEOUT) == ns_hlat::PROBE_STAGE_TIMEOUT));
                ns_hlat::probe_failure_t l_f;
                l_f.m_stage = ns_hlat::PROBE_STAGE_CONNECT;
                l_f.m_conn_status = ns_hlat::CONN_STATUS_ERROR_CONNECT;
                l_f.m_msg = "Connection refused\n";
                REQUIRE((ns_hlat::probe_failure_str(l_f) == "connect failed: Connection refused"));
        }
}
