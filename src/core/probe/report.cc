//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    report.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "probe/report.h"
#include "support/time_util.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include <stdio.h>
#include <inttypes.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static double ns_to_s(int64_t a_ns)
{
        return ((double)a_ns)/((double)HLAT_NS_PER_S);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string ns_to_s_str(int64_t a_ns)
{
        char l_buf[64];
        snprintf(l_buf, sizeof(l_buf), "%.9g", ns_to_s(a_ns));
        return l_buf;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t report_text(const phase_t &a_summary, std::string &ao_str)
{
        ao_str.clear();
        ao_str += "Average request time: " + ns_to_s_str(a_summary.m_total) + "s\n";
        ao_str += "DNS Lookup: " + ns_to_s_str(a_summary.m_dns_lookup) + "s\n";
        ao_str += "TCP Connections: " + ns_to_s_str(a_summary.m_tcp_connection) + "s\n";
        ao_str += "Connection Acquisition: " + ns_to_s_str(a_summary.m_connection_acquisition) + "s\n";
        ao_str += "Server Procesing: " + ns_to_s_str(a_summary.m_server_processing) + "s\n";
        ao_str += "Server Tranfer: " + ns_to_s_str(a_summary.m_content_transfer) + "s\n";
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t report_json(const phase_t &a_summary,
                    uint64_t a_samples,
                    uint64_t a_failures,
                    std::string &ao_str)
{
        rapidjson::Document l_body;
        l_body.SetObject();
        rapidjson::Document::AllocatorType& l_alloc = l_body.GetAllocator();
#define ADD_MEMBER(_l, _v) \
        l_body.AddMember(_l, _v, l_alloc)
        ADD_MEMBER("samples", (uint64_t)a_samples);
        ADD_MEMBER("failures", (uint64_t)a_failures);
        ADD_MEMBER("total-s", ns_to_s(a_summary.m_total));
        ADD_MEMBER("dns-lookup-s", ns_to_s(a_summary.m_dns_lookup));
        ADD_MEMBER("tcp-connection-s", ns_to_s(a_summary.m_tcp_connection));
        ADD_MEMBER("connection-acquisition-s", ns_to_s(a_summary.m_connection_acquisition));
        ADD_MEMBER("server-processing-s", ns_to_s(a_summary.m_server_processing));
        ADD_MEMBER("content-transfer-s", ns_to_s(a_summary.m_content_transfer));
#undef ADD_MEMBER
        rapidjson::StringBuffer l_strbuf;
        rapidjson::Writer<rapidjson::StringBuffer> l_writer(l_strbuf);
        l_body.Accept(l_writer);
        ao_str.assign(l_strbuf.GetString(), l_strbuf.GetSize());
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string report_samples_line(uint64_t a_succeeded, uint64_t a_failed)
{
        char l_buf[128];
        snprintf(l_buf, sizeof(l_buf), "Samples: %" PRIu64 " succeeded, %" PRIu64 " failed\n",
                 a_succeeded,
                 a_failed);
        return l_buf;
}
} //namespace ns_hlat {
