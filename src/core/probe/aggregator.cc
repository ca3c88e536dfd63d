//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    aggregator.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "probe/aggregator.h"
#include "support/trace.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t summarize(const phase_vector_t &a_phases,
                  phase_t &ao_summary,
                  hlat_err_t *ao_err)
{
        if (a_phases.empty())
        {
                TRC_ERROR("summarize: %s\n", hlat_err_str(HLAT_ERR_EMPTY_RESULT_SET));
                if (ao_err)
                {
                        *ao_err = HLAT_ERR_EMPTY_RESULT_SET;
                }
                return HLAT_STATUS_ERROR;
        }
        phase_t l_sum;
        for (phase_vector_t::const_iterator i_p = a_phases.begin();
             i_p != a_phases.end();
             ++i_p)
        {
                l_sum.m_dns_lookup += i_p->m_dns_lookup;
                l_sum.m_tcp_connection += i_p->m_tcp_connection;
                l_sum.m_connection_acquisition += i_p->m_connection_acquisition;
                l_sum.m_server_processing += i_p->m_server_processing;
                l_sum.m_content_transfer += i_p->m_content_transfer;
                l_sum.m_total += i_p->m_total;
        }
        int64_t l_n = (int64_t)a_phases.size();
        ao_summary.m_dns_lookup = l_sum.m_dns_lookup / l_n;
        ao_summary.m_tcp_connection = l_sum.m_tcp_connection / l_n;
        ao_summary.m_connection_acquisition = l_sum.m_connection_acquisition / l_n;
        ao_summary.m_server_processing = l_sum.m_server_processing / l_n;
        ao_summary.m_content_transfer = l_sum.m_content_transfer / l_n;
        ao_summary.m_total = l_sum.m_total / l_n;
        if (ao_err)
        {
                *ao_err = HLAT_ERR_NONE;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t summarize(const result_set &a_results,
                  phase_t &ao_summary,
                  hlat_err_t *ao_err)
{
        return summarize(a_results.get_phases(), ao_summary, ao_err);
}
} //namespace ns_hlat {
