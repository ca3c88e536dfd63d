//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    phase.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "probe/phase.h"
#include "support/trace.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t derive_phases(const checkpoints_t &a_cp, phase_t &ao_phase)
{
        if (!a_cp.m_dns_done ||
           !a_cp.m_conn_done ||
           !a_cp.m_got_conn ||
           !a_cp.m_done)
        {
                TRC_ERROR("incomplete checkpoints: dns_done: %ld conn_done: %ld got_conn: %ld done: %ld\n",
                          (long)a_cp.m_dns_done,
                          (long)a_cp.m_conn_done,
                          (long)a_cp.m_got_conn,
                          (long)a_cp.m_done);
                return HLAT_STATUS_ERROR;
        }
        int64_t l_c[6];
        l_c[0] = a_cp.m_dns_start ? a_cp.m_dns_start : a_cp.m_dns_done;
        l_c[1] = a_cp.m_dns_done;
        l_c[2] = a_cp.m_conn_done;
        l_c[3] = a_cp.m_got_conn;
        l_c[4] = a_cp.m_first_byte ? a_cp.m_first_byte : a_cp.m_done;
        l_c[5] = a_cp.m_done;
        // monotone non-decreasing
        for (int i_c = 1; i_c < 6; ++i_c)
        {
                if (l_c[i_c] < l_c[i_c - 1])
                {
                        l_c[i_c] = l_c[i_c - 1];
                }
        }
        ao_phase.m_dns_lookup = l_c[1] - l_c[0];
        ao_phase.m_tcp_connection = l_c[2] - l_c[1];
        ao_phase.m_connection_acquisition = l_c[3] - l_c[2];
        ao_phase.m_server_processing = l_c[4] - l_c[3];
        ao_phase.m_content_transfer = l_c[5] - l_c[4];
        ao_phase.m_total = l_c[5] - l_c[0];
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool phase_sum_is_exact(const phase_t &a_phase)
{
        return (a_phase.m_total == (a_phase.m_dns_lookup +
                                    a_phase.m_tcp_connection +
                                    a_phase.m_connection_acquisition +
                                    a_phase.m_server_processing +
                                    a_phase.m_content_transfer));
}
} //namespace ns_hlat {
