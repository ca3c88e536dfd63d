//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    phase.h
//! \details: request lifecycle checkpoints and derived phase durations
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_PHASE_H
#define _HLAT_PHASE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: phase durations (ns)
//!           m_total == sum of the other five
//! ----------------------------------------------------------------------------
typedef struct phase_struct
{
        int64_t m_dns_lookup;
        int64_t m_tcp_connection;
        int64_t m_connection_acquisition;
        int64_t m_server_processing;
        int64_t m_content_transfer;
        int64_t m_total;
        phase_struct():
                m_dns_lookup(0),
                m_tcp_connection(0),
                m_connection_acquisition(0),
                m_server_processing(0),
                m_content_transfer(0),
                m_total(0)
        {}
} phase_t;
//! ----------------------------------------------------------------------------
//! \details: monotonic timestamps (ns) -zero when not set
//! ----------------------------------------------------------------------------
typedef struct checkpoints_struct
{
        int64_t m_dns_start;
        int64_t m_dns_done;
        int64_t m_conn_done;
        int64_t m_got_conn;
        int64_t m_first_byte;
        int64_t m_done;
        checkpoints_struct():
                m_dns_start(0),
                m_dns_done(0),
                m_conn_done(0),
                m_got_conn(0),
                m_first_byte(0),
                m_done(0)
        {}
        void clear(void) { *this = checkpoints_struct(); }
} checkpoints_t;
//! ----------------------------------------------------------------------------
//! \details: derive phases from checkpoints
//!           -missing dns start: dns start = dns done
//!           -missing first byte: first byte = done
//!           -each checkpoint clamped to no earlier than its predecessor
//! \return:  HLAT_STATUS_OK on success
//!           HLAT_STATUS_ERROR if dns done, conn done, got conn or done
//!           never fired
//! \param:   a_cp: checkpoints
//! \param:   ao_phase: derived phases
//! ----------------------------------------------------------------------------
int32_t derive_phases(const checkpoints_t &a_cp, phase_t &ao_phase);
//! ----------------------------------------------------------------------------
//! \details: true when total equals the sum of the five phases
//! ----------------------------------------------------------------------------
bool phase_sum_is_exact(const phase_t &a_phase);
} //namespace ns_hlat {
#endif
