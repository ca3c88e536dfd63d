//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    t_probe.h
//! \details: probe worker thread -owns an evr_loop, runs probes sequentially
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_T_PROBE_H
#define _HLAT_T_PROBE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/probe.h"
#include "probe/result_set.h"
#include "support/atomic.h"
#include <pthread.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class orchestrator;
class evr_loop;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class t_probe
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        t_probe(orchestrator &a_orchestrator,
                const probe_conf_t &a_conf,
                result_set &a_results,
                int64_t a_samples,
                bool a_collect_errors,
                uint32_atomic_t *a_stop);
        ~t_probe();
        int32_t init(void);
        int32_t run(void);
        int32_t join(void);
        void signal(void);
        void *t_run(void *a_nothing);
        // started and not yet returned from t_run
        bool is_running(void) const { return m_running && ((uint32_t)m_stopped == 0); }
        uint64_t get_num_probes(void) const { return m_num_probes; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // Disallow copy/assign
        t_probe& operator=(const t_probe &);
        t_probe(const t_probe &);
        //Helper for pthreads
        static void *t_run_static(void *a_context)
        {
                return reinterpret_cast<t_probe *>(a_context)->t_run(nullptr);
        }
        bool can_probe(void);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        orchestrator &m_orchestrator;
        const probe_conf_t &m_conf;
        result_set &m_results;
        int64_t m_samples;
        bool m_collect_errors;
        uint32_atomic_t *m_stop;
        pthread_t m_t_run_thread;
        bool m_running;
        uint32_atomic_t m_stopped;
        uint64_t m_num_probes;
        evr_loop *m_evr_loop;
};
} //namespace ns_hlat {
#endif
