//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    t_probe.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "t_probe.h"
#include "evr/evr.h"
#include "probe/orchestrator.h"
#include "support/trace.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
t_probe::t_probe(orchestrator &a_orchestrator,
                 const probe_conf_t &a_conf,
                 result_set &a_results,
                 int64_t a_samples,
                 bool a_collect_errors,
                 uint32_atomic_t *a_stop):
        m_orchestrator(a_orchestrator),
        m_conf(a_conf),
        m_results(a_results),
        m_samples(a_samples),
        m_collect_errors(a_collect_errors),
        m_stop(a_stop),
        m_t_run_thread(),
        m_running(false),
        m_stopped(0),
        m_num_probes(0),
        m_evr_loop(nullptr)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
t_probe::~t_probe()
{
        if (m_evr_loop)
        {
                delete m_evr_loop;
                m_evr_loop = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t t_probe::init(void)
{
        if (m_evr_loop)
        {
                return HLAT_STATUS_OK;
        }
        m_evr_loop = new evr_loop(EVR_LOOP_EPOLL, 512);
        int32_t l_s;
        l_s = m_evr_loop->init();
        if (l_s != HLAT_STATUS_OK)
        {
                TRC_ERROR("performing evr_loop init\n");
                delete m_evr_loop;
                m_evr_loop = nullptr;
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t t_probe::run(void)
{
        int32_t l_pthread_error = 0;
        l_pthread_error = pthread_create(&m_t_run_thread, nullptr, t_run_static, this);
        if (l_pthread_error != 0)
        {
                TRC_ERROR("performing pthread_create: %d\n", l_pthread_error);
                return HLAT_STATUS_ERROR;
        }
        m_running = true;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t t_probe::join(void)
{
        if (!m_running)
        {
                return HLAT_STATUS_OK;
        }
        int l_s;
        l_s = pthread_join(m_t_run_thread, nullptr);
        m_running = false;
        if (l_s != 0)
        {
                TRC_ERROR("performing pthread_join: %d\n", l_s);
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: wake loop -stop flag checked on wake up
//! \return:  NA
//! \param:   NA
//! ----------------------------------------------------------------------------
void t_probe::signal(void)
{
        if (m_evr_loop)
        {
                m_evr_loop->signal();
        }
}
//! ----------------------------------------------------------------------------
//! \details: check count before starting a probe
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool t_probe::can_probe(void)
{
        if (m_stop &&
           ((uint32_t)(*m_stop) != 0))
        {
                return false;
        }
        // fixed count -one probe per worker
        if (m_samples <= 0)
        {
                return (m_num_probes < 1);
        }
        return (m_results.get_completed() < (uint64_t)m_samples);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void *t_probe::t_run(void *a_nothing)
{
        if (!m_evr_loop)
        {
                TRC_ERROR("m_evr_loop == nullptr\n");
                m_stopped = 1;
                return nullptr;
        }
        while (can_probe())
        {
                ++m_num_probes;
                probe l_probe(m_conf, m_evr_loop, m_stop);
                int32_t l_s;
                l_s = l_probe.run();
                if (l_s == HLAT_STATUS_OK)
                {
                        const phase_t &l_p = l_probe.get_phase();
                        m_results.add(l_p);
                        if (m_conf.m_verbose)
                        {
                                TRC_OUTPUT("probe: dns: %.3fms tcp: %.3fms acquisition: %.3fms server: %.3fms transfer: %.3fms total: %.3fms\n",
                                           l_p.m_dns_lookup/1e6,
                                           l_p.m_tcp_connection/1e6,
                                           l_p.m_connection_acquisition/1e6,
                                           l_p.m_server_processing/1e6,
                                           l_p.m_content_transfer/1e6,
                                           l_p.m_total/1e6);
                        }
                        continue;
                }
                const probe_failure_t &l_f = l_probe.get_failure();
                // cancelled probes are never recorded
                if (l_f.m_stage == PROBE_STAGE_CANCELLED)
                {
                        break;
                }
                if (m_collect_errors)
                {
                        m_results.add_failure(l_f);
                        continue;
                }
                m_orchestrator.abort(l_f);
                break;
        }
        m_stopped = 1;
        return nullptr;
}
} //namespace ns_hlat {
