//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    orchestrator.cc
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
#include "probe/orchestrator.h"
#include "http/url.h"
#include "nconn/nconn_tls.h"
#include "support/tls_util.h"
#include "support/trace.h"
#include <openssl/ssl.h>
#include <unistd.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
orchestrator::orchestrator(const conf_t &a_conf):
        m_conf(a_conf),
        m_probe_conf(),
        m_stop(0),
        m_mutex(),
        m_t_probe_list(),
        m_err(HLAT_ERR_NONE),
        m_err_msg(),
        m_failure(),
        m_failure_set(false)
{
        pthread_mutex_init(&m_mutex, nullptr);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
orchestrator::~orchestrator()
{
        cleanup();
        pthread_mutex_destroy(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void orchestrator::cleanup(void)
{
        for (t_probe_list_t::iterator i_t = m_t_probe_list.begin();
             i_t != m_t_probe_list.end();
             ++i_t)
        {
                if (*i_t)
                {
                        delete *i_t;
                        *i_t = nullptr;
                }
        }
        m_t_probe_list.clear();
        if (m_probe_conf.m_tls_ctx)
        {
                SSL_CTX_free(m_probe_conf.m_tls_ctx);
                m_probe_conf.m_tls_ctx = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  HLAT_STATUS_ERROR
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t orchestrator::set_err(hlat_err_t a_err, const std::string &a_msg)
{
        m_err = a_err;
        m_err_msg = a_msg;
        TRC_ERROR("%s: %s\n", hlat_err_str(a_err), a_msg.c_str());
        return HLAT_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: validate configuration and build probe settings
//!           -no network activity
//! \return:  HLAT_STATUS_OK on success
//!           HLAT_STATUS_ERROR with HLAT_ERR_INVALID_INPUT on failure
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t orchestrator::validate(void)
{
        if (m_conf.m_concurrency <= 0)
        {
                return set_err(HLAT_ERR_INVALID_INPUT, "concurrency must be > 0");
        }
        if (m_conf.m_url.empty())
        {
                return set_err(HLAT_ERR_INVALID_INPUT, "url is empty");
        }
        int32_t l_s;
        std::string l_err;
        l_s = parse_url(m_conf.m_url, m_probe_conf.m_url, &l_err);
        if (l_s != HLAT_STATUS_OK)
        {
                return set_err(HLAT_ERR_INVALID_INPUT, l_err);
        }
        if ((m_probe_conf.m_url.m_scheme != SCHEME_TCP) &&
           (m_probe_conf.m_url.m_scheme != SCHEME_TLS))
        {
                return set_err(HLAT_ERR_INVALID_INPUT, "scheme must be http or https");
        }
        m_probe_conf.m_connect_timeout_ms = m_conf.m_connect_timeout_ms;
        m_probe_conf.m_idle_timeout_ms = m_conf.m_idle_timeout_ms;
        m_probe_conf.m_ai_family = m_conf.m_ai_family;
        m_probe_conf.m_tls_verify = m_conf.m_tls_verify;
        m_probe_conf.m_verbose = m_conf.m_verbose;
        m_probe_conf.m_color = m_conf.m_color;
        m_probe_conf.m_user_agent = m_conf.m_user_agent;
        // -------------------------------------------------
        // tls ctx -shared read only across workers
        // -------------------------------------------------
        if (m_probe_conf.m_url.m_scheme == SCHEME_TLS)
        {
                tls_init();
                m_probe_conf.m_tls_ctx = tls_init_ctx(m_conf.m_tls_cipher_list,
                                                      m_conf.m_tls_options);
                if (!m_probe_conf.m_tls_ctx)
                {
                        return set_err(HLAT_ERR_INVALID_INPUT, "failed to create tls context");
                }
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: run probes -returns after every worker joined
//! \return:  HLAT_STATUS_OK with non-empty results
//!           HLAT_STATUS_ERROR otherwise (see get_err)
//! \param:   ao_results: measurements and recorded failures
//! ----------------------------------------------------------------------------
int32_t orchestrator::run(result_set &ao_results)
{
        cleanup();
        m_stop = 0;
        m_err = HLAT_ERR_NONE;
        m_err_msg.clear();
        m_failure = probe_failure_t();
        m_failure_set = false;
        ao_results.clear();
        int32_t l_s;
        l_s = validate();
        if (l_s != HLAT_STATUS_OK)
        {
                cleanup();
                return HLAT_STATUS_ERROR;
        }
        bool l_collect_errors = (m_conf.m_failure_policy == FAILURE_POLICY_COLLECT_ERRORS);
        // -------------------------------------------------
        // create workers
        // -------------------------------------------------
        for (int32_t i_t = 0; i_t < m_conf.m_concurrency; ++i_t)
        {
                t_probe *l_t_probe = new t_probe(*this,
                                                 m_probe_conf,
                                                 ao_results,
                                                 m_conf.m_samples,
                                                 l_collect_errors,
                                                 &m_stop);
                m_t_probe_list.push_back(l_t_probe);
                l_s = l_t_probe->init();
                if (l_s != HLAT_STATUS_OK)
                {
                        cleanup();
                        return set_err(HLAT_ERR_NETWORK_FAILURE, "error initializing event loop");
                }
        }
        // -------------------------------------------------
        // start
        // -------------------------------------------------
        bool l_start_error = false;
        for (t_probe_list_t::iterator i_t = m_t_probe_list.begin();
             i_t != m_t_probe_list.end();
             ++i_t)
        {
                l_s = (*i_t)->run();
                if (l_s != HLAT_STATUS_OK)
                {
                        l_start_error = true;
                        stop();
                        break;
                }
        }
        // -------------------------------------------------
        // wait for all
        // -------------------------------------------------
        wait_for_workers();
        for (t_probe_list_t::iterator i_t = m_t_probe_list.begin();
             i_t != m_t_probe_list.end();
             ++i_t)
        {
                l_s = (*i_t)->join();
                if (l_s != HLAT_STATUS_OK)
                {
                        TRC_ERROR("performing join\n");
                }
        }
        cleanup();
        if (l_start_error)
        {
                return set_err(HLAT_ERR_NETWORK_FAILURE, "error starting worker thread");
        }
        // -------------------------------------------------
        // fail fast -terminal failure
        // -------------------------------------------------
        if (m_failure_set)
        {
                return set_err(HLAT_ERR_NETWORK_FAILURE, probe_failure_str(m_failure));
        }
        if (ao_results.get_size() == 0)
        {
                if (ao_results.get_num_failures())
                {
                        return set_err(HLAT_ERR_ALL_PROBES_FAILED, probe_failure_str(ao_results.get_failures().back()));
                }
                m_failure.m_stage = PROBE_STAGE_CANCELLED;
                m_failure.m_conn_status = CONN_STATUS_CANCELLED;
                m_failure.m_msg = "run stopped";
                return set_err(HLAT_ERR_NETWORK_FAILURE, "run stopped before any probe completed");
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: poll workers until all finished -once the stop flag is raised
//!           (signal handler or failing worker) wake their loops so in flight
//!           probes are cancelled
//! \return:  NA
//! \param:   NA
//! ----------------------------------------------------------------------------
void orchestrator::wait_for_workers(void)
{
        while (true)
        {
                bool l_is_running = false;
                for (t_probe_list_t::iterator i_t = m_t_probe_list.begin();
                     i_t != m_t_probe_list.end();
                     ++i_t)
                {
                        if ((*i_t)->is_running()) l_is_running = true;
                }
                if (!l_is_running)
                {
                        break;
                }
                if (is_stopped())
                {
                        for (t_probe_list_t::iterator i_t = m_t_probe_list.begin();
                             i_t != m_t_probe_list.end();
                             ++i_t)
                        {
                                (*i_t)->signal();
                        }
                }
                usleep(HLAT_ORCHESTRATOR_POLL_MS*1000);
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void orchestrator::abort(const probe_failure_t &a_failure)
{
        pthread_mutex_lock(&m_mutex);
        if (!m_failure_set)
        {
                m_failure = a_failure;
                m_failure_set = true;
        }
        pthread_mutex_unlock(&m_mutex);
        stop();
}
} //namespace ns_hlat {
