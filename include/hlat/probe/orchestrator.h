//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    orchestrator.h
//! \details: concurrent fan out of probes across worker threads
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_ORCHESTRATOR_H
#define _HLAT_ORCHESTRATOR_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/probe.h"
#include "probe/errors.h"
#include "probe/result_set.h"
#include "support/atomic.h"
#include <pthread.h>
#include <stdint.h>
#include <string>
#include <list>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef HLAT_ORCHESTRATOR_POLL_MS
#define HLAT_ORCHESTRATOR_POLL_MS 5
#endif
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class t_probe;
//! ----------------------------------------------------------------------------
//! \details: run N concurrent probes against one url
//!           -fixed count (samples <= 0): one probe per worker
//!           -target count (samples > 0): workers probe until completed
//!            count reaches samples. Overshoot bounded by concurrency - 1
//! ----------------------------------------------------------------------------
class orchestrator
{
public:
        // -------------------------------------------------
        // public types
        // -------------------------------------------------
        typedef enum failure_policy_enum
        {
                FAILURE_POLICY_FAIL_FAST = 0,
                FAILURE_POLICY_COLLECT_ERRORS
        } failure_policy_t;
        typedef struct conf_struct
        {
                std::string m_url;
                int32_t m_concurrency;
                int64_t m_samples;
                failure_policy_t m_failure_policy;
                uint32_t m_connect_timeout_ms;
                uint32_t m_idle_timeout_ms;
                int m_ai_family;
                bool m_tls_verify;
                std::string m_tls_cipher_list;
                long m_tls_options;
                bool m_verbose;
                bool m_color;
                std::string m_user_agent;
                conf_struct():
                        m_url(),
                        m_concurrency(1),
                        m_samples(0),
                        m_failure_policy(FAILURE_POLICY_FAIL_FAST),
                        m_connect_timeout_ms(HLAT_DEFAULT_CONNECT_TIMEOUT_MS),
                        m_idle_timeout_ms(HLAT_DEFAULT_IDLE_TIMEOUT_MS),
                        m_ai_family(AF_UNSPEC),
                        m_tls_verify(true),
                        m_tls_cipher_list(),
                        m_tls_options(0),
                        m_verbose(false),
                        m_color(false),
                        m_user_agent("hlat/" HLAT_VERSION)
                {}
        } conf_t;
        typedef std::list <t_probe *> t_probe_list_t;
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        orchestrator(const conf_t &a_conf);
        ~orchestrator();
        int32_t run(result_set &ao_results);
        // async signal safe -stores to the stop flag only
        void stop(void) { m_stop = 1; }
        bool is_stopped(void) const { return ((uint32_t)m_stop != 0); }
        uint32_atomic_t *get_stop_flag(void) { return &m_stop; }
        hlat_err_t get_err(void) const { return m_err; }
        const std::string &get_err_msg(void) const { return m_err_msg; }
        const probe_failure_t &get_failure(void) const { return m_failure; }
        // called by workers -first failure wins
        void abort(const probe_failure_t &a_failure);
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // Disallow copy/assign
        orchestrator& operator=(const orchestrator &);
        orchestrator(const orchestrator &);
        int32_t validate(void);
        int32_t set_err(hlat_err_t a_err, const std::string &a_msg);
        void wait_for_workers(void);
        void cleanup(void);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        conf_t m_conf;
        probe_conf_t m_probe_conf;
        uint32_atomic_t m_stop;
        pthread_mutex_t m_mutex;
        t_probe_list_t m_t_probe_list;
        hlat_err_t m_err;
        std::string m_err_msg;
        probe_failure_t m_failure;
        bool m_failure_set;
};
} //namespace ns_hlat {
#endif
