//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    probe.h
//! \details: single instrumented GET request driven by a worker's evr_loop
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_PROBE_H
#define _HLAT_PROBE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "evr/evr.h"
#include "http/url.h"
#include "probe/phase.h"
#include "probe/errors.h"
#include "support/atomic.h"
#include <sys/socket.h>
#include <string>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef HLAT_VERSION
#define HLAT_VERSION "0.0.0"
#endif
#define HLAT_DEFAULT_CONNECT_TIMEOUT_MS 10000
#define HLAT_DEFAULT_IDLE_TIMEOUT_MS 30000
//! ----------------------------------------------------------------------------
//! ext fwd decl's
//! ----------------------------------------------------------------------------
typedef struct ssl_ctx_st SSL_CTX;
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class nconn;
class resp;
//! ----------------------------------------------------------------------------
//! \details: per probe settings -read only, shared across workers
//! ----------------------------------------------------------------------------
typedef struct probe_conf_struct
{
        url_t m_url;
        uint32_t m_connect_timeout_ms;
        uint32_t m_idle_timeout_ms;
        int m_ai_family;
        // shared ctx -each probe creates its own SSL
        SSL_CTX *m_tls_ctx;
        bool m_tls_verify;
        bool m_tls_sni;
        bool m_verbose;
        bool m_color;
        std::string m_user_agent;
        probe_conf_struct():
                m_url(),
                m_connect_timeout_ms(HLAT_DEFAULT_CONNECT_TIMEOUT_MS),
                m_idle_timeout_ms(HLAT_DEFAULT_IDLE_TIMEOUT_MS),
                m_ai_family(AF_UNSPEC),
                m_tls_ctx(nullptr),
                m_tls_verify(true),
                m_tls_sni(true),
                m_verbose(false),
                m_color(false),
                m_user_agent("hlat/" HLAT_VERSION)
        {}
} probe_conf_t;
//! ----------------------------------------------------------------------------
//! \details: one GET request on a fresh connection
//!           resolve -> connect (-> tls handshake) -> send -> receive
//!           checkpoints taken along the way
//! ----------------------------------------------------------------------------
class probe
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        probe(const probe_conf_t &a_conf,
              evr_loop *a_evr_loop,
              uint32_atomic_t *a_stop = nullptr);
        ~probe();
        int32_t run(void);
        const phase_t &get_phase(void) const { return m_phase; }
        const checkpoints_t &get_checkpoints(void) const { return m_cp; }
        const probe_failure_t &get_failure(void) const { return m_failure; }
        // -------------------------------------------------
        // public Static (class) methods
        // -------------------------------------------------
        static int32_t evr_fd_readable_cb(void *a_data) {return run_state_machine(a_data, EVR_MODE_READ);}
        static int32_t evr_fd_writeable_cb(void *a_data){return run_state_machine(a_data, EVR_MODE_WRITE);}
        static int32_t evr_fd_error_cb(void *a_data) {return run_state_machine(a_data, EVR_MODE_ERROR);}
        static int32_t evr_fd_timeout_cb(void *a_data){return run_state_machine(a_data, EVR_MODE_TIMEOUT);}
private:
        // -------------------------------------------------
        // private types
        // -------------------------------------------------
        typedef enum state_enum
        {
                STATE_NONE = 0,
                STATE_CONNECTING,
                STATE_SENDING,
                STATE_RECEIVING,
                STATE_DONE
        } state_t;
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // Disallow copy/assign
        probe& operator=(const probe &);
        probe(const probe &);
        static int32_t run_state_machine(void *a_data, evr_mode_t a_conn_mode);
        int32_t resolve(void);
        int32_t create_conn(void);
        int32_t srequest(void);
        int32_t swrite(void);
        int32_t sread(void);
        int32_t handle_timeout(void);
        int32_t set_timer(uint32_t a_time_ms);
        void cancel_timer(void);
        int32_t complete(void);
        int32_t fail(probe_stage_t a_stage,
                     conn_status_t a_conn_status,
                     const std::string &a_msg);
        int32_t fail_conn(void);
        bool is_stopped(void) const;
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        const probe_conf_t &m_conf;
        evr_loop *m_evr_loop;
        uint32_atomic_t *m_stop;
        nconn *m_nconn;
        resp *m_resp;
        evr_event_t *m_timer_obj;
        uint64_t m_last_active_ms;
        state_t m_state;
        int32_t m_status;
        std::string m_out_buf;
        uint32_t m_out_off;
        checkpoints_t m_cp;
        phase_t m_phase;
        probe_failure_t m_failure;
        char m_in_buf[16384];
};
} //namespace ns_hlat {
#endif
