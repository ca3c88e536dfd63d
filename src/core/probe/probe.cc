//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    probe.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "probe/probe.h"
#include "dns/nlookup.h"
#include "nconn/host_info.h"
#include "nconn/nconn_tcp.h"
#include "nconn/nconn_tls.h"
#include "http/resp.h"
#include "support/ndebug.h"
#include "support/time_util.h"
#include "support/trace.h"
#include <stdio.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
probe::probe(const probe_conf_t &a_conf,
             evr_loop *a_evr_loop,
             uint32_atomic_t *a_stop):
        m_conf(a_conf),
        m_evr_loop(a_evr_loop),
        m_stop(a_stop),
        m_nconn(nullptr),
        m_resp(nullptr),
        m_timer_obj(nullptr),
        m_last_active_ms(0),
        m_state(STATE_NONE),
        m_status(HLAT_STATUS_OK),
        m_out_buf(),
        m_out_off(0),
        m_cp(),
        m_phase(),
        m_failure()
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
probe::~probe(void)
{
        cancel_timer();
        if (m_nconn)
        {
                if (!m_nconn->is_free())
                {
                        m_nconn->nc_cleanup();
                }
                delete m_nconn;
                m_nconn = nullptr;
        }
        if (m_resp)
        {
                delete m_resp;
                m_resp = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: perform the request -returns when complete, failed or stopped
//! \return:  HLAT_STATUS_OK with phases set (get_phase)
//!           HLAT_STATUS_ERROR with failure set (get_failure)
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t probe::run(void)
{
        if (!m_evr_loop)
        {
                return fail(PROBE_STAGE_CONNECT, CONN_STATUS_ERROR_INTERNAL, "no event loop");
        }
        if (is_stopped())
        {
                return fail(PROBE_STAGE_CANCELLED, CONN_STATUS_CANCELLED, "probe cancelled");
        }
        int32_t l_s;
        l_s = create_conn();
        if (l_s != HLAT_STATUS_OK)
        {
                return fail(PROBE_STAGE_CONNECT, CONN_STATUS_ERROR_INTERNAL, "error creating connection");
        }
        // -------------------------------------------------
        // resolve -blocking
        // -------------------------------------------------
        l_s = resolve();
        if (l_s != HLAT_STATUS_OK)
        {
                return HLAT_STATUS_ERROR;
        }
        if (is_stopped())
        {
                return fail(PROBE_STAGE_CANCELLED, CONN_STATUS_CANCELLED, "probe cancelled");
        }
        // -------------------------------------------------
        // connect
        // -------------------------------------------------
        m_state = STATE_CONNECTING;
        l_s = set_timer(m_conf.m_connect_timeout_ms);
        if (l_s != HLAT_STATUS_OK)
        {
                return fail(PROBE_STAGE_CONNECT, CONN_STATUS_ERROR_INTERNAL, "error setting connect timer");
        }
        // kick off connect -failures are reflected in m_state/m_status
        l_s = run_state_machine(m_nconn, EVR_MODE_WRITE);
        if (l_s == HLAT_STATUS_ERROR)
        {
                return fail(PROBE_STAGE_CONNECT, CONN_STATUS_ERROR_INTERNAL, "error starting connection");
        }
        // -------------------------------------------------
        // drive loop until done
        // -------------------------------------------------
        while (m_state != STATE_DONE)
        {
                if (is_stopped())
                {
                        fail(PROBE_STAGE_CANCELLED, CONN_STATUS_CANCELLED, "probe cancelled");
                        break;
                }
                l_s = m_evr_loop->run();
                if ((l_s == HLAT_STATUS_ERROR) &&
                   (m_state != STATE_DONE))
                {
                        fail((m_state == STATE_CONNECTING) ? PROBE_STAGE_CONNECT : PROBE_STAGE_RECV,
                             CONN_STATUS_ERROR_INTERNAL,
                             "event loop failure");
                        break;
                }
        }
        return m_status;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::resolve(void)
{
        const std::string &l_host = m_conf.m_url.m_host;
        // literal address -no resolution -dns start not set
        if (!is_ip_literal(l_host))
        {
                m_cp.m_dns_start = get_time_ns();
        }
        host_info l_host_info;
        std::string l_err;
        int32_t l_s;
        l_s = nlookup(l_host,
                      m_conf.m_url.m_port,
                      l_host_info,
                      m_conf.m_ai_family,
                      &l_err);
        if (l_s != HLAT_STATUS_OK)
        {
                return fail(PROBE_STAGE_RESOLVE, CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE, l_err);
        }
        m_cp.m_dns_done = get_time_ns();
        m_nconn->set_host_info(l_host_info);
        if (m_conf.m_verbose)
        {
                TRC_OUTPUT("resolved: %s -> %s\n",
                           l_host.c_str(),
                           l_host_info.get_addr_str().c_str());
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::create_conn(void)
{
        const url_t &l_url = m_conf.m_url;
        if (l_url.m_scheme == SCHEME_TLS)
        {
                if (!m_conf.m_tls_ctx)
                {
                        TRC_ERROR("tls ctx == nullptr for https url\n");
                        return HLAT_STATUS_ERROR;
                }
                m_nconn = new nconn_tls();
                SET_NCONN_OPT((*m_nconn), nconn_tls::OPT_TLS_CTX, m_conf.m_tls_ctx, sizeof(m_conf.m_tls_ctx));
                SET_NCONN_OPT((*m_nconn), nconn_tls::OPT_TLS_VERIFY, &(m_conf.m_tls_verify), sizeof(bool));
                // no sni for literal addresses
                bool l_sni = m_conf.m_tls_sni && !is_ip_literal(l_url.m_host);
                SET_NCONN_OPT((*m_nconn), nconn_tls::OPT_TLS_SNI, &l_sni, sizeof(bool));
                SET_NCONN_OPT((*m_nconn),
                              nconn_tls::OPT_TLS_HOSTNAME,
                              l_url.m_host.c_str(),
                              (uint32_t)l_url.m_host.length());
        }
        else if (l_url.m_scheme == SCHEME_TCP)
        {
                m_nconn = new nconn_tcp();
        }
        else
        {
                TRC_ERROR("unsupported scheme: %d\n", l_url.m_scheme);
                return HLAT_STATUS_ERROR;
        }
        bool l_no_delay = true;
        SET_NCONN_OPT((*m_nconn), nconn_tcp::OPT_TCP_NO_DELAY, &l_no_delay, sizeof(bool));
        m_nconn->set_label(l_url.m_host);
        m_nconn->set_evr_loop(m_evr_loop);
        m_nconn->setup_evr_fd(evr_fd_readable_cb,
                              evr_fd_writeable_cb,
                              evr_fd_error_cb);
        m_nconn->set_data(this);
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: build request and response parser -connection is usable
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::srequest(void)
{
        const url_t &l_url = m_conf.m_url;
        char l_buf[2048];
        int l_len;
        l_len = snprintf(l_buf, sizeof(l_buf),
                         "GET %s HTTP/1.1\r\n"
                         "Host: %s\r\n"
                         "User-Agent: %s\r\n"
                         "Accept: */*\r\n"
                         "Connection: close\r\n"
                         "\r\n",
                         l_url.target().c_str(),
                         l_url.host_hdr().c_str(),
                         m_conf.m_user_agent.c_str());
        if ((l_len <= 0) ||
           ((size_t)l_len >= sizeof(l_buf)))
        {
                TRC_ERROR("request too large\n");
                return HLAT_STATUS_ERROR;
        }
        m_out_buf.assign(l_buf, l_len);
        m_out_off = 0;
        if (m_conf.m_verbose)
        {
                if (m_conf.m_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_WHITE);
                TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
                TRC_OUTPUT("|                                R E Q U E S T                                 |\n");
                TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
                if (m_conf.m_color) TRC_OUTPUT("%s", ANSI_COLOR_OFF);
                TRC_OUTPUT("%s", m_out_buf.c_str());
        }
        // -------------------------------------------------
        // create resp
        // -------------------------------------------------
        if (!m_resp)
        {
                m_resp = new resp();
        }
        m_resp->init(m_conf.m_verbose);
        // -------------------------------------------------
        // connect timer -> idle timer
        // -------------------------------------------------
        cancel_timer();
        m_last_active_ms = get_time_ms();
        int32_t l_s;
        l_s = set_timer(m_conf.m_idle_timeout_ms);
        if (l_s != HLAT_STATUS_OK)
        {
                return HLAT_STATUS_ERROR;
        }
        m_state = STATE_SENDING;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::swrite(void)
{
        while (m_out_off < m_out_buf.length())
        {
                uint32_t l_written = 0;
                int32_t l_s;
                l_s = m_nconn->nc_write(m_out_buf.data() + m_out_off,
                                        (uint32_t)(m_out_buf.length() - m_out_off),
                                        l_written);
                if (l_s == nconn::NC_STATUS_AGAIN)
                {
                        return HLAT_STATUS_OK;
                }
                if (l_s != nconn::NC_STATUS_OK)
                {
                        return fail_conn();
                }
                m_out_off += l_written;
        }
        m_state = STATE_RECEIVING;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: read until would block -edge triggered
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::sread(void)
{
        while (true)
        {
                uint32_t l_read = 0;
                int32_t l_s;
                l_s = m_nconn->nc_read(m_in_buf, sizeof(m_in_buf), l_read);
                switch(l_s)
                {
                // -----------------------------------------
                // NC_STATUS_OK
                // -----------------------------------------
                case nconn::NC_STATUS_OK:
                {
                        if (!m_cp.m_first_byte)
                        {
                                m_cp.m_first_byte = get_time_ns();
                        }
                        m_last_active_ms = get_time_ms();
                        l_s = m_resp->parse(m_in_buf, l_read);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                return fail(PROBE_STAGE_RECV, CONN_STATUS_ERROR_RECV, m_resp->get_last_error());
                        }
                        if (m_resp->m_complete)
                        {
                                return complete();
                        }
                        break;
                }
                // -----------------------------------------
                // NC_STATUS_AGAIN
                // -----------------------------------------
                case nconn::NC_STATUS_AGAIN:
                {
                        return HLAT_STATUS_OK;
                }
                // -----------------------------------------
                // NC_STATUS_EOF
                // -----------------------------------------
                case nconn::NC_STATUS_EOF:
                {
                        l_s = m_resp->parse_eof();
                        if (l_s != HLAT_STATUS_OK)
                        {
                                return fail(PROBE_STAGE_RECV, CONN_STATUS_ERROR_RECV, m_resp->get_last_error());
                        }
                        return complete();
                }
                // -----------------------------------------
                // NC_STATUS_ERROR
                // -----------------------------------------
                default:
                {
                        return fail_conn();
                }
                }
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: connect timeout is absolute -idle timeout is since last read
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::handle_timeout(void)
{
        char l_msg[128];
        if (m_state == STATE_CONNECTING)
        {
                snprintf(l_msg, sizeof(l_msg), "connect timed out after %u ms", m_conf.m_connect_timeout_ms);
                return fail(PROBE_STAGE_TIMEOUT, CONN_STATUS_ERROR_TIMEOUT, l_msg);
        }
        uint64_t l_idle_ms = get_delta_time_ms(m_last_active_ms);
        if (l_idle_ms >= m_conf.m_idle_timeout_ms)
        {
                snprintf(l_msg, sizeof(l_msg), "idle timed out after %u ms", m_conf.m_idle_timeout_ms);
                return fail(PROBE_STAGE_TIMEOUT, CONN_STATUS_ERROR_TIMEOUT, l_msg);
        }
        // active -create new timer with delta time
        int32_t l_s;
        l_s = set_timer((uint32_t)(m_conf.m_idle_timeout_ms - l_idle_ms));
        if (l_s != HLAT_STATUS_OK)
        {
                return fail(PROBE_STAGE_RECV, CONN_STATUS_ERROR_INTERNAL, "error setting idle timer");
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::set_timer(uint32_t a_time_ms)
{
        cancel_timer();
        return m_evr_loop->add_event(a_time_ms,
                                     evr_fd_timeout_cb,
                                     m_nconn,
                                     &m_timer_obj);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void probe::cancel_timer(void)
{
        if (m_timer_obj &&
           m_evr_loop)
        {
                m_evr_loop->cancel_event(m_timer_obj);
        }
        m_timer_obj = nullptr;
}
//! ----------------------------------------------------------------------------
//! \details: response complete -take done and derive phases
//! \return:  HLAT_STATUS_DONE
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t probe::complete(void)
{
        m_cp.m_done = get_time_ns();
        cancel_timer();
        if (m_conf.m_verbose)
        {
                if (m_conf.m_color) TRC_OUTPUT("%s", ANSI_COLOR_FG_CYAN);
                TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
                TRC_OUTPUT("|                              R E S P O N S E                                 |\n");
                TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
                if (m_conf.m_color) TRC_OUTPUT("%s", ANSI_COLOR_OFF);
                m_resp->show(m_conf.m_color);
        }
        m_nconn->nc_cleanup();
        m_state = STATE_DONE;
        int32_t l_s;
        l_s = derive_phases(m_cp, m_phase);
        if (l_s != HLAT_STATUS_OK)
        {
                m_failure.m_stage = PROBE_STAGE_RECV;
                m_failure.m_conn_status = CONN_STATUS_ERROR_INTERNAL;
                m_failure.m_msg = "incomplete checkpoints";
                m_status = HLAT_STATUS_ERROR;
                return HLAT_STATUS_DONE;
        }
        TRC_VERBOSE("probe complete: host: %s status: %u body: %lu total: %ld ns\n",
                    m_conf.m_url.m_host.c_str(),
                    m_resp->get_status(),
                    (unsigned long)m_resp->get_body_len(),
                    (long)m_phase.m_total);
        m_status = HLAT_STATUS_OK;
        return HLAT_STATUS_DONE;
}
//! ----------------------------------------------------------------------------
//! \details: record failure and tear down connection
//! \return:  HLAT_STATUS_DONE if set from loop callbacks
//!           HLAT_STATUS_ERROR returned from run
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::fail(probe_stage_t a_stage,
                    conn_status_t a_conn_status,
                    const std::string &a_msg)
{
        if (m_state == STATE_DONE)
        {
                return HLAT_STATUS_DONE;
        }
        m_failure.m_stage = a_stage;
        m_failure.m_conn_status = a_conn_status;
        m_failure.m_msg = a_msg;
        m_status = HLAT_STATUS_ERROR;
        if (a_stage != PROBE_STAGE_CANCELLED)
        {
                TRC_DEBUG("probe failed: host: %s stage: %s status: %s reason: %s\n",
                          m_conf.m_url.m_host.c_str(),
                          probe_stage_str(a_stage),
                          conn_status_str(a_conn_status),
                          a_msg.c_str());
        }
        cancel_timer();
        if (m_nconn &&
           !m_nconn->is_free())
        {
                m_nconn->nc_cleanup();
        }
        // from run -not started on the loop
        if (m_state == STATE_NONE)
        {
                m_state = STATE_DONE;
                return HLAT_STATUS_ERROR;
        }
        m_state = STATE_DONE;
        return HLAT_STATUS_DONE;
}
//! ----------------------------------------------------------------------------
//! \details: fail with connection status and last error
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::fail_conn(void)
{
        conn_status_t l_cs = CONN_STATUS_ERROR_INTERNAL;
        std::string l_msg;
        if (m_nconn)
        {
                l_cs = m_nconn->get_status();
                l_msg = m_nconn->get_last_error();
        }
        probe_stage_t l_stage = probe_stage_from_conn_status(l_cs);
        if (l_stage == PROBE_STAGE_NONE)
        {
                l_cs = CONN_STATUS_ERROR_INTERNAL;
                switch(m_state)
                {
                case STATE_SENDING:
                {
                        l_stage = PROBE_STAGE_SEND;
                        break;
                }
                case STATE_RECEIVING:
                {
                        l_stage = PROBE_STAGE_RECV;
                        break;
                }
                default:
                {
                        l_stage = PROBE_STAGE_CONNECT;
                        break;
                }
                }
        }
        if (l_msg.empty())
        {
                l_msg = conn_status_str(l_cs);
        }
        return fail(l_stage, l_cs, l_msg);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool probe::is_stopped(void) const
{
        if (!m_stop)
        {
                return false;
        }
        return ((uint32_t)(*m_stop) != 0);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  HLAT_STATUS_DONE once the probe completed or failed
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t probe::run_state_machine(void *a_data, evr_mode_t a_conn_mode)
{
        if (!a_data)
        {
                return HLAT_STATUS_OK;
        }
        nconn *l_nconn = static_cast<nconn *>(a_data);
        CHECK_FOR_NULL_ERROR(l_nconn->get_data());
        probe *l_probe = static_cast<probe *>(l_nconn->get_data());
        if (l_probe->m_state == STATE_DONE)
        {
                return HLAT_STATUS_DONE;
        }
        // -------------------------------------------------
        // ERROR
        // -------------------------------------------------
        if (a_conn_mode == EVR_MODE_ERROR)
        {
                return l_probe->fail((l_probe->m_state == STATE_CONNECTING) ? PROBE_STAGE_CONNECT : PROBE_STAGE_RECV,
                                     (l_probe->m_state == STATE_CONNECTING) ? CONN_STATUS_ERROR_CONNECT : CONN_STATUS_ERROR_RECV,
                                     "connection error");
        }
        // -------------------------------------------------
        // TIMEOUT
        // -------------------------------------------------
        else if (a_conn_mode == EVR_MODE_TIMEOUT)
        {
                // fired event is released by the loop
                l_probe->m_timer_obj = nullptr;
                return l_probe->handle_timeout();
        }
        // --------------------------------------------------
        // **************************************************
        // state machine
        // **************************************************
        // --------------------------------------------------
state_top:
        switch(l_nconn->get_state())
        {
        // -------------------------------------------------
        // STATE: FREE
        // -------------------------------------------------
        case nconn::NC_STATE_FREE:
        {
                int32_t l_s;
                l_s = l_nconn->ncsetup();
                if (l_s != nconn::NC_STATUS_OK)
                {
                        TRC_ERROR("performing ncsetup for host: %s\n", l_nconn->get_label().c_str());
                        return l_probe->fail_conn();
                }
                l_nconn->set_state(nconn::NC_STATE_CONNECTING);
                goto state_top;
        }
        // -------------------------------------------------
        // STATE: CONNECTING
        // -------------------------------------------------
        case nconn::NC_STATE_CONNECTING:
        {
                int32_t l_s;
                l_s = l_nconn->ncconnect();
                if (l_s == nconn::NC_STATUS_ERROR)
                {
                        return l_probe->fail_conn();
                }
                if (l_nconn->is_connecting())
                {
                        return HLAT_STATUS_OK;
                }
                l_nconn->set_state(nconn::NC_STATE_CONNECTED);
                // -----------------------------------------
                // checkpoints
                // -----------------------------------------
                l_probe->m_cp.m_conn_done = nconn_get_connected_ns(*l_nconn);
                l_probe->m_cp.m_got_conn = get_time_ns();
                if (l_probe->m_conf.m_verbose)
                {
                        l_s = show_tls_info(l_nconn);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                TRC_ERROR("performing show_tls_info\n");
                        }
                }
                // -----------------------------------------
                // start request
                // -----------------------------------------
                l_s = l_probe->srequest();
                if (l_s != HLAT_STATUS_OK)
                {
                        return l_probe->fail(PROBE_STAGE_SEND, CONN_STATUS_ERROR_INTERNAL, "error creating request");
                }
                goto state_top;
        }
        // -------------------------------------------------
        // STATE: CONNECTED
        // -------------------------------------------------
        case nconn::NC_STATE_CONNECTED:
        {
                int32_t l_s;
                if (l_probe->m_state == STATE_SENDING)
                {
                        l_s = l_probe->swrite();
                        if ((l_s != HLAT_STATUS_OK) ||
                           (l_probe->m_state != STATE_RECEIVING))
                        {
                                return l_s;
                        }
                }
                if (l_probe->m_state == STATE_RECEIVING)
                {
                        return l_probe->sread();
                }
                return HLAT_STATUS_OK;
        }
        default:
        {
                TRC_ERROR("unexpected connection state: %d\n", l_nconn->get_state());
                return l_probe->fail(PROBE_STAGE_CONNECT, CONN_STATUS_ERROR_INTERNAL, "unexpected connection state");
        }
        }
        return HLAT_STATUS_OK;
}
} //namespace ns_hlat {
