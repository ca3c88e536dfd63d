//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_orchestrator.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "catch2/catch.hpp"
#include "status.h"
#include "probe/orchestrator.h"
#include "probe/result_set.h"
#include "probe/aggregator.h"
#include "probe/phase.h"
#include "support/atomic.h"
#include "support/time_util.h"
#include <unistd.h>
#include <string.h>
#include <poll.h>
#include <pthread.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <string>
#include <vector>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _RESP_BODY "HTTP/1.1 200 OK\r\nContent-Length: 11\r\nConnection: close\r\n\r\nhello world"
#define _RESP_EMPTY "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"
#define _RESP_TRICKLE_HDR "HTTP/1.1 200 OK\r\nContent-Length: 8\r\nConnection: close\r\n\r\n"
#define _RESP_TRICKLE_BODY "abcdefgh"
#define _TRICKLE_GAP_MS 40
//! ----------------------------------------------------------------------------
//! \details: minimal blocking http server on 127.0.0.1 -one request per
//!           connection served from a single thread
//!           -SERVE_RESPOND: write response and close
//!           -SERVE_HANG: keep connection open, never respond. Once
//!            a_hold_max connections are held further ones are closed
//!            without a response (0: hold all)
//!           -SERVE_TRICKLE: write headers then one body byte per gap
//! ----------------------------------------------------------------------------
class local_server
{
public:
        typedef enum serve_enum
        {
                SERVE_RESPOND = 0,
                SERVE_HANG,
                SERVE_TRICKLE
        } serve_t;
        local_server(const char *a_resp,
                     serve_t a_serve = SERVE_RESPOND,
                     uint32_t a_hold_max = 0):
                m_resp(a_resp),
                m_serve(a_serve),
                m_hold_max(a_hold_max),
                m_held(),
                m_fd(-1),
                m_port(0),
                m_stop(0),
                m_served(0),
                m_thread()
        {}
        ~local_server()
        {
                stop();
        }
        int32_t start(void)
        {
                m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
                if (m_fd < 0)
                {
                        return HLAT_STATUS_ERROR;
                }
                int l_opt = 1;
                ::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &l_opt, sizeof(l_opt));
                struct sockaddr_in l_sa;
                memset(&l_sa, 0, sizeof(l_sa));
                l_sa.sin_family = AF_INET;
                l_sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
                socklen_t l_len = sizeof(l_sa);
                if ((::bind(m_fd, (struct sockaddr *)&l_sa, sizeof(l_sa)) != 0) ||
                   (::listen(m_fd, 128) != 0) ||
                   (::getsockname(m_fd, (struct sockaddr *)&l_sa, &l_len) != 0))
                {
                        return HLAT_STATUS_ERROR;
                }
                m_port = ntohs(l_sa.sin_port);
                if (pthread_create(&m_thread, nullptr, t_run_static, this) != 0)
                {
                        return HLAT_STATUS_ERROR;
                }
                return HLAT_STATUS_OK;
        }
        void stop(void)
        {
                if (m_fd < 0)
                {
                        return;
                }
                m_stop = 1;
                pthread_join(m_thread, nullptr);
                for (std::vector<int>::iterator i_fd = m_held.begin(); i_fd != m_held.end(); ++i_fd)
                {
                        ::close(*i_fd);
                }
                m_held.clear();
                ::close(m_fd);
                m_fd = -1;
        }
        std::string url(void) const
        {
                return "http://127.0.0.1:" + std::to_string(m_port) + "/";
        }
        uint32_t get_served(void) { return (uint32_t)m_served; }
private:
        local_server& operator=(const local_server &);
        local_server(const local_server &);
        static void *t_run_static(void *a_context)
        {
                return static_cast<local_server *>(a_context)->t_run();
        }
        void *t_run(void)
        {
                while (!(uint32_t)m_stop)
                {
                        struct pollfd l_pfd;
                        l_pfd.fd = m_fd;
                        l_pfd.events = POLLIN;
                        l_pfd.revents = 0;
                        if (::poll(&l_pfd, 1, 20) <= 0)
                        {
                                continue;
                        }
                        int l_cfd = ::accept(m_fd, nullptr, nullptr);
                        if (l_cfd < 0)
                        {
                                continue;
                        }
                        // read request headers
                        std::string l_req;
                        char l_buf[1024];
                        while (l_req.find("\r\n\r\n") == std::string::npos)
                        {
                                ssize_t l_r = ::recv(l_cfd, l_buf, sizeof(l_buf), 0);
                                if (l_r <= 0)
                                {
                                        break;
                                }
                                l_req.append(l_buf, l_r);
                        }
                        if (l_req.compare(0, 4, "GET ") != 0)
                        {
                                ::close(l_cfd);
                                continue;
                        }
                        switch (m_serve)
                        {
                        case SERVE_HANG:
                        {
                                if (!m_hold_max ||
                                   (m_held.size() < m_hold_max))
                                {
                                        m_held.push_back(l_cfd);
                                        l_cfd = -1;
                                }
                                break;
                        }
                        case SERVE_TRICKLE:
                        {
                                int l_opt = 1;
                                ::setsockopt(l_cfd, IPPROTO_TCP, TCP_NODELAY, &l_opt, sizeof(l_opt));
                                ::send(l_cfd, m_resp, strlen(m_resp), MSG_NOSIGNAL);
                                const char *l_body = _RESP_TRICKLE_BODY;
                                for (size_t i_c = 0; i_c < strlen(l_body); ++i_c)
                                {
                                        usleep(_TRICKLE_GAP_MS*1000);
                                        ::send(l_cfd, l_body + i_c, 1, MSG_NOSIGNAL);
                                }
                                ++m_served;
                                break;
                        }
                        default:
                        {
                                ::send(l_cfd, m_resp, strlen(m_resp), MSG_NOSIGNAL);
                                ++m_served;
                                break;
                        }
                        }
                        if (l_cfd >= 0)
                        {
                                ::close(l_cfd);
                        }
                }
                return nullptr;
        }
        const char *m_resp;
        serve_t m_serve;
        uint32_t m_hold_max;
        std::vector<int> m_held;
        int m_fd;
        uint16_t m_port;
        ns_hlat::uint32_atomic_t m_stop;
        ns_hlat::uint32_atomic_t m_served;
        pthread_t m_thread;
};
//! ----------------------------------------------------------------------------
//! \details: port with nothing listening
//! \return:  port
//! ----------------------------------------------------------------------------
static uint16_t closed_port(void)
{
        int l_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in l_sa;
        memset(&l_sa, 0, sizeof(l_sa));
        l_sa.sin_family = AF_INET;
        l_sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t l_len = sizeof(l_sa);
        ::bind(l_fd, (struct sockaddr *)&l_sa, sizeof(l_sa));
        ::getsockname(l_fd, (struct sockaddr *)&l_sa, &l_len);
        ::close(l_fd);
        return ntohs(l_sa.sin_port);
}
//! ----------------------------------------------------------------------------
//! \details: listener with a full accept queue -further SYNs are dropped so
//!           connects never complete
//! ----------------------------------------------------------------------------
class full_listener
{
public:
        full_listener(void):
                m_fd(-1),
                m_filler_fd(-1),
                m_port(0)
        {}
        ~full_listener()
        {
                if (m_filler_fd >= 0) ::close(m_filler_fd);
                if (m_fd >= 0) ::close(m_fd);
        }
        int32_t start(void)
        {
                m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
                if (m_fd < 0)
                {
                        return HLAT_STATUS_ERROR;
                }
                struct sockaddr_in l_sa;
                memset(&l_sa, 0, sizeof(l_sa));
                l_sa.sin_family = AF_INET;
                l_sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
                socklen_t l_len = sizeof(l_sa);
                if ((::bind(m_fd, (struct sockaddr *)&l_sa, sizeof(l_sa)) != 0) ||
                   (::listen(m_fd, 0) != 0) ||
                   (::getsockname(m_fd, (struct sockaddr *)&l_sa, &l_len) != 0))
                {
                        return HLAT_STATUS_ERROR;
                }
                m_port = ntohs(l_sa.sin_port);
                // fill accept queue -never accepted
                m_filler_fd = ::socket(AF_INET, SOCK_STREAM, 0);
                if ((m_filler_fd < 0) ||
                   (::connect(m_filler_fd, (struct sockaddr *)&l_sa, sizeof(l_sa)) != 0))
                {
                        return HLAT_STATUS_ERROR;
                }
                usleep(50*1000);
                return HLAT_STATUS_OK;
        }
        std::string url(void) const
        {
                return "http://127.0.0.1:" + std::to_string(m_port) + "/";
        }
private:
        full_listener& operator=(const full_listener &);
        full_listener(const full_listener &);
        int m_fd;
        int m_filler_fd;
        uint16_t m_port;
};
//! ----------------------------------------------------------------------------
//! raise stop flag the way the SIGINT handler does
//! ----------------------------------------------------------------------------
static void *t_stop_after(void *a_context)
{
        usleep(200*1000);
        *(static_cast<ns_hlat::uint32_atomic_t *>(a_context)) = 1;
        return nullptr;
}
//! ----------------------------------------------------------------------------
//! appender for concurrency test
//! ----------------------------------------------------------------------------
#define _APPENDS_PER_THREAD 1000
static void *t_append(void *a_context)
{
        ns_hlat::result_set *l_rs = static_cast<ns_hlat::result_set *>(a_context);
        for (uint32_t i_a = 0; i_a < _APPENDS_PER_THREAD; ++i_a)
        {
                ns_hlat::phase_t l_p;
                l_p.m_dns_lookup = i_a;
                l_p.m_total = i_a;
                l_rs->add(l_p);
        }
        return nullptr;
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "orchestrator", "[orchestrator]" )
{
        SECTION("fixed count")
        {
                local_server l_srvr(_RESP_BODY);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 10;
                l_conf.m_samples = 0;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_NONE));
                REQUIRE((l_rs.get_size() == 10));
                REQUIRE((l_rs.get_num_failures() == 0));
                const ns_hlat::phase_vector_t &l_v = l_rs.get_phases();
                for (ns_hlat::phase_vector_t::const_iterator i_p = l_v.begin(); i_p != l_v.end(); ++i_p)
                {
                        // ip literal -no lookup
                        REQUIRE((i_p->m_dns_lookup == 0));
                        REQUIRE((i_p->m_tcp_connection >= 0));
                        REQUIRE((i_p->m_server_processing >= 0));
                        REQUIRE((i_p->m_content_transfer >= 0));
                        REQUIRE((i_p->m_total > 0));
                        REQUIRE((ns_hlat::phase_sum_is_exact(*i_p) == true));
                }
                ns_hlat::phase_t l_sum;
                REQUIRE((ns_hlat::summarize(l_rs, l_sum) == HLAT_STATUS_OK));
                l_srvr.stop();
                REQUIRE((l_srvr.get_served() == 10));
        }
        SECTION("empty body")
        {
                local_server l_srvr(_RESP_EMPTY);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 1;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_rs.get_size() == 1));
                const ns_hlat::phase_t &l_p = l_rs.get_phases().front();
                REQUIRE((l_p.m_dns_lookup >= 0));
                REQUIRE((l_p.m_tcp_connection >= 0));
                REQUIRE((l_p.m_connection_acquisition >= 0));
                REQUIRE((l_p.m_server_processing >= 0));
                REQUIRE((l_p.m_content_transfer >= 0));
                REQUIRE((l_p.m_total > 0));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("target count")
        {
                local_server l_srvr(_RESP_BODY);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 3;
                l_conf.m_samples = 10;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_rs.get_num_failures() == 0));
                REQUIRE((l_rs.get_size() >= 10));
                REQUIRE((l_rs.get_size() <= 12));
        }
        SECTION("concurrent appends")
        {
                ns_hlat::result_set l_rs;
                pthread_t l_t[8];
                for (uint32_t i_t = 0; i_t < 8; ++i_t)
                {
                        REQUIRE((pthread_create(&(l_t[i_t]), nullptr, t_append, &l_rs) == 0));
                }
                for (uint32_t i_t = 0; i_t < 8; ++i_t)
                {
                        pthread_join(l_t[i_t], nullptr);
                }
                REQUIRE((l_rs.get_size() == 8*_APPENDS_PER_THREAD));
                REQUIRE((l_rs.get_completed() == 8*_APPENDS_PER_THREAD));
                int64_t l_total = 0;
                const ns_hlat::phase_vector_t &l_v = l_rs.get_phases();
                for (ns_hlat::phase_vector_t::const_iterator i_p = l_v.begin(); i_p != l_v.end(); ++i_p)
                {
                        REQUIRE((i_p->m_dns_lookup == i_p->m_total));
                        l_total += i_p->m_total;
                }
                REQUIRE((l_total == 8*((_APPENDS_PER_THREAD*(_APPENDS_PER_THREAD - 1))/2)));
        }
}
TEST_CASE( "orchestrator failures", "[orchestrator]" )
{
        SECTION("unresolvable host collect errors")
        {
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = "http://nonexistent.invalid/";
                l_conf.m_concurrency = 5;
                l_conf.m_failure_policy = ns_hlat::orchestrator::FAILURE_POLICY_COLLECT_ERRORS;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_ALL_PROBES_FAILED));
                REQUIRE((l_rs.get_size() == 0));
                REQUIRE((l_rs.get_num_failures() == 5));
                ns_hlat::phase_t l_sum;
                ns_hlat::hlat_err_t l_err = ns_hlat::HLAT_ERR_NONE;
                REQUIRE((ns_hlat::summarize(l_rs, l_sum, &l_err) == HLAT_STATUS_ERROR));
                REQUIRE((l_err == ns_hlat::HLAT_ERR_EMPTY_RESULT_SET));
                REQUIRE((l_rs.get_failures().front().m_stage == ns_hlat::PROBE_STAGE_RESOLVE));
                REQUIRE((l_rs.get_failures().front().m_conn_status == ns_hlat::CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE));
        }
        SECTION("connection refused fail fast")
        {
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = "http://127.0.0.1:" + std::to_string(closed_port()) + "/";
                l_conf.m_concurrency = 2;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_NETWORK_FAILURE));
                REQUIRE((l_orch.get_failure().m_stage == ns_hlat::PROBE_STAGE_CONNECT));
                REQUIRE((l_orch.get_err_msg().find("connect failed") == 0));
        }
        SECTION("invalid input")
        {
                ns_hlat::result_set l_rs;
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = "http://127.0.0.1/";
                l_conf.m_concurrency = 0;
                ns_hlat::orchestrator l_orch_c(l_conf);
                REQUIRE((l_orch_c.run(l_rs) == HLAT_STATUS_ERROR));
                REQUIRE((l_orch_c.get_err() == ns_hlat::HLAT_ERR_INVALID_INPUT));
                l_conf.m_concurrency = 1;
                l_conf.m_url = "";
                ns_hlat::orchestrator l_orch_u(l_conf);
                REQUIRE((l_orch_u.run(l_rs) == HLAT_STATUS_ERROR));
                REQUIRE((l_orch_u.get_err() == ns_hlat::HLAT_ERR_INVALID_INPUT));
                l_conf.m_url = "ftp://127.0.0.1/";
                ns_hlat::orchestrator l_orch_s(l_conf);
                REQUIRE((l_orch_s.run(l_rs) == HLAT_STATUS_ERROR));
                REQUIRE((l_orch_s.get_err() == ns_hlat::HLAT_ERR_INVALID_INPUT));
                REQUIRE((l_rs.get_completed() == 0));
        }
}
TEST_CASE( "orchestrator timeouts", "[orchestrator]" )
{
        SECTION("connect timeout")
        {
                full_listener l_lsnr;
                REQUIRE((l_lsnr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_lsnr.url();
                l_conf.m_concurrency = 1;
                l_conf.m_connect_timeout_ms = 200;
                l_conf.m_failure_policy = ns_hlat::orchestrator::FAILURE_POLICY_COLLECT_ERRORS;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                uint64_t l_start_ms = ns_hlat::get_time_ms();
                REQUIRE((l_orch.run(l_rs) == HLAT_STATUS_ERROR));
                uint64_t l_elapsed_ms = ns_hlat::get_delta_time_ms(l_start_ms);
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_ALL_PROBES_FAILED));
                REQUIRE((l_rs.get_num_failures() == 1));
                const ns_hlat::probe_failure_t &l_f = l_rs.get_failures().front();
                REQUIRE((l_f.m_stage == ns_hlat::PROBE_STAGE_TIMEOUT));
                REQUIRE((l_f.m_conn_status == ns_hlat::CONN_STATUS_ERROR_TIMEOUT));
                REQUIRE((l_f.m_msg.find("connect timed out") == 0));
                REQUIRE((l_elapsed_ms >= 200));
                REQUIRE((l_elapsed_ms < 5000));
        }
        SECTION("idle timeout")
        {
                local_server l_srvr(_RESP_BODY, local_server::SERVE_HANG);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 2;
                l_conf.m_idle_timeout_ms = 100;
                l_conf.m_failure_policy = ns_hlat::orchestrator::FAILURE_POLICY_COLLECT_ERRORS;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                REQUIRE((l_orch.run(l_rs) == HLAT_STATUS_ERROR));
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_ALL_PROBES_FAILED));
                REQUIRE((l_rs.get_size() == 0));
                REQUIRE((l_rs.get_num_failures() == 2));
                const ns_hlat::probe_failure_list_t &l_fv = l_rs.get_failures();
                for (ns_hlat::probe_failure_list_t::const_iterator i_f = l_fv.begin(); i_f != l_fv.end(); ++i_f)
                {
                        REQUIRE((i_f->m_stage == ns_hlat::PROBE_STAGE_TIMEOUT));
                        REQUIRE((i_f->m_conn_status == ns_hlat::CONN_STATUS_ERROR_TIMEOUT));
                        REQUIRE((i_f->m_msg.find("idle timed out") == 0));
                }
        }
        SECTION("slow body within idle timeout")
        {
                // body takes ~8 gaps -longer than idle timeout but never idle that long
                local_server l_srvr(_RESP_TRICKLE_HDR, local_server::SERVE_TRICKLE);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 1;
                l_conf.m_idle_timeout_ms = 150;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                REQUIRE((l_orch.run(l_rs) == HLAT_STATUS_OK));
                REQUIRE((l_rs.get_size() == 1));
                const ns_hlat::phase_t &l_p = l_rs.get_phases().front();
                REQUIRE((l_p.m_content_transfer > 150*HLAT_NS_PER_MS));
                REQUIRE((ns_hlat::phase_sum_is_exact(l_p) == true));
        }
        SECTION("fail fast cancels in flight")
        {
                // first two connections hang -third is closed without response
                local_server l_srvr(_RESP_BODY, local_server::SERVE_HANG, 2);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 3;
                l_conf.m_idle_timeout_ms = 5000;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                uint64_t l_start_ms = ns_hlat::get_time_ms();
                REQUIRE((l_orch.run(l_rs) == HLAT_STATUS_ERROR));
                uint64_t l_elapsed_ms = ns_hlat::get_delta_time_ms(l_start_ms);
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_NETWORK_FAILURE));
                REQUIRE((l_orch.get_failure().m_stage == ns_hlat::PROBE_STAGE_RECV));
                // cancelled probes are not recorded
                REQUIRE((l_rs.get_size() == 0));
                REQUIRE((l_rs.get_num_failures() == 0));
                REQUIRE((l_rs.get_completed() == 0));
                REQUIRE((l_elapsed_ms < 2000));
        }
        SECTION("stop before run completes")
        {
                local_server l_srvr(_RESP_BODY, local_server::SERVE_HANG);
                REQUIRE((l_srvr.start() == HLAT_STATUS_OK));
                ns_hlat::orchestrator::conf_t l_conf;
                l_conf.m_url = l_srvr.url();
                l_conf.m_concurrency = 2;
                l_conf.m_idle_timeout_ms = 5000;
                ns_hlat::orchestrator l_orch(l_conf);
                ns_hlat::result_set l_rs;
                pthread_t l_t;
                REQUIRE((pthread_create(&l_t, nullptr, t_stop_after, l_orch.get_stop_flag()) == 0));
                uint64_t l_start_ms = ns_hlat::get_time_ms();
                int32_t l_s;
                l_s = l_orch.run(l_rs);
                uint64_t l_elapsed_ms = ns_hlat::get_delta_time_ms(l_start_ms);
                pthread_join(l_t, nullptr);
                REQUIRE((l_s == HLAT_STATUS_ERROR));
                REQUIRE((l_orch.get_err() == ns_hlat::HLAT_ERR_NETWORK_FAILURE));
                REQUIRE((l_orch.get_failure().m_stage == ns_hlat::PROBE_STAGE_CANCELLED));
                REQUIRE((l_rs.get_completed() == 0));
                REQUIRE((l_elapsed_ms < 2000));
        }
}
