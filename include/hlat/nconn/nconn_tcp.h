//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn_tcp.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_NCONN_TCP_H
#define _HLAT_NCONN_TCP_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "nconn/nconn.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class nconn_tcp: public nconn
{
public:
        // -------------------------------------------------
        // Connection state
        // -------------------------------------------------
        typedef enum tcp_conn_state
        {
                TCP_STATE_NONE,
                TCP_STATE_CONNECTING,
                TCP_STATE_CONNECTED,
                TCP_STATE_DONE
        } tcp_conn_state_t;
        // -------------------------------------------------
        // Options
        // -------------------------------------------------
        typedef enum tcp_opt_enum
        {
                OPT_TCP_NO_DELAY = 2,
                OPT_TCP_FD = 100,
                OPT_TCP_CONNECTED_NS = 101,
                OPT_TCP_SENTINEL = 999
        } tcp_opt_t;
        // -------------------------------------------------
        // Public methods
        // -------------------------------------------------
        nconn_tcp():
          nconn(),
          m_fd(-1),
          m_sock_opt_no_delay(false),
          m_connected_ns(0),
          m_tcp_state(TCP_STATE_NONE)
        {
                m_scheme = SCHEME_TCP;
        };
        ~nconn_tcp();
        int32_t set_opt(uint32_t a_opt, const void *a_buf, uint32_t a_len);
        int32_t get_opt(uint32_t a_opt, void **a_buf, uint32_t *a_len);
        bool is_connecting(void) {return (m_tcp_state == TCP_STATE_CONNECTING);};
        // -------------------------------------------------
        // virtual methods
        // -------------------------------------------------
        int32_t ncsetup();
        int32_t ncread(char *a_buf, uint32_t a_buf_len);
        int32_t ncwrite(const char *a_buf, uint32_t a_buf_len);
        int32_t ncconnect();
        int32_t nccleanup();
        // -------------------------------------------------
        // Protected members
        // -------------------------------------------------
        int m_fd;
        bool m_sock_opt_no_delay;
        // monotonic time tcp connect completed
        int64_t m_connected_ns;
private:
        // -------------------------------------------------
        // Private methods
        // -------------------------------------------------
        nconn_tcp& operator=(const nconn_tcp &);
        nconn_tcp(const nconn_tcp &);
        // -------------------------------------------------
        // Private members
        // -------------------------------------------------
        tcp_conn_state_t m_tcp_state;
};
//! ----------------------------------------------------------------------------
//! nconn_utils
//! ----------------------------------------------------------------------------
int nconn_get_fd(nconn &a_nconn);
int64_t nconn_get_connected_ns(nconn &a_nconn);
} //namespace ns_hlat {
#endif
