//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn_tls.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_NCONN_TLS_H
#define _HLAT_NCONN_TLS_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "nconn/nconn_tcp.h"
//! ----------------------------------------------------------------------------
//! ext fwd decl's
//! ----------------------------------------------------------------------------
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class nconn_tls: public nconn_tcp
{
public:
        // -------------------------------------------------
        // Connection state
        // -------------------------------------------------
        typedef enum tls_state
        {
                TLS_STATE_NONE,
                TLS_STATE_CONNECTING,
                TLS_STATE_TLS_CONNECTING,
                TLS_STATE_TLS_CONNECTING_WANT_READ,
                TLS_STATE_TLS_CONNECTING_WANT_WRITE,
                TLS_STATE_CONNECTED
        } tls_state_t;
        // -------------------------------------------------
        // Options
        // -------------------------------------------------
        typedef enum tls_opt_enum
        {
                OPT_TLS_CTX = 1000,
                OPT_TLS_SSL = 1003,
                // Verify options
                OPT_TLS_VERIFY = 1100,
                OPT_TLS_SNI = 1102,
                OPT_TLS_HOSTNAME = 1103,
                // sentinel
                OPT_TLS_SENTINEL = 1999
        } tls_opt_t;
        // -------------------------------------------------
        // Public methods
        // -------------------------------------------------
        nconn_tls():
          nconn_tcp(),
          m_tls_ctx(nullptr),
          m_tls(nullptr),
          m_tls_opt_verify(false),
          m_tls_opt_sni(false),
          m_tls_opt_hostname(""),
          m_tls_state(TLS_STATE_NONE),
          m_last_err(0)
        {
                m_scheme = SCHEME_TLS;
        };
        ~nconn_tls();
        int32_t set_opt(uint32_t a_opt, const void *a_buf, uint32_t a_len);
        int32_t get_opt(uint32_t a_opt, void **a_buf, uint32_t *a_len);
        bool is_connecting(void) {return ((m_tls_state == TLS_STATE_CONNECTING) ||
                                          (m_tls_state == TLS_STATE_TLS_CONNECTING) ||
                                          (m_tls_state == TLS_STATE_TLS_CONNECTING_WANT_READ) ||
                                          (m_tls_state == TLS_STATE_TLS_CONNECTING_WANT_WRITE));};
        // -------------------------------------------------
        // virtual methods
        // -------------------------------------------------
        int32_t ncsetup();
        int32_t ncread(char *a_buf, uint32_t a_buf_len);
        int32_t ncwrite(const char *a_buf, uint32_t a_buf_len);
        int32_t ncconnect();
        int32_t nccleanup();
private:
        // -------------------------------------------------
        // Private methods
        // -------------------------------------------------
        nconn_tls& operator=(const nconn_tls &);
        nconn_tls(const nconn_tls &);
        int32_t tls_connect(void);
        int32_t init(void);
        // -------------------------------------------------
        // Private members
        // -------------------------------------------------
        SSL_CTX * m_tls_ctx;
        SSL *m_tls;
        bool m_tls_opt_verify;
        bool m_tls_opt_sni;
        std::string m_tls_opt_hostname;
        tls_state_t m_tls_state;
        long m_last_err;
};
//! ----------------------------------------------------------------------------
//! \prototypes:
//! ----------------------------------------------------------------------------
SSL_CTX* tls_init_ctx(const std::string &a_cipher_list,
                      long a_options = 0);
int32_t show_tls_info(nconn *a_nconn);
} //namespace ns_hlat {
#endif
