//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn_tls.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "support/time_util.h"
#include "support/trace.h"
#include "support/tls_util.h"
#include "support/ndebug.h"
#include "nconn/nconn_tls.h"
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <set>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _HLAT_EX_DATA_IDX 0
// wire format alpn list
#define _ALPN_PROTO_ADV_H1 "\x8http/1.1"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! list of ciphersuites OpenSSL supports for TLSv1.3
//! ----------------------------------------------------------------------------
static const std::set<std::string> g_valid_ciphersuites = {
        "TLS_AES_128_GCM_SHA256",
        "TLS_AES_256_GCM_SHA384",
        "TLS_CHACHA20_POLY1305_SHA256",
        "TLS_AES_128_CCM_SHA256",
        "TLS_AES_128_CCM_8_SHA256"
};
//! ----------------------------------------------------------------------------
//! \details: Seperate a combined ciphers list into ciphers (< TLSv1.3) and
//!           ciphersuites (TLSv1.3) safe to pass to SSL_CTX_set_cipher_list
//!           and SSL_CTX_set_ciphersuites respectively.
//! \return:  NA
//! \param:   a_list: ":" delimited cipher list
//! ----------------------------------------------------------------------------
static void split_ciphers_ciphersuites(const std::string& a_list,
                                       std::string& ao_ciphers,
                                       std::string& ao_ciphersuites)
{
        ao_ciphers.clear();
        ao_ciphersuites.clear();
        std::string l_delim = ":";
        size_t l_start = 0U;
        while (l_start <= a_list.length())
        {
                size_t l_end = a_list.find(l_delim, l_start);
                if (l_end == std::string::npos)
                {
                        l_end = a_list.length();
                }
                std::string l_field = a_list.substr(l_start, l_end - l_start);
                l_start = l_end + l_delim.length();
                if (l_field.empty())
                {
                        continue;
                }
                std::string &l_dst = (g_valid_ciphersuites.find(l_field) != g_valid_ciphersuites.end()) ?
                                     ao_ciphersuites : ao_ciphers;
                if (!l_dst.empty())
                {
                        l_dst += ":";
                }
                l_dst += l_field;
        }
}
//! ----------------------------------------------------------------------------
//! \details: create client ctx -shared read-only across threads
//! \return:  ctx on success, nullptr on failure
//! \param:   a_cipher_list: optional cipher list
//! \param:   a_options: SSL_OP_* options
//! ----------------------------------------------------------------------------
SSL_CTX* tls_init_ctx(const std::string &a_cipher_list,
                      long a_options)
{
        // -------------------------------------------------
        // create CTX*
        // -------------------------------------------------
        SSL_CTX *l_ctx;
        l_ctx = SSL_CTX_new(TLS_client_method());
        if (l_ctx == nullptr)
        {
                TRC_ERROR("SSL_CTX_new Error: %s\n", ERR_error_string(ERR_get_error(), nullptr));
                return nullptr;
        }
        // -------------------------------------------------
        // set ciphers/cipherlists
        // -------------------------------------------------
        if (!a_cipher_list.empty())
        {
                int l_s;
                std::string l_c;
                std::string l_cs;
                split_ciphers_ciphersuites(a_cipher_list, l_c, l_cs);
                if (!l_c.empty())
                {
                        l_s = SSL_CTX_set_cipher_list(l_ctx, l_c.c_str());
                        if (l_s != 1)
                        {
                                TRC_ERROR("performing SSL_CTX_set_cipher_list: %s\n", l_c.c_str());
                                SSL_CTX_free(l_ctx);
                                return nullptr;
                        }
                }
                if (!l_cs.empty())
                {
                        l_s = SSL_CTX_set_ciphersuites(l_ctx, l_cs.c_str());
                        if (l_s != 1)
                        {
                                TRC_ERROR("performing SSL_CTX_set_ciphersuites: %s\n", l_cs.c_str());
                                SSL_CTX_free(l_ctx);
                                return nullptr;
                        }
                }
        }
        // -------------------------------------------------
        // options
        // -------------------------------------------------
        if (a_options)
        {
                SSL_CTX_set_options(l_ctx, a_options);
        }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        // close delimited bodies -peer may close w/o close_notify
        SSL_CTX_set_options(l_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
        // -------------------------------------------------
        // set verify
        // -------------------------------------------------
        if (1 != SSL_CTX_set_default_verify_paths(l_ctx))
        {
                TRC_ERROR("performing SSL_CTX_set_default_verify_paths.  Reason: %s\n",
                          ERR_error_string(ERR_get_error(), nullptr));
                SSL_CTX_free(l_ctx);
                return nullptr;
        }
        // -------------------------------------------------
        // alpn -http/1.1 only
        // -------------------------------------------------
        const char *l_alpn_proto_adv = _ALPN_PROTO_ADV_H1;
        // returns 0 on success
        if (0 != SSL_CTX_set_alpn_protos(l_ctx,
                                         (const unsigned char *)l_alpn_proto_adv,
                                         strlen(l_alpn_proto_adv)))
        {
                TRC_ERROR("performing SSL_CTX_set_alpn_protos\n");
                SSL_CTX_free(l_ctx);
                return nullptr;
        }
        SSL_CTX_set_mode(l_ctx, SSL_MODE_AUTO_RETRY);
        SSL_CTX_set_mode(l_ctx, SSL_MODE_RELEASE_BUFFERS);
        return l_ctx;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t show_tls_info(nconn *a_nconn)
{
        if (!a_nconn)
        {
                TRC_ERROR("a_nconn == nullptr\n");
                return HLAT_STATUS_ERROR;
        }
        SSL *l_tls = nconn_get_SSL(*(a_nconn));
        if (!l_tls)
        {
                return HLAT_STATUS_OK;
        }
        FILE *l_out = g_trc_out_file;
        if (!l_out)
        {
                return HLAT_STATUS_OK;
        }
        X509* l_cert = nullptr;
        l_cert = SSL_get_peer_certificate(l_tls);
        if (l_cert == nullptr)
        {
                TRC_ERROR("SSL_get_peer_certificate error.  tls: %p\n", l_tls);
                return HLAT_STATUS_ERROR;
        }
        TRC_OUTPUT("%s", ANSI_COLOR_FG_MAGENTA);
        TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
        TRC_OUTPUT("| *************** T L S   S E R V E R   C E R T I F I C A T E **************** |\n");
        TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
        TRC_OUTPUT("%s", ANSI_COLOR_OFF);
        X509_print_fp(l_out, l_cert);
        X509_free(l_cert);
        SSL_SESSION *l_tls_session = SSL_get_session(l_tls);
        TRC_OUTPUT("%s", ANSI_COLOR_FG_YELLOW);
        TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
        TRC_OUTPUT("|                      T L S   S E S S I O N   I N F O                         |\n");
        TRC_OUTPUT("+------------------------------------------------------------------------------+\n");
        TRC_OUTPUT("%s", ANSI_COLOR_OFF);
        if (l_tls_session)
        {
                SSL_SESSION_print_fp(l_out, l_tls_session);
        }
        TRC_OUTPUT("protocol: %s cipher: %s\n",
                   get_tls_info_protocol_str(get_tls_info_protocol_num(l_tls)),
                   get_tls_info_cipher_str(l_tls));
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
nconn_tls::~nconn_tls()
{
        if (m_tls)
        {
                SSL_free(m_tls);
                m_tls = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: create SSL for connection fd -sni, hostname check, verify
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::init(void)
{
        if (!m_tls_ctx)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: ctx == nullptr\n", m_label.c_str());
                return NC_STATUS_ERROR;
        }
        m_tls = ::SSL_new(m_tls_ctx);
        if (!m_tls)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: tls == nullptr\n", m_label.c_str());
                return NC_STATUS_ERROR;
        }
        if (1 != ::SSL_set_fd(m_tls, m_fd))
        {
                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: Failed to set tls fd\n", m_label.c_str());
                return NC_STATUS_ERROR;
        }
        ::SSL_set_ex_data(m_tls, _HLAT_EX_DATA_IDX, this);
        // Set tls sni extension
        if (m_tls_opt_sni &&
           !m_tls_opt_hostname.empty())
        {
                if (1 != ::SSL_set_tlsext_host_name(m_tls, m_tls_opt_hostname.c_str()))
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: Failed to set tls hostname: %s\n", m_label.c_str(), m_tls_opt_hostname.c_str());
                        return NC_STATUS_ERROR;
                }
        }
        if (m_tls_opt_verify)
        {
                if (!m_tls_opt_hostname.empty())
                {
                        ::SSL_set_hostflags(m_tls, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
                        if (1 != ::SSL_set1_host(m_tls, m_tls_opt_hostname.c_str()))
                        {
                                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: Failed to set verify hostname: %s\n", m_label.c_str(), m_tls_opt_hostname.c_str());
                                return NC_STATUS_ERROR;
                        }
                }
                ::SSL_set_verify(m_tls, SSL_VERIFY_PEER, tls_cert_verify_callback);
        }
        else
        {
                ::SSL_set_verify(m_tls, SSL_VERIFY_NONE, nullptr);
        }
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::tls_connect(void)
{
        int l_status;
        m_tls_state = TLS_STATE_TLS_CONNECTING;
        ERR_clear_error();
        l_status = SSL_connect(m_tls);
        if (l_status == 1)
        {
                m_tls_state = TLS_STATE_CONNECTED;
                return NC_STATUS_OK;
        }
        int l_tls_error = 0;
        l_tls_error = SSL_get_error(m_tls, l_status);
        switch(l_tls_error) {
        case SSL_ERROR_WANT_READ:
        {
                m_tls_state = TLS_STATE_TLS_CONNECTING_WANT_READ;
                return NC_STATUS_AGAIN;
        }
        case SSL_ERROR_WANT_WRITE:
        {
                m_tls_state = TLS_STATE_TLS_CONNECTING_WANT_WRITE;
                return NC_STATUS_AGAIN;
        }
        case SSL_ERROR_SSL:
        {
                m_last_err = ERR_get_error();
                if (gts_last_tls_error[0] != '\0')
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS_HOST,
                                    "LABEL[%s]: TLS_ERROR[%ld]: %s. Reason: %s\n",
                                    m_label.c_str(), m_last_err,
                                    ERR_error_string(m_last_err, nullptr),
                                    gts_last_tls_error);
                        gts_last_tls_error[0] = '\0';
                }
                else
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS,
                                    "LABEL[%s]: TLS_ERROR[%ld]: %s.\n",
                                    m_label.c_str(), m_last_err,
                                    ERR_error_string(m_last_err, nullptr));
                }
                break;
        }
        // look at error stack/return value/errno
        case SSL_ERROR_SYSCALL:
        {
                m_last_err = ::ERR_get_error();
                if (l_status == 0)
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: SSL_ERROR_SYSCALL %ld: %s. An EOF was observed that violates the protocol\n",
                                    m_label.c_str(),
                                    m_last_err, ERR_error_string(m_last_err, nullptr));
                }
                else
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: SSL_ERROR_SYSCALL %ld: %s. %s\n",
                                    m_label.c_str(),
                                    m_last_err, ERR_error_string(m_last_err, nullptr),
                                    strerror(errno));
                }
                break;
        }
        case SSL_ERROR_ZERO_RETURN:
        {
                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: SSL_ERROR_ZERO_RETURN\n", m_label.c_str());
                break;
        }
        default:
        {
                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT_TLS, "LABEL[%s]: Unknown TLS error: %d\n", m_label.c_str(), l_tls_error);
                break;
        }
        }
        return NC_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::set_opt(uint32_t a_opt, const void *a_buf, uint32_t a_len)
{
        int32_t l_status;
        l_status = nconn_tcp::set_opt(a_opt, a_buf, a_len);
        if ((l_status != NC_STATUS_OK) && (l_status != NC_STATUS_UNSUPPORTED))
        {
                return NC_STATUS_ERROR;
        }
        if (l_status == NC_STATUS_OK)
        {
                return NC_STATUS_OK;
        }
        switch(a_opt)
        {
        case OPT_TLS_VERIFY:
        {
                memcpy(&m_tls_opt_verify, a_buf, sizeof(bool));
                break;
        }
        case OPT_TLS_SNI:
        {
                memcpy(&m_tls_opt_sni, a_buf, sizeof(bool));
                break;
        }
        case OPT_TLS_HOSTNAME:
        {
                m_tls_opt_hostname.assign((const char *)a_buf, a_len);
                break;
        }
        case OPT_TLS_CTX:
        {
                m_tls_ctx = (SSL_CTX *)a_buf;
                break;
        }
        default:
        {
                return NC_STATUS_UNSUPPORTED;
        }
        }
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::get_opt(uint32_t a_opt, void **a_buf, uint32_t *a_len)
{
        int32_t l_status;
        l_status = nconn_tcp::get_opt(a_opt, a_buf, a_len);
        if ((l_status != NC_STATUS_OK) && (l_status != NC_STATUS_UNSUPPORTED))
        {
                return NC_STATUS_ERROR;
        }
        if (l_status == NC_STATUS_OK)
        {
                return NC_STATUS_OK;
        }
        switch(a_opt)
        {
        case OPT_TLS_SSL:
        {
                *a_buf = (void *)m_tls;
                *a_len = sizeof(m_tls);
                break;
        }
        default:
        {
                return NC_STATUS_UNSUPPORTED;
        }
        }
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::ncread(char *a_buf, uint32_t a_buf_len)
{
        int l_status;
        errno = 0;
        ERR_clear_error();
        l_status = ::SSL_read(m_tls, a_buf, a_buf_len);
        TRC_ALL("HOST[%s] tls[%p] READ: %d bytes. Reason: %s\n",
                 m_label.c_str(),
                 m_tls,
                 l_status,
                 strerror(errno));
        if (l_status > 0)
        {
                TRC_ALL_MEM((const uint8_t *)a_buf, l_status);
                return l_status;
        }
        int l_tls_error = ::SSL_get_error(m_tls, l_status);
        switch(l_tls_error)
        {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
        {
                return NC_STATUS_AGAIN;
        }
        case SSL_ERROR_ZERO_RETURN:
        {
                return NC_STATUS_EOF;
        }
        case SSL_ERROR_SYSCALL:
        {
                // eof w/o close_notify
                if ((l_status == 0) ||
                   (errno == 0))
                {
                        return NC_STATUS_EOF;
                }
                break;
        }
        default:
        {
                break;
        }
        }
        m_last_err = ERR_get_error();
        NCONN_ERROR(CONN_STATUS_ERROR_RECV,
                    "LABEL[%s]: Error: performing SSL_read: %s. %s\n",
                    m_label.c_str(),
                    ERR_error_string(m_last_err, nullptr),
                    strerror(errno));
        return NC_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::ncwrite(const char *a_buf, uint32_t a_buf_len)
{
        int l_status;
        errno = 0;
        ERR_clear_error();
        l_status = ::SSL_write(m_tls, a_buf, a_buf_len);
        TRC_ALL("HOST[%s] tls[%p] WRITE: %d bytes. Reason: %s\n",
                 m_label.c_str(),
                 m_tls,
                 l_status,
                 strerror(errno));
        if (l_status > 0)
        {
                TRC_ALL_MEM((const uint8_t *)a_buf, l_status);
                return l_status;
        }
        int l_tls_error = ::SSL_get_error(m_tls, l_status);
        if (l_tls_error == SSL_ERROR_WANT_WRITE)
        {
                if (m_evr_loop)
                {
                        if (0 != m_evr_loop->mod_fd(m_fd,
                                                    EVR_FILE_ATTR_MASK_READ|
                                                    EVR_FILE_ATTR_MASK_WRITE|
                                                    EVR_FILE_ATTR_MASK_RD_HUP|
                                                    EVR_FILE_ATTR_MASK_ET,
                                                    &m_evr_fd))
                        {
                                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                                            "LABEL[%s]: Error: Couldn't add socket file descriptor\n",
                                            m_label.c_str());
                                return NC_STATUS_ERROR;
                        }
                }
                return NC_STATUS_AGAIN;
        }
        else if (l_tls_error == SSL_ERROR_WANT_READ)
        {
                return NC_STATUS_AGAIN;
        }
        NCONN_ERROR(CONN_STATUS_ERROR_SEND, "LABEL[%s]: Error: performing SSL_write.\n", m_label.c_str());
        return NC_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::ncsetup()
{
        int32_t l_status;
        l_status = nconn_tcp::ncsetup();
        if (l_status != NC_STATUS_OK)
        {
                return NC_STATUS_ERROR;
        }
        l_status = init();
        if (l_status != NC_STATUS_OK)
        {
                return NC_STATUS_ERROR;
        }
        m_tls_state = TLS_STATE_CONNECTING;
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: tcp connect then tls handshake -called again on fd events
//!           until is_connecting() is false
//! \return:  NC_STATUS_OK or NC_STATUS_ERROR
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t nconn_tls::ncconnect()
{
ncconnect_state_top:
        switch (m_tls_state)
        {
        // -------------------------------------------------
        // STATE: CONNECTING
        // -------------------------------------------------
        case TLS_STATE_CONNECTING:
        {
                int32_t l_status;
                l_status = nconn_tcp::ncconnect();
                if (l_status == NC_STATUS_ERROR)
                {
                        return NC_STATUS_ERROR;
                }
                if (nconn_tcp::is_connecting())
                {
                        return NC_STATUS_OK;
                }
                m_tls_state = TLS_STATE_TLS_CONNECTING;
                goto ncconnect_state_top;
        }
        // -------------------------------------------------
        // STATE: TLS_CONNECTING
        // -------------------------------------------------
        case TLS_STATE_TLS_CONNECTING:
        case TLS_STATE_TLS_CONNECTING_WANT_READ:
        case TLS_STATE_TLS_CONNECTING_WANT_WRITE:
        {
                int l_status;
                l_status = tls_connect();
                if (l_status == NC_STATUS_AGAIN)
                {
                        uint32_t l_mask = EVR_FILE_ATTR_MASK_READ|
                                          EVR_FILE_ATTR_MASK_RD_HUP|
                                          EVR_FILE_ATTR_MASK_ET;
                        if (TLS_STATE_TLS_CONNECTING_WANT_WRITE == m_tls_state)
                        {
                                l_mask |= EVR_FILE_ATTR_MASK_WRITE;
                        }
                        if (m_evr_loop)
                        {
                                if (0 != m_evr_loop->mod_fd(m_fd, l_mask, &m_evr_fd))
                                {
                                        NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                                                    "LABEL[%s]: Error: Couldn't add socket file descriptor\n",
                                                    m_label.c_str());
                                        return NC_STATUS_ERROR;
                                }
                        }
                        return NC_STATUS_OK;
                }
                else if (l_status != NC_STATUS_OK)
                {
                        return NC_STATUS_ERROR;
                }
                goto ncconnect_state_top;
        }
        // -------------------------------------------------
        // STATE: CONNECTED
        // -------------------------------------------------
        case TLS_STATE_CONNECTED:
        {
                break;
        }
        default:
        {
                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL, "LABEL[%s]: State error: %d\n", m_label.c_str(), m_tls_state);
                return NC_STATUS_ERROR;
        }
        }
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tls::nccleanup()
{
        if (m_tls)
        {
                SSL_free(m_tls);
                m_tls = nullptr;
        }
        m_tls_state = TLS_STATE_NONE;
        // Super
        return nconn_tcp::nccleanup();
}
//! ----------------------------------------------------------------------------
//! nconn_utils
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
SSL *nconn_get_SSL(nconn &a_nconn)
{
        SSL *l_ssl;
        uint32_t l_len;
        int l_status;
        l_status = a_nconn.get_opt(nconn_tls::OPT_TLS_SSL, (void **)&l_ssl, &l_len);
        if (l_status != nconn::NC_STATUS_OK)
        {
                return nullptr;
        }
        return l_ssl;
}
} //namespace ns_hlat {
