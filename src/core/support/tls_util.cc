//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    tls_util.cc
//! \details: OpenSSL support
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "support/tls_util.h"
#include "support/trace.h"
#include <ctype.h>
#include <stdio.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <openssl/x509v3.h>
#include <map>
#include <algorithm>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! Globals
//! ----------------------------------------------------------------------------
__thread char gts_last_tls_error[256] = "\0";
//! ----------------------------------------------------------------------------
//! \details: Initialize the OpenSSL library.  Library is thread safe from 1.1.0
//!           on -no locking callbacks required.
//! \return:  NA
//! \param:   NA
//! ----------------------------------------------------------------------------
void tls_init(void)
{
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                         nullptr);
        // We MUST have entropy, or else there's no point to crypto.
        if (!RAND_poll())
        {
                TRC_ERROR("RAND_poll failed\n");
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t tls_cleanup(void)
{
        EVP_cleanup();
        ERR_free_strings();
        CRYPTO_cleanup_all_ex_data();
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: map "|" delimited option names ie "SSL_OP_NO_TLSv1|SSL_OP_NO_SSLv3"
//!           to the OR'd option value
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on unknown option
//! \param:   a_options_str: option string
//! \param:   ao_val: OR'd options
//! ----------------------------------------------------------------------------
typedef std::map <std::string, long>tls_options_map_t;
static tls_options_map_t g_tls_options_map;
static int32_t add_tls_option(const std::string &a_token, long &ao_val)
{
        tls_options_map_t::iterator i_option = g_tls_options_map.find(a_token);
        if (i_option == g_tls_options_map.end())
        {
                TRC_ERROR("unrecognized tls option: %s\n", a_token.c_str());
                return HLAT_STATUS_ERROR;
        }
        ao_val |= i_option->second;
        return HLAT_STATUS_OK;
}
int32_t get_tls_options_str_val(const std::string a_options_str, long &ao_val)
{
        std::string l_options_str = a_options_str;
        if (g_tls_options_map.empty())
        {
                g_tls_options_map["SSL_OP_NO_SSLv2"] = SSL_OP_NO_SSLv2;
                g_tls_options_map["SSL_OP_NO_SSLv3"] = SSL_OP_NO_SSLv3;
                g_tls_options_map["SSL_OP_NO_TLSv1"] = SSL_OP_NO_TLSv1;
                g_tls_options_map["SSL_OP_NO_TLSv1_1"] = SSL_OP_NO_TLSv1_1;
                g_tls_options_map["SSL_OP_NO_TLSv1_2"] = SSL_OP_NO_TLSv1_2;
#ifdef SSL_OP_NO_TLSv1_3
                g_tls_options_map["SSL_OP_NO_TLSv1_3"] = SSL_OP_NO_TLSv1_3;
#endif
                g_tls_options_map["SSL_OP_NO_COMPRESSION"] = SSL_OP_NO_COMPRESSION;
                g_tls_options_map["SSL_OP_NO_TICKET"] = SSL_OP_NO_TICKET;
        }
        // Remove whitespace
        l_options_str.erase(std::remove_if(l_options_str.begin(), l_options_str.end(), ::isspace), l_options_str.end());
        ao_val = 0;
        if (l_options_str.empty())
        {
                return HLAT_STATUS_OK;
        }
        std::string l_delim = "|";
        size_t l_start = 0U;
        size_t l_end = l_options_str.find(l_delim);
        while (l_end != std::string::npos)
        {
                if (add_tls_option(l_options_str.substr(l_start, l_end - l_start), ao_val) != HLAT_STATUS_OK)
                {
                        return HLAT_STATUS_ERROR;
                }
                l_start = l_end + l_delim.length();
                l_end = l_options_str.find(l_delim, l_start);
        }
        return add_tls_option(l_options_str.substr(l_start), ao_val);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char *get_tls_info_cipher_str(SSL *a_ssl)
{
        if (!a_ssl)
        {
            return nullptr;
        }
        return SSL_get_cipher_name(a_ssl);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t get_tls_info_protocol_num(SSL *a_ssl)
{
        if (!a_ssl)
        {
            return -1;
        }
        return SSL_version(a_ssl);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char *get_tls_info_protocol_str(int32_t a_version)
{
        switch(a_version)
        {
        case SSL3_VERSION:
        {
                return "SSLv3";
        }
#ifdef TLS1_3_VERSION
        case TLS1_3_VERSION:
        {
                return "TLSv1.3";
        }
#endif
        case TLS1_2_VERSION:
        {
                return "TLSv1.2";
        }
        case TLS1_1_VERSION:
        {
                return "TLSv1.1";
        }
        case TLS1_VERSION:
        {
                return "TLSv1";
        }
        default:
        {
                return "unknown";
        }
        }
        return nullptr;
}
//! ----------------------------------------------------------------------------
//! \details: record the reason of a failed verification for error reporting
//! \return:  verification result passed through
//! \notes:   Based on example from "Network Security with OpenSSL" pg. 132
//! ----------------------------------------------------------------------------
int tls_cert_verify_callback(int ok, X509_STORE_CTX* store)
{
        if (ok)
        {
                return ok;
        }
        if (store)
        {
                int l_err = X509_STORE_CTX_get_error(store);
                int l_depth = X509_STORE_CTX_get_error_depth(store);
                snprintf(gts_last_tls_error, sizeof(gts_last_tls_error),
                         "certificate verify error[%d] depth[%d]: %s",
                         l_err, l_depth, X509_verify_cert_error_string(l_err));
        }
        return ok;
}
} //namespace ns_hlat {
