//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    tls_util.h
//! \details: OpenSSL support
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_TLS_UTIL_H
#define _HLAT_TLS_UTIL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
#include <string>
//! ----------------------------------------------------------------------------
//! ext fwd decl's
//! ----------------------------------------------------------------------------
typedef struct ssl_st SSL;
typedef struct x509_store_ctx_st X509_STORE_CTX;
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
extern __thread char gts_last_tls_error[256];
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
void tls_init(void);
int32_t tls_cleanup(void);
int32_t get_tls_options_str_val(const std::string a_options_str, long &ao_val);
const char *get_tls_info_cipher_str(SSL *a_ssl);
const char *get_tls_info_protocol_str(int32_t a_version);
int32_t get_tls_info_protocol_num(SSL *a_ssl);
int tls_cert_verify_callback(int ok, X509_STORE_CTX* store);
} //namespace ns_hlat {
#endif
