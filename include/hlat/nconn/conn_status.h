//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    conn_status.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_CONN_STATUS_H
#define _HLAT_CONN_STATUS_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string>
//! ----------------------------------------------------------------------------
//! Fwd Decl
//! ----------------------------------------------------------------------------
typedef struct ssl_st SSL;
namespace ns_hlat {
// ---------------------------------------
// Connection status
// ---------------------------------------
typedef enum {
        CONN_STATUS_NONE                        =  1,
        CONN_STATUS_OK                          =  0,
        CONN_STATUS_ERROR_INTERNAL              = -1,   // generic internal failure
        CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE   = -2,   // failed to resolve, explicit
        CONN_STATUS_ERROR_CONNECT               = -3,   // resolved but failed to TCP connect, explicit
        CONN_STATUS_ERROR_CONNECT_TLS           = -5,   // TCP connected but TLS error, generic
        CONN_STATUS_ERROR_CONNECT_TLS_HOST      = -6,   // TCP connected but TLS hostname/certificate verification failed
        CONN_STATUS_ERROR_SEND                  = -7,   // connected but send error, explicit
        CONN_STATUS_ERROR_RECV                  = -9,   // connected, sent, error receiving, explicit
        CONN_STATUS_ERROR_TIMEOUT               = -11,  // got a timeout waiting for something, generic
        CONN_STATUS_CANCELLED                   = -100
} conn_status_t;
const char *conn_status_str(conn_status_t a_status);
//! ----------------------------------------------------------------------------
//! nconn_utils
//! ----------------------------------------------------------------------------
class nconn;
SSL *nconn_get_SSL(nconn &a_nconn);
conn_status_t nconn_get_status(nconn &a_nconn);
const std::string &nconn_get_last_error_str(nconn &a_nconn);
} //namespace ns_hlat {
#endif
