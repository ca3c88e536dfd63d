//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    errors.h
//! \details: run level error taxonomy and probe failure detail
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_ERRORS_H
#define _HLAT_ERRORS_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "nconn/conn_status.h"
#include <stdint.h>
#include <string>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! run errors
//! ----------------------------------------------------------------------------
#define HLAT_ERR_MAP(XX)\
        XX(0,  NONE,              none)\
        XX(1,  INVALID_INPUT,     invalid input)\
        XX(2,  NETWORK_FAILURE,   network failure)\
        XX(3,  EMPTY_RESULT_SET,  empty result set)\
        XX(4,  ALL_PROBES_FAILED, all probes failed)
typedef enum hlat_err_enum
{
#define XX(num, name, string) HLAT_ERR_##name = num,
        HLAT_ERR_MAP(XX)
#undef XX
} hlat_err_t;
//! ----------------------------------------------------------------------------
//! probe stage that failed
//! ----------------------------------------------------------------------------
#define PROBE_STAGE_MAP(XX)\
        XX(0,  NONE,       none)\
        XX(1,  RESOLVE,    resolve)\
        XX(2,  CONNECT,    connect)\
        XX(3,  TLS,        tls)\
        XX(4,  SEND,       send)\
        XX(5,  RECV,       recv)\
        XX(6,  TIMEOUT,    timeout)\
        XX(7,  CANCELLED,  cancelled)
typedef enum probe_stage_enum
{
#define XX(num, name, string) PROBE_STAGE_##name = num,
        PROBE_STAGE_MAP(XX)
#undef XX
} probe_stage_t;
//! ----------------------------------------------------------------------------
//! \details: failure detail of a single probe
//! ----------------------------------------------------------------------------
typedef struct probe_failure_struct
{
        probe_stage_t m_stage;
        conn_status_t m_conn_status;
        std::string m_msg;
        probe_failure_struct():
                m_stage(PROBE_STAGE_NONE),
                m_conn_status(CONN_STATUS_NONE),
                m_msg()
        {}
} probe_failure_t;
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
const char *hlat_err_str(hlat_err_t a_err);
const char *probe_stage_str(probe_stage_t a_stage);
probe_stage_t probe_stage_from_conn_status(conn_status_t a_status);
std::string probe_failure_str(const probe_failure_t &a_failure);
} //namespace ns_hlat {
#endif
