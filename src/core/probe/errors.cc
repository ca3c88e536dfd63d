//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    errors.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/errors.h"
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#ifndef ARRAY_SIZE
  #define ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))
#endif
#ifndef ELEM_AT
  #define ELEM_AT(a, i, v) ((unsigned int) (i) < ARRAY_SIZE(a) ? (a)[(i)] : (v))
#endif
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! string tables
//! ----------------------------------------------------------------------------
static const char *s_hlat_err_strs[] =
{
#define XX(num, name, string) #string,
        HLAT_ERR_MAP(XX)
#undef XX
};
static const char *s_probe_stage_strs[] =
{
#define XX(num, name, string) #string,
        PROBE_STAGE_MAP(XX)
#undef XX
};
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char *hlat_err_str(hlat_err_t a_err)
{
        return ELEM_AT(s_hlat_err_strs, a_err, "unknown");
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char *probe_stage_str(probe_stage_t a_stage)
{
        return ELEM_AT(s_probe_stage_strs, a_stage, "unknown");
}
//! ----------------------------------------------------------------------------
//! \details: map connection status to the stage that failed
//! \return:  stage
//! \param:   a_status: connection status
//! ----------------------------------------------------------------------------
probe_stage_t probe_stage_from_conn_status(conn_status_t a_status)
{
        switch(a_status)
        {
        case CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE:
        {
                return PROBE_STAGE_RESOLVE;
        }
        case CONN_STATUS_ERROR_CONNECT:
        case CONN_STATUS_ERROR_INTERNAL:
        {
                return PROBE_STAGE_CONNECT;
        }
        case CONN_STATUS_ERROR_CONNECT_TLS:
        case CONN_STATUS_ERROR_CONNECT_TLS_HOST:
        {
                return PROBE_STAGE_TLS;
        }
        case CONN_STATUS_ERROR_SEND:
        {
                return PROBE_STAGE_SEND;
        }
        case CONN_STATUS_ERROR_RECV:
        {
                return PROBE_STAGE_RECV;
        }
        case CONN_STATUS_ERROR_TIMEOUT:
        {
                return PROBE_STAGE_TIMEOUT;
        }
        case CONN_STATUS_CANCELLED:
        {
                return PROBE_STAGE_CANCELLED;
        }
        default:
        {
                break;
        }
        }
        return PROBE_STAGE_NONE;
}
//! ----------------------------------------------------------------------------
//! \details: ie "connect failed: <msg>"
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string probe_failure_str(const probe_failure_t &a_failure)
{
        std::string l_str = probe_stage_str(a_failure.m_stage);
        l_str += " failed";
        if (!a_failure.m_msg.empty())
        {
                l_str += ": ";
                l_str += a_failure.m_msg;
                // trim trailing newline from trace formatted messages
                while (!l_str.empty() &&
                      ((l_str[l_str.length() - 1] == '\n') ||
                       (l_str[l_str.length() - 1] == '\r')))
                {
                        l_str.erase(l_str.length() - 1);
                }
        }
        return l_str;
}
} //namespace ns_hlat {
