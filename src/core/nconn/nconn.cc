//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "support/trace.h"
#include "nconn/nconn.h"
#include "nconn/conn_status.h"
#include <errno.h>
#include <string.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: read once into caller buffer
//! \return:  NC_STATUS_OK on bytes read (ao_read set), NC_STATUS_AGAIN,
//!           NC_STATUS_EOF or NC_STATUS_ERROR
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn::nc_read(char *a_buf, uint32_t a_buf_len, uint32_t &ao_read)
{
        ao_read = 0;
        if (!a_buf ||
           !a_buf_len)
        {
                TRC_ERROR("a_buf == nullptr or a_buf_len == 0\n");
                return NC_STATUS_ERROR;
        }
        int32_t l_s = 0;
        l_s = ncread(a_buf, a_buf_len);
        if (l_s < 0)
        {
                switch(l_s)
                {
                case NC_STATUS_ERROR:
                case NC_STATUS_AGAIN:
                case NC_STATUS_OK:
                case NC_STATUS_EOF:
                {
                        return l_s;
                }
                default:
                {
                        return NC_STATUS_ERROR;
                }
                }
        }
        else if (l_s == 0)
        {
                return NC_STATUS_EOF;
        }
        ao_read = (uint32_t)l_s;
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: write once from caller buffer
//! \return:  NC_STATUS_OK (ao_written set), NC_STATUS_AGAIN or NC_STATUS_ERROR
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn::nc_write(const char *a_buf, uint32_t a_buf_len, uint32_t &ao_written)
{
        ao_written = 0;
        if (!a_buf)
        {
                TRC_ERROR("a_buf == nullptr\n");
                return NC_STATUS_ERROR;
        }
        if (!a_buf_len)
        {
                return NC_STATUS_OK;
        }
        int32_t l_s;
        l_s = ncwrite(a_buf, a_buf_len);
        if (l_s < 0)
        {
                switch(l_s)
                {
                case NC_STATUS_AGAIN:
                {
                        return l_s;
                }
                default:
                {
                        return NC_STATUS_ERROR;
                }
                }
        }
        ao_written = (uint32_t)l_s;
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn::nc_cleanup()
{
        TRC_VERBOSE("tearing down: label: %s\n", m_label.c_str());
        int32_t l_s;
        l_s = nccleanup();
        m_nc_state = NC_STATE_FREE;
        if (l_s != NC_STATUS_OK)
        {
                TRC_ERROR("Error performing nccleanup.\n");
                return HLAT_STATUS_ERROR;
        }
        m_data = nullptr;
        m_host_info_is_set = false;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
nconn::nconn(void):
      m_evr_loop(nullptr),
      m_evr_fd(),
      m_scheme(SCHEME_NONE),
      m_label(),
      m_data(nullptr),
      m_conn_status(CONN_STATUS_OK),
      m_last_error(""),
      m_host_info(),
      m_host_info_is_set(false),
      m_nc_state(NC_STATE_FREE)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
nconn::~nconn(void)
{
}
//! ----------------------------------------------------------------------------
//! nconn_utils
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char *conn_status_str(conn_status_t a_status)
{
        switch(a_status)
        {
        case CONN_STATUS_NONE:                      return "none";
        case CONN_STATUS_OK:                        return "ok";
        case CONN_STATUS_ERROR_INTERNAL:            return "internal error";
        case CONN_STATUS_ERROR_ADDR_LOOKUP_FAILURE: return "address lookup failure";
        case CONN_STATUS_ERROR_CONNECT:             return "connect error";
        case CONN_STATUS_ERROR_CONNECT_TLS:         return "tls error";
        case CONN_STATUS_ERROR_CONNECT_TLS_HOST:    return "tls host verification error";
        case CONN_STATUS_ERROR_SEND:                return "send error";
        case CONN_STATUS_ERROR_RECV:                return "receive error";
        case CONN_STATUS_ERROR_TIMEOUT:             return "timeout";
        case CONN_STATUS_CANCELLED:                 return "cancelled";
        default:                                    break;
        }
        return "unknown";
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
conn_status_t nconn_get_status(nconn &a_nconn)
{
        return a_nconn.get_status();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const std::string &nconn_get_last_error_str(nconn &a_nconn)
{
        return a_nconn.get_last_error();
}
} //namespace ns_hlat {
