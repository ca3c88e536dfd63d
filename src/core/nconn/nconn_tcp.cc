//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn_tcp.cc
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
#include "nconn/nconn_tcp.h"
#include "evr/evr.h"
// Fcntl and friends
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
// Set socket option macro...
#define SET_SOCK_OPT(_sock_fd, _sock_opt_level, _sock_opt_name, _sock_opt_val) \
        do { \
                int _l__sock_opt_val = _sock_opt_val; \
                int _l_status = 0; \
                _l_status = ::setsockopt(_sock_fd, \
                                _sock_opt_level, \
                                _sock_opt_name, \
                                &_l__sock_opt_val, \
                                sizeof(_l__sock_opt_val)); \
                if (_l_status == -1) { \
                        NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL, \
                                    "LABEL[%s]: Failed to set sock_opt: %s.  Reason: %s.\n", \
                                    m_label.c_str(), #_sock_opt_name, strerror(errno)); \
                        return NC_STATUS_ERROR;\
                } \
        } while(0)
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _MAX_CONNECT_RETRIES 1024
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
nconn_tcp::~nconn_tcp()
{
        if (m_fd >= 0)
        {
                close(m_fd);
                m_fd = -1;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tcp::set_opt(uint32_t a_opt, const void *a_buf, uint32_t a_len)
{
        switch(a_opt)
        {
        case OPT_TCP_NO_DELAY:
        {
                m_sock_opt_no_delay = (bool)a_len;
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
int32_t nconn_tcp::get_opt(uint32_t a_opt, void **a_buf, uint32_t *a_len)
{
        switch(a_opt)
        {
        case OPT_TCP_FD:
        {
                *a_buf = &m_fd;
                *a_len = sizeof(m_fd);
                break;
        }
        case OPT_TCP_CONNECTED_NS:
        {
                *a_buf = &m_connected_ns;
                *a_len = sizeof(m_connected_ns);
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
int32_t nconn_tcp::ncread(char *a_buf, uint32_t a_buf_len)
{
        ssize_t l_status;
        errno = 0;
        l_status = recvfrom(m_fd, a_buf, a_buf_len, 0, nullptr, nullptr);
        TRC_ALL("HOST[%s] fd[%3d] READ: %ld bytes. Reason: %s\n",
                m_label.c_str(),
                m_fd,
                (long)l_status,
                ::strerror(errno));
        if (l_status > 0)
        {
                TRC_ALL_MEM((const uint8_t *)a_buf, l_status);
                return (int32_t)l_status;
        }
        else if (l_status == 0)
        {
                return NC_STATUS_EOF;
        }
        if ((errno == EAGAIN) ||
           (errno == EWOULDBLOCK))
        {
                return NC_STATUS_AGAIN;
        }
        NCONN_ERROR(CONN_STATUS_ERROR_RECV,
                    "LABEL[%s]: Error: performing recvfrom.  Reason: %s.\n",
                    m_label.c_str(), ::strerror(errno));
        return NC_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tcp::ncwrite(const char *a_buf, uint32_t a_buf_len)
{
        ssize_t l_status;
        errno = 0;
        l_status = send(m_fd, a_buf, a_buf_len, MSG_NOSIGNAL);
        TRC_ALL("HOST[%s] fd[%3d] WRITE: %ld bytes. Reason: %s\n",
                m_label.c_str(),
                m_fd,
                (long)l_status,
                ::strerror(errno));
        if (l_status > 0) TRC_ALL_MEM((const uint8_t*)(a_buf), (uint32_t)(l_status));
        if (l_status < 0)
        {
                if ((errno == EAGAIN) ||
                   (errno == EWOULDBLOCK))
                {
                        // Add to writeable
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
                NCONN_ERROR(CONN_STATUS_ERROR_SEND,
                            "LABEL[%s]: Error: performing write.  Reason: %s.\n",
                            m_label.c_str(), ::strerror(errno));
                return NC_STATUS_ERROR;
        }
        return (int32_t)l_status;
}
//! ----------------------------------------------------------------------------
//! \details: create non-blocking socket for host info and add to loop
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nconn_tcp::ncsetup()
{
        if (!m_host_info_is_set)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                            "LABEL[%s]: Error: host info not set\n",
                            m_label.c_str());
                return NC_STATUS_ERROR;
        }
        m_connected_ns = 0;
        // Make a socket.
        m_fd = ::socket(m_host_info.m_sock_family,
                        m_host_info.m_sock_type,
                        m_host_info.m_sock_protocol);
        if (m_fd < 0)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                            "LABEL[%s]: Error creating socket. Reason: %s\n",
                            m_label.c_str(), ::strerror(errno));
                return NC_STATUS_ERROR;
        }
        // -------------------------------------------------
        // Socket options
        // -------------------------------------------------
        SET_SOCK_OPT(m_fd, SOL_SOCKET, SO_REUSEADDR, 1);
        if (m_sock_opt_no_delay)
        {
                SET_SOCK_OPT(m_fd, IPPROTO_TCP, TCP_NODELAY, 1);
        }
        // -------------------------------------------------
        // Set the file descriptor to non-blocking mode.
        // -------------------------------------------------
        const int l_flags = ::fcntl(m_fd, F_GETFL, 0);
        if (l_flags == -1)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                            "LABEL[%s]: Error getting flags for fd. Reason: %s\n",
                            m_label.c_str(), ::strerror(errno));
                return NC_STATUS_ERROR;
        }
        if (::fcntl(m_fd, F_SETFL, l_flags | O_NONBLOCK) < 0)
        {
                NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                            "LABEL[%s]: Error setting fd to non-block mode. Reason: %s\n",
                            m_label.c_str(), ::strerror(errno));
                return NC_STATUS_ERROR;
        }
        // -------------------------------------------------
        // Add to reactor
        // -------------------------------------------------
        if (m_evr_loop)
        {
                if (0 != m_evr_loop->add_fd(m_fd,
                                            EVR_FILE_ATTR_MASK_READ|EVR_FILE_ATTR_MASK_RD_HUP|EVR_FILE_ATTR_MASK_ET,
                                            &m_evr_fd))
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                                    "LABEL[%s]: Error: Couldn't add socket file descriptor\n",
                                    m_label.c_str());
                        return NC_STATUS_ERROR;
                }
        }
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: non-blocking connect -called again on writeable until connected
//! \return:  NC_STATUS_OK (check is_connecting()) or NC_STATUS_ERROR
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t nconn_tcp::ncconnect()
{
        uint32_t l_retry_connect_count = 0;
        int l_connect_status = 0;
        // Set to connecting
        m_tcp_state = TCP_STATE_CONNECTING;
state_top:
        errno = 0;
        l_connect_status = ::connect(m_fd,
                                     ((struct sockaddr*) &(m_host_info.m_sa)),
                                     (m_host_info.m_sa_len));
        if (l_connect_status < 0)
        {
                switch (errno)
                {
                case EISCONN:
                {
                        // Is already connected drop out of switch and return OK
                        break;
                }
                case EINVAL:
                {
                        int l_err;
                        socklen_t l_errlen;
                        l_errlen = sizeof(l_err);
                        if (::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, (void*) &l_err, &l_errlen) < 0)
                        {
                                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT,
                                            "LABEL[%s]: Error performing getsockopt. Unknown connect error\n",
                                            m_label.c_str());
                        }
                        else
                        {
                                NCONN_ERROR(CONN_STATUS_ERROR_CONNECT,
                                            "LABEL[%s]: Error connecting. Reason: %s\n",
                                            m_label.c_str(), ::strerror(l_err));
                        }
                        return NC_STATUS_ERROR;
                }
                case EAGAIN:
                case EINPROGRESS:
                case EALREADY:
                {
                        // Set to writeable and try again
                        if (m_evr_loop)
                        {
                                if (0 != m_evr_loop->mod_fd(m_fd,
                                                            EVR_FILE_ATTR_MASK_WRITE|EVR_FILE_ATTR_MASK_ET,
                                                            &m_evr_fd))
                                {
                                        NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                                                    "LABEL[%s]: Error: Couldn't add socket file descriptor\n",
                                                    m_label.c_str());
                                        return NC_STATUS_ERROR;
                                }
                        }
                        // Return here -still in connecting state
                        return NC_STATUS_OK;
                }
                case EADDRNOTAVAIL:
                {
                        // ephemeral ports exhausted -retry
                        if (++l_retry_connect_count < _MAX_CONNECT_RETRIES)
                        {
                                usleep(1000);
                                goto state_top;
                        }
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT,
                                    "LABEL[%s]: Error connect().  Reason: %s\n",
                                    m_label.c_str(), ::strerror(errno));
                        return NC_STATUS_ERROR;
                }
                default:
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_CONNECT,
                                    "LABEL[%s]: Error connecting. Reason: %s\n",
                                    m_label.c_str(), ::strerror(errno));
                        return NC_STATUS_ERROR;
                }
                }
        }
        // Set to connected state
        m_tcp_state = TCP_STATE_CONNECTED;
        m_connected_ns = get_time_ns();
        // Add to readable
        if (m_evr_loop)
        {
                if (0 != m_evr_loop->mod_fd(m_fd,
                                            EVR_FILE_ATTR_MASK_READ|EVR_FILE_ATTR_MASK_RD_HUP|EVR_FILE_ATTR_MASK_ET,
                                            &m_evr_fd))
                {
                        NCONN_ERROR(CONN_STATUS_ERROR_INTERNAL,
                                    "LABEL[%s]: Error: Couldn't add socket file descriptor\n",
                                    m_label.c_str());
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
int32_t nconn_tcp::nccleanup()
{
        // epoll drops closed fd's
        if (m_fd >= 0)
        {
                close(m_fd);
        }
        m_fd = -1;
        m_evr_loop = nullptr;
        m_tcp_state = TCP_STATE_NONE;
        return NC_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! nconn_utils
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int nconn_get_fd(nconn &a_nconn)
{
        int *l_fd;
        uint32_t l_len;
        int l_status;
        l_status = a_nconn.get_opt(nconn_tcp::OPT_TCP_FD, (void **)&l_fd, &l_len);
        if (l_status != nconn::NC_STATUS_OK)
        {
                return -1;
        }
        return *l_fd;
}
//! ----------------------------------------------------------------------------
//! \details: monotonic ns timestamp tcp connect completed -0 if not connected
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int64_t nconn_get_connected_ns(nconn &a_nconn)
{
        int64_t *l_ns;
        uint32_t l_len;
        int l_status;
        l_status = a_nconn.get_opt(nconn_tcp::OPT_TCP_CONNECTED_NS, (void **)&l_ns, &l_len);
        if (l_status != nconn::NC_STATUS_OK)
        {
                return 0;
        }
        return *l_ns;
}
} //namespace ns_hlat {
