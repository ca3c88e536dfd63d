//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    evr_epoll.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "evr_epoll.h"
#include "support/trace.h"
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
evr_epoll::evr_epoll(void):
        m_fd(-1),
        m_ctrl_fd(-1)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
evr_epoll::~evr_epoll(void)
{
        if (m_ctrl_fd >= 0)
        {
                close(m_ctrl_fd);
                m_ctrl_fd = -1;
        }
        if (m_fd >= 0)
        {
                close(m_fd);
                m_fd = -1;
        }
}
//! ----------------------------------------------------------------------------
//! \details: create epoll fd and eventfd used to wake up the loop
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on failure
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t evr_epoll::init(void)
{
        m_fd = epoll_create1(EPOLL_CLOEXEC);
        if (m_fd == -1)
        {
                TRC_ERROR("epoll_create1() failed: %s\n", strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        // Create ctrl fd
        m_ctrl_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_ctrl_fd == -1)
        {
                TRC_ERROR("eventfd() failed: %s\n", strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        int32_t l_s;
        l_s = add(m_ctrl_fd, EVR_FILE_ATTR_MASK_READ|EVR_FILE_ATTR_MASK_ET, nullptr);
        if (l_s != HLAT_STATUS_OK)
        {
                TRC_ERROR("failed to add ctrl fd.\n");
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int evr_epoll::wait(evr_events_t* a_ev, int a_max_events, int a_timeout_msec)
{
        return epoll_wait(m_fd, (epoll_event *)a_ev, a_max_events, a_timeout_msec);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static inline uint32_t get_epoll_attr(uint32_t a_attr_mask)
{
        uint32_t l_attr = 0;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_READ)         l_attr |= EPOLLIN;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_WRITE)        l_attr |= EPOLLOUT;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_STATUS_ERROR) l_attr |= EPOLLERR;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_RD_HUP)       l_attr |= EPOLLRDHUP;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_HUP)          l_attr |= EPOLLHUP;
        if (a_attr_mask & EVR_FILE_ATTR_MASK_ET)           l_attr |= EPOLLET;
        return l_attr;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int evr_epoll::add(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event)
{
        struct epoll_event ev;
        ev.events = get_epoll_attr(a_attr_mask);
        ev.data.ptr = a_evr_fd_event;
        if (0 != epoll_ctl(m_fd, EPOLL_CTL_ADD, a_fd, &ev))
        {
                TRC_ERROR("epoll_fd[%d] EPOLL_CTL_ADD fd[%d] failed (%s)\n",
                          m_fd, a_fd, strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int evr_epoll::mod(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event)
{
        struct epoll_event ev;
        ev.events = get_epoll_attr(a_attr_mask);
        ev.data.ptr = a_evr_fd_event;
        if (0 != epoll_ctl(m_fd, EPOLL_CTL_MOD, a_fd, &ev))
        {
                TRC_ERROR("epoll_fd[%d] EPOLL_CTL_MOD fd[%d] failed (%s)\n",
                          m_fd, a_fd, strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int evr_epoll::del(int a_fd)
{
        struct epoll_event ev;
        if ((m_fd > 0) && (a_fd > 0))
        {
                if (0 != epoll_ctl(m_fd, EPOLL_CTL_DEL, a_fd, &ev))
                {
                        return HLAT_STATUS_ERROR;
                }
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: Wake up epoll_wait by writing to control fd
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int evr_epoll::signal(void)
{
        uint64_t l_value = 1;
        ssize_t l_write_status = 0;
        l_write_status = write(m_ctrl_fd, &l_value, sizeof (l_value));
        if (l_write_status == -1)
        {
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
} //namespace ns_hlat {
