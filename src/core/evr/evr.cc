//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    evr.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "evr/evr.h"
#include "evr_epoll.h"
#include "support/time_util.h"
#include "support/trace.h"
#include <errno.h>
#include <string.h>
#include <stdlib.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
evr_loop::evr_loop(evr_loop_type_t a_type,
                   uint32_t a_max_events):
        m_event_pq(),
        m_max_events(a_max_events),
        m_loop_type(a_type),
        m_events(nullptr),
        m_evr(nullptr)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
evr_loop::~evr_loop(void)
{
        // Clean out timer q
        while (!m_event_pq.empty())
        {
                evr_event_t *l_event = m_event_pq.top();
                if (l_event)
                {
                        delete l_event;
                        l_event = nullptr;
                }
                m_event_pq.pop();
        }
        if (m_events)
        {
                free(m_events);
                m_events = nullptr;
        }
        if (m_evr)
        {
                delete m_evr;
                m_evr = nullptr;
        }
}
//! ----------------------------------------------------------------------------
//! \details: create the OS specific event handler
//! \return:  HLAT_STATUS_OK on success, HLAT_STATUS_ERROR on failure
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t evr_loop::init(void)
{
        if (m_evr)
        {
                return HLAT_STATUS_OK;
        }
        m_events = (evr_events_t *)malloc(sizeof(evr_events_t)*m_max_events);
        if (!m_events)
        {
                TRC_ERROR("error allocating %u events\n", m_max_events);
                return HLAT_STATUS_ERROR;
        }
        if (m_loop_type == EVR_LOOP_EPOLL)
        {
                m_evr = new evr_epoll();
        }
        if (!m_evr)
        {
                TRC_ERROR("unsupported loop type: %d\n", m_loop_type);
                return HLAT_STATUS_ERROR;
        }
        int32_t l_s;
        l_s = m_evr->init();
        if (l_s != HLAT_STATUS_OK)
        {
                delete m_evr;
                m_evr = nullptr;
                return HLAT_STATUS_ERROR;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: run one iteration -either fire the first expired timer or wait
//!           for fd events (bounded by the next timer) and service them.
//! \return:  status of the timer callback or HLAT_STATUS_OK
//! \param:   NA
//! ----------------------------------------------------------------------------
int32_t evr_loop::run(void)
{
        if (!m_evr)
        {
                return HLAT_STATUS_ERROR;
        }
        evr_event_t *l_event = nullptr;
        int l_time_diff_ms = EVR_DEFAULT_TIME_WAIT_MS;
        // Pop events off pq until time > now
        while (!m_event_pq.empty())
        {
                uint64_t l_now_ms = get_time_ms();
                l_event = m_event_pq.top();
                if ((l_now_ms < l_event->m_time_ms) &&
                   (l_event->m_state != EVR_EVENT_CANCELLED))
                {
                        l_time_diff_ms = (int)(l_event->m_time_ms - l_now_ms);
                        break;
                }
                m_event_pq.pop();
                if (l_event->m_state != EVR_EVENT_CANCELLED)
                {
                        int32_t l_s = HLAT_STATUS_OK;
                        if (l_event->m_cb)
                        {
                                l_s = l_event->m_cb(l_event->m_data);
                        }
                        delete l_event;
                        l_event = nullptr;
                        return l_s;
                }
                delete l_event;
                l_event = nullptr;
        }
        // -------------------------------------------------
        // Wait for events
        // -------------------------------------------------
        int l_num_events = 0;
        l_num_events = m_evr->wait(m_events, m_max_events, l_time_diff_ms);
        if (l_num_events < 0)
        {
                if (errno == EINTR)
                {
                        return HLAT_STATUS_OK;
                }
                TRC_ERROR("wait failed. Reason: %s\n", strerror(errno));
                return HLAT_STATUS_ERROR;
        }
        // -------------------------------------------------
        // Service them
        // -------------------------------------------------
        for (int i_event = 0; i_event < l_num_events; ++i_event)
        {
                evr_fd_t* l_evr_fd = static_cast<evr_fd_t*>(m_events[i_event].data.ptr);
                // control fd -wake up only
                if (!l_evr_fd)
                {
                        continue;
                }
                if (l_evr_fd->m_magic != EVR_EVENT_FD_MAGIC)
                {
                        TRC_ERROR("bad event -ignoring.\n");
                        continue;
                }
                uint32_t l_events = m_events[i_event].events;
                if ((l_events & EVR_EV_IN) ||
                   (l_events & EVR_EV_RDHUP) ||
                   (l_events & EVR_EV_HUP) ||
                   (l_events & EVR_EV_ERR))
                {
                        if (l_evr_fd->m_read_cb)
                        {
                                int32_t l_s;
                                l_s = l_evr_fd->m_read_cb(l_evr_fd->m_data);
                                if (l_s != HLAT_STATUS_OK)
                                {
                                        // Skip handling more events for this fd
                                        continue;
                                }
                        }
                }
                if (l_events & EVR_EV_OUT)
                {
                        if (l_evr_fd->m_write_cb)
                        {
                                int32_t l_s;
                                l_s = l_evr_fd->m_write_cb(l_evr_fd->m_data);
                                if (l_s != HLAT_STATUS_OK)
                                {
                                        continue;
                                }
                        }
                }
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::add_fd(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event)
{
        if (!m_evr)
        {
                return HLAT_STATUS_ERROR;
        }
        return m_evr->add(a_fd, a_attr_mask, a_evr_fd_event);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::mod_fd(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event)
{
        if (!m_evr)
        {
                return HLAT_STATUS_ERROR;
        }
        return m_evr->mod(a_fd, a_attr_mask, a_evr_fd_event);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::del_fd(int a_fd)
{
        if (!m_evr)
        {
                return HLAT_STATUS_OK;
        }
        return m_evr->del(a_fd);
}
//! ----------------------------------------------------------------------------
//! \details: schedule a timer event a_time_ms from now.  The loop owns the
//!           event and frees it once fired or cancelled.
//! \return:  HLAT_STATUS_OK
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::add_event(uint32_t a_time_ms,
                            evr_event_cb_t a_cb,
                            void *a_data,
                            evr_event_t **ao_event)
{
        evr_event_t *l_event = new evr_event_t();
        l_event->m_data = a_data;
        l_event->m_state = EVR_EVENT_ACTIVE;
        l_event->m_time_ms = get_time_ms() + a_time_ms;
        l_event->m_cb = a_cb;
        m_event_pq.push(l_event);
        if (ao_event)
        {
                *ao_event = l_event;
        }
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::cancel_event(evr_event_t *a_event)
{
        if (!a_event)
        {
                return HLAT_STATUS_ERROR;
        }
        a_event->m_state = EVR_EVENT_CANCELLED;
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: wake up a waiting loop -safe to call from other threads
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t evr_loop::signal(void)
{
        if (!m_evr)
        {
                return HLAT_STATUS_ERROR;
        }
        return m_evr->signal();
}
} //namespace ns_hlat {
