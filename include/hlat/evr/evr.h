//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    evr.h
//! \details: event reactor -fd readiness and timer events
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_EVR_H
#define _HLAT_EVR_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stddef.h>
#include <stdint.h>
// for std::priority_queue
#include <queue>
#include <vector>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define EVR_DEFAULT_TIME_WAIT_MS (-1)
#define EVR_EVENT_FD_MAGIC 0xDEADF154
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! enums
//! ----------------------------------------------------------------------------
// loop type
typedef enum evr_loop_type
{
        EVR_LOOP_EPOLL
} evr_loop_type_t;
// connection mode
typedef enum evr_mode
{
        EVR_MODE_NONE,
        EVR_MODE_READ,
        EVR_MODE_WRITE,
        EVR_MODE_TIMEOUT,
        EVR_MODE_ERROR
} evr_mode_t;
// event state
typedef enum evr_event_state
{
        EVR_EVENT_ACTIVE,
        EVR_EVENT_CANCELLED
} evr_event_state_t;
// file attr
typedef enum evr_file_attr
{
        EVR_FILE_ATTR_MASK_READ = 1 << 0,
        EVR_FILE_ATTR_MASK_WRITE = 1 << 1,
        EVR_FILE_ATTR_MASK_STATUS_ERROR = 1 << 2,
        EVR_FILE_ATTR_MASK_RD_HUP = 1 << 3,
        EVR_FILE_ATTR_MASK_HUP = 1 << 4,
        EVR_FILE_ATTR_MASK_ET = 1 << 5
} evr_file_attr_t;
//! ----------------------------------------------------------------------------
//! \details: Types -copied from epoll
//! ----------------------------------------------------------------------------
typedef union evr_data_union
{
        void *ptr;
        int fd;
        uint32_t u32;
        uint64_t u64;
} evr_data_t;
struct evr_event_struct
{
        uint32_t events;
        evr_data_t data;
} __attribute__ ((__packed__));
typedef evr_event_struct evr_events_t;
typedef enum evr_event_types_enum
{
        EVR_EV_IN = 0x001,
        EVR_EV_OUT = 0x004,
        EVR_EV_ERR = 0x008,
        EVR_EV_HUP = 0x010,
        EVR_EV_RDHUP = 0x2000
} evr_event_types_t;
//! ----------------------------------------------------------------------------
//! callback/event types
//! ----------------------------------------------------------------------------
typedef int32_t (*evr_event_cb_t)(void *);
// file event
typedef struct evr_fd {
        uint32_t m_magic;
        evr_event_cb_t m_read_cb;
        evr_event_cb_t m_write_cb;
        evr_event_cb_t m_error_cb;
        void *m_data;
} evr_fd_t;
// timer event
typedef struct evr_event {
        uint64_t m_time_ms;
        evr_event_cb_t m_cb;
        evr_event_state_t m_state;
        void *m_data;
} evr_event_t;
//! ----------------------------------------------------------------------------
//! Priority queue sorting
//! ----------------------------------------------------------------------------
class evr_compare_events {
public:
        // Returns true if t1 is greater than t2
        bool operator()(evr_event_t* t1, evr_event_t* t2)
        {
                return (t1->m_time_ms > t2->m_time_ms);
        }
};
typedef std::priority_queue<evr_event_t *, std::vector<evr_event_t *>, evr_compare_events> evr_event_pq_t;
//! ----------------------------------------------------------------------------
//! \details: evr object -wraps OS specific implementations
//! ----------------------------------------------------------------------------
class evr
{
public:
        evr() {};
        virtual ~evr() {};
        virtual int32_t init(void) = 0;
        virtual int wait(evr_events_t* a_ev, int a_max_events, int a_timeout_msec) = 0;
        virtual int add(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event) = 0;
        virtual int mod(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event) = 0;
        virtual int del(int a_fd) = 0;
        virtual int signal(void) = 0;
};
//! ----------------------------------------------------------------------------
//! \details: event loop -one per thread, not thread safe except for signal()
//! ----------------------------------------------------------------------------
class evr_loop
{
public:
        evr_loop(evr_loop_type_t a_type = EVR_LOOP_EPOLL,
                 uint32_t a_max_events = 512);
        ~evr_loop();
        int32_t init(void);
        int32_t run(void);
        // -------------------------------------------
        // File events...
        // -------------------------------------------
        int32_t add_fd(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event);
        int32_t mod_fd(int a_fd, uint32_t a_attr_mask, evr_fd_t *a_evr_fd_event);
        int32_t del_fd(int a_fd);
        uint64_t get_pq_size(void) { return m_event_pq.size();};
        // -------------------------------------------
        // Timer events...
        // -------------------------------------------
        int32_t add_event(uint32_t a_time_ms,
                          evr_event_cb_t a_cb,
                          void *a_data,
                          evr_event_t **ao_event);
        int32_t cancel_event(evr_event_t *a_event);
        int32_t signal(void);
private:
        evr_loop(const evr_loop&);
        evr_loop& operator=(const evr_loop&);
        // Timer priority queue -used as min heap
        evr_event_pq_t m_event_pq;
        uint32_t m_max_events;
        evr_loop_type_t m_loop_type;
        evr_events_t *m_events;
        evr* m_evr;
};
} //namespace ns_hlat {
#endif
