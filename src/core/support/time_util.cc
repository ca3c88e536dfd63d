//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    time_util.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "support/time_util.h"
#include <time.h>
#ifdef __MACH__
#include <mach/clock.h>
#include <mach/mach.h>
#endif
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: Portable gettime function
//! \return:  NA
//! \param:   ao_timespec: struct timespec -with gettime result
//! ----------------------------------------------------------------------------
static void _rt_gettime(struct timespec &ao_timespec)
{
#ifdef __MACH__ // OS X does not have clock_gettime, use clock_get_time
        clock_serv_t l_cclock;
        mach_timespec_t l_mts;
        host_get_clock_service(mach_host_self(), CALENDAR_CLOCK, &l_cclock);
        clock_get_time(l_cclock, &l_mts);
        mach_port_deallocate(mach_task_self(), l_cclock);
        ao_timespec.tv_sec = l_mts.tv_sec;
        ao_timespec.tv_nsec = l_mts.tv_nsec;
#else
        clock_gettime(CLOCK_REALTIME, &ao_timespec);
#endif
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t get_time_ms(void)
{
        struct timespec l_timespec;
        _rt_gettime(l_timespec);
        return (((uint64_t)l_timespec.tv_sec) * 1000) + (((uint64_t)l_timespec.tv_nsec) / 1000000);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t get_delta_time_ms(uint64_t a_start_time_ms)
{
        return get_time_ms() - a_start_time_ms;
}
//! ----------------------------------------------------------------------------
//! \details: monotonic clock in nanoseconds -never cached, never goes
//!           backwards, unrelated to wall clock time.
//! \return:  nanoseconds since an arbitrary fixed point
//! \param:   NA
//! ----------------------------------------------------------------------------
int64_t get_time_ns(void)
{
        struct timespec l_timespec;
#ifdef __MACH__
        clock_serv_t l_cclock;
        mach_timespec_t l_mts;
        host_get_clock_service(mach_host_self(), SYSTEM_CLOCK, &l_cclock);
        clock_get_time(l_cclock, &l_mts);
        mach_port_deallocate(mach_task_self(), l_cclock);
        l_timespec.tv_sec = l_mts.tv_sec;
        l_timespec.tv_nsec = l_mts.tv_nsec;
#else
        clock_gettime(CLOCK_MONOTONIC, &l_timespec);
#endif
        return (((int64_t)l_timespec.tv_sec) * HLAT_NS_PER_S) + ((int64_t)l_timespec.tv_nsec);
}
} //namespace ns_hlat {
