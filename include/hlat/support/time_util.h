//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    time_util.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_TIME_UTIL_H
#define _HLAT_TIME_UTIL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define HLAT_NS_PER_S  1000000000LL
#define HLAT_NS_PER_MS 1000000LL
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! Prototypes
//! ----------------------------------------------------------------------------
// wall clock
uint64_t get_time_ms(void);
uint64_t get_delta_time_ms(uint64_t a_start_time_ms);
// monotonic -for interval measurement only
int64_t get_time_ns(void);
} //namespace ns_hlat {
#endif
