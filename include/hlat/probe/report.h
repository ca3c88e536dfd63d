//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    report.h
//! \details: summary rendering -text and json
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_REPORT_H
#define _HLAT_REPORT_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/phase.h"
#include <stdint.h>
#include <string>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
// shortest form seconds ie 1000000000 -> "1", 200000000 -> "0.2"
std::string ns_to_s_str(int64_t a_ns);
int32_t report_text(const phase_t &a_summary, std::string &ao_str);
int32_t report_json(const phase_t &a_summary,
                    uint64_t a_samples,
                    uint64_t a_failures,
                    std::string &ao_str);
std::string report_samples_line(uint64_t a_succeeded, uint64_t a_failed);
} //namespace ns_hlat {
#endif
