//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    aggregator.h
//! \details: per phase arithmetic mean of a result set
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_AGGREGATOR_H
#define _HLAT_AGGREGATOR_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/phase.h"
#include "probe/errors.h"
#include "probe/result_set.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: sum each field in int64 then truncating divide by count
//!           -mean total may differ from sum of mean phases by truncation
//! \return:  HLAT_STATUS_OK on success
//!           HLAT_STATUS_ERROR with HLAT_ERR_EMPTY_RESULT_SET if no samples
//! \param:   a_phases: samples
//! \param:   ao_summary: mean of each field
//! \param:   ao_err: optional error
//! ----------------------------------------------------------------------------
int32_t summarize(const phase_vector_t &a_phases,
                  phase_t &ao_summary,
                  hlat_err_t *ao_err = nullptr);
int32_t summarize(const result_set &a_results,
                  phase_t &ao_summary,
                  hlat_err_t *ao_err = nullptr);
} //namespace ns_hlat {
#endif
