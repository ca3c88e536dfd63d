//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    result_set.h
//! \details: measurements and recorded failures of one run
//!           -appended concurrently by workers
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_RESULT_SET_H
#define _HLAT_RESULT_SET_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/phase.h"
#include "probe/errors.h"
#include <pthread.h>
#include <stdint.h>
#include <vector>
#include <list>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef std::vector<phase_t> phase_vector_t;
typedef std::list<probe_failure_t> probe_failure_list_t;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class result_set
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        result_set();
        ~result_set();
        // append -return completed count (measurements + failures)
        uint64_t add(const phase_t &a_phase);
        uint64_t add_failure(const probe_failure_t &a_failure);
        uint64_t get_completed(void) const;
        uint64_t get_size(void) const;
        uint64_t get_num_failures(void) const;
        void clear(void);
        // read only after all writers joined
        const phase_vector_t &get_phases(void) const { return m_phases; }
        const probe_failure_list_t &get_failures(void) const { return m_failures; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // Disallow copy/assign
        result_set& operator=(const result_set &);
        result_set(const result_set &);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        mutable pthread_mutex_t m_mutex;
        phase_vector_t m_phases;
        probe_failure_list_t m_failures;
        uint64_t m_num_failures;
};
} //namespace ns_hlat {
#endif
