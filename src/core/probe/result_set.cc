//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    result_set.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "probe/result_set.h"
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
result_set::result_set(void):
        m_mutex(),
        m_phases(),
        m_failures(),
        m_num_failures(0)
{
        pthread_mutex_init(&m_mutex, nullptr);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
result_set::~result_set(void)
{
        pthread_mutex_destroy(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t result_set::add(const phase_t &a_phase)
{
        uint64_t l_completed;
        pthread_mutex_lock(&m_mutex);
        m_phases.push_back(a_phase);
        l_completed = m_phases.size() + m_num_failures;
        pthread_mutex_unlock(&m_mutex);
        return l_completed;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t result_set::add_failure(const probe_failure_t &a_failure)
{
        uint64_t l_completed;
        pthread_mutex_lock(&m_mutex);
        m_failures.push_back(a_failure);
        ++m_num_failures;
        l_completed = m_phases.size() + m_num_failures;
        pthread_mutex_unlock(&m_mutex);
        return l_completed;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t result_set::get_completed(void) const
{
        uint64_t l_completed;
        pthread_mutex_lock(&m_mutex);
        l_completed = m_phases.size() + m_num_failures;
        pthread_mutex_unlock(&m_mutex);
        return l_completed;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t result_set::get_size(void) const
{
        uint64_t l_size;
        pthread_mutex_lock(&m_mutex);
        l_size = m_phases.size();
        pthread_mutex_unlock(&m_mutex);
        return l_size;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t result_set::get_num_failures(void) const
{
        uint64_t l_num;
        pthread_mutex_lock(&m_mutex);
        l_num = m_num_failures;
        pthread_mutex_unlock(&m_mutex);
        return l_num;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void result_set::clear(void)
{
        pthread_mutex_lock(&m_mutex);
        m_phases.clear();
        m_failures.clear();
        m_num_failures = 0;
        pthread_mutex_unlock(&m_mutex);
}
} //namespace ns_hlat {
