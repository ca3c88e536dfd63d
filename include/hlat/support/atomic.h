//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    atomic.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_ATOMIC_H
#define _HLAT_ATOMIC_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: atomic support -gcc builtins
//! ----------------------------------------------------------------------------
template <class T>
class atomic_gcc_builtin
{
public:
        // see http://gcc.gnu.org/onlinedocs/gcc-4.1.0/gcc/Atomic-Builtins.html
        atomic_gcc_builtin() : v(0) {}
        atomic_gcc_builtin(T i) : v(i) {}
        atomic_gcc_builtin& operator=(T rhs)
        {
                (void) __sync_lock_test_and_set (&v, rhs);
                return *this;
        }
        operator T() const
        {
                __sync_synchronize();
                return v;
        }
        T operator ++() { return __sync_add_and_fetch(&v, T(1)); }
        T operator +=(T i) { return __sync_add_and_fetch(&v, i); }
        // set to a_newval only if currently a_oldval
        bool exchange(T a_oldval, T a_newval)
        {
                return __sync_bool_compare_and_swap(&v, a_oldval, a_newval);
        }
        volatile T v;
private:
        atomic_gcc_builtin(const atomic_gcc_builtin &);
};
typedef atomic_gcc_builtin<uint32_t> uint32_atomic_t;
typedef atomic_gcc_builtin<uint64_t> uint64_atomic_t;
} //namespace ns_hlat {
#endif
