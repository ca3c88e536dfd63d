//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    status.h
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_STATUS_H
#define _HLAT_STATUS_H
//! ----------------------------------------------------------------------------
//! Constants
//! ----------------------------------------------------------------------------
#ifndef HLAT_STATUS_OK
#define HLAT_STATUS_OK 0
#endif
#ifndef HLAT_STATUS_ERROR
#define HLAT_STATUS_ERROR -1
#endif
#ifndef HLAT_STATUS_AGAIN
#define HLAT_STATUS_AGAIN -2
#endif
#ifndef HLAT_STATUS_BUSY
#define HLAT_STATUS_BUSY -3
#endif
#ifndef HLAT_STATUS_DONE
#define HLAT_STATUS_DONE -4
#endif
#endif
