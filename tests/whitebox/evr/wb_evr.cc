//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_evr.cc
//! \details: TODO
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "catch2/catch.hpp"
#include "status.h"
#include "evr/evr.h"
#include "support/time_util.h"
//! ----------------------------------------------------------------------------
//! \details: count timer fires
//! \return:  HLAT_STATUS_OK
//! \param:   a_data: uint32_t counter
//! ----------------------------------------------------------------------------
static int32_t count_cb(void *a_data)
{
        uint32_t *l_count = static_cast<uint32_t *>(a_data);
        ++(*l_count);
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: timer callback returning done
//! \return:  HLAT_STATUS_DONE
//! \param:   a_data: uint32_t counter
//! ----------------------------------------------------------------------------
static int32_t done_cb(void *a_data)
{
        count_cb(a_data);
        return HLAT_STATUS_DONE;
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "event loop", "[evr]" )
{
        SECTION("timer fires")
        {
                ns_hlat::evr_loop l_loop(ns_hlat::EVR_LOOP_EPOLL, 64);
                REQUIRE((l_loop.init() == HLAT_STATUS_OK));
                uint32_t l_count = 0;
                uint64_t l_start_ms = ns_hlat::get_time_ms();
                int32_t l_s;
                l_s = l_loop.add_event(20, done_cb, &l_count, nullptr);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_loop.get_pq_size() == 1));
                l_s = HLAT_STATUS_OK;
                for (int i_r = 0; (i_r < 100) && (l_s != HLAT_STATUS_DONE); ++i_r)
                {
                        l_s = l_loop.run();
                }
                REQUIRE((l_s == HLAT_STATUS_DONE));
                REQUIRE((l_count == 1));
                REQUIRE((ns_hlat::get_delta_time_ms(l_start_ms) >= 20));
                REQUIRE((l_loop.get_pq_size() == 0));
        }
        SECTION("cancelled timer does not fire")
        {
                ns_hlat::evr_loop l_loop(ns_hlat::EVR_LOOP_EPOLL, 64);
                REQUIRE((l_loop.init() == HLAT_STATUS_OK));
                uint32_t l_cancelled = 0;
                uint32_t l_fired = 0;
                ns_hlat::evr_event_t *l_ev = nullptr;
                int32_t l_s;
                l_s = l_loop.add_event(5, count_cb, &l_cancelled, &l_ev);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_ev != nullptr));
                l_s = l_loop.add_event(30, done_cb, &l_fired, nullptr);
                REQUIRE((l_s == HLAT_STATUS_OK));
                l_s = l_loop.cancel_event(l_ev);
                REQUIRE((l_s == HLAT_STATUS_OK));
                l_s = HLAT_STATUS_OK;
                for (int i_r = 0; (i_r < 100) && (l_s != HLAT_STATUS_DONE); ++i_r)
                {
                        l_s = l_loop.run();
                }
                REQUIRE((l_s == HLAT_STATUS_DONE));
                REQUIRE((l_cancelled == 0));
                REQUIRE((l_fired == 1));
        }
        SECTION("signal wakes waiting loop")
        {
                ns_hlat::evr_loop l_loop(ns_hlat::EVR_LOOP_EPOLL, 64);
                REQUIRE((l_loop.init() == HLAT_STATUS_OK));
                uint32_t l_count = 0;
                int32_t l_s;
                // far timer bounds the wait if the wakeup is lost
                l_s = l_loop.add_event(5000, count_cb, &l_count, nullptr);
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((l_loop.signal() == HLAT_STATUS_OK));
                uint64_t l_start_ms = ns_hlat::get_time_ms();
                l_s = l_loop.run();
                REQUIRE((l_s == HLAT_STATUS_OK));
                REQUIRE((ns_hlat::get_delta_time_ms(l_start_ms) < 1000));
                REQUIRE((l_count == 0));
        }
}
