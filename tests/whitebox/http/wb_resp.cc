//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_resp.cc
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
#include "http/resp.h"
#include <string.h>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "response parse", "[resp]" )
{
        SECTION("content length in pieces")
        {
                ns_hlat::resp l_resp;
                l_resp.init(true);
                const char l_p1[] = "HTTP/1.1 200 OK\r\nContent-Le";
                const char l_p2[] = "ngth: 5\r\nServer: test\r\n\r\nhel";
                const char l_p3[] = "lo";
                REQUIRE((l_resp.parse(l_p1, strlen(l_p1)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.parse(l_p2, strlen(l_p2)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == false));
                REQUIRE((l_resp.parse(l_p3, strlen(l_p3)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == true));
                REQUIRE((l_resp.get_status() == 200));
                REQUIRE((l_resp.get_body_len() == 5));
                REQUIRE((l_resp.m_body == "hello"));
                REQUIRE((l_resp.m_headers.size() == 2));
                REQUIRE((l_resp.m_headers.front().first == "Content-Length"));
                REQUIRE((l_resp.m_headers.front().second == "5"));
        }
        SECTION("body not saved")
        {
                ns_hlat::resp l_resp;
                l_resp.init(false);
                const char l_msg[] = "HTTP/1.1 404 Not Found\r\nContent-Length: 3\r\n\r\nabc";
                REQUIRE((l_resp.parse(l_msg, strlen(l_msg)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == true));
                REQUIRE((l_resp.get_status() == 404));
                REQUIRE((l_resp.get_body_len() == 3));
                REQUIRE((l_resp.m_body.empty()));
        }
        SECTION("empty body")
        {
                ns_hlat::resp l_resp;
                l_resp.init(false);
                const char l_msg[] = "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n";
                REQUIRE((l_resp.parse(l_msg, strlen(l_msg)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == true));
                REQUIRE((l_resp.get_body_len() == 0));
        }
        SECTION("close delimited body")
        {
                ns_hlat::resp l_resp;
                l_resp.init(false);
                const char l_msg[] = "HTTP/1.1 200 OK\r\nConnection: close\r\n\r\nsome body";
                REQUIRE((l_resp.parse(l_msg, strlen(l_msg)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == false));
                REQUIRE((l_resp.parse_eof() == HLAT_STATUS_OK));
                REQUIRE((l_resp.m_complete == true));
                REQUIRE((l_resp.get_body_len() == 9));
        }
        SECTION("truncated response")
        {
                ns_hlat::resp l_resp;
                l_resp.init(false);
                const char l_msg[] = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
                REQUIRE((l_resp.parse(l_msg, strlen(l_msg)) == HLAT_STATUS_OK));
                REQUIRE((l_resp.parse_eof() == HLAT_STATUS_ERROR));
                REQUIRE((l_resp.get_last_error().empty() == false));
        }
        SECTION("garbage")
        {
                ns_hlat::resp l_resp;
                l_resp.init(false);
                const char l_msg[] = "NOT HTTP AT ALL\r\n\r\n";
                REQUIRE((l_resp.parse(l_msg, strlen(l_msg)) == HLAT_STATUS_ERROR));
        }
}
