//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    wb_nconn_tcp.cc
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
#include "nconn/nconn_tcp.h"
#include "nconn/host_info.h"
#include "dns/nlookup.h"
#include "support/time_util.h"
#include <unistd.h>
#include <string.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
//! ----------------------------------------------------------------------------
//! \details: blocking listener on 127.0.0.1 ephemeral port
//! \return:  listen fd or -1
//! \param:   ao_port: bound port
//! ----------------------------------------------------------------------------
static int local_listen(uint16_t &ao_port)
{
        int l_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (l_fd < 0)
        {
                return -1;
        }
        struct sockaddr_in l_sa;
        memset(&l_sa, 0, sizeof(l_sa));
        l_sa.sin_family = AF_INET;
        l_sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        l_sa.sin_port = 0;
        socklen_t l_len = sizeof(l_sa);
        if ((::bind(l_fd, (struct sockaddr *)&l_sa, sizeof(l_sa)) != 0) ||
           (::listen(l_fd, 16) != 0) ||
           (::getsockname(l_fd, (struct sockaddr *)&l_sa, &l_len) != 0))
        {
                ::close(l_fd);
                return -1;
        }
        ao_port = ntohs(l_sa.sin_port);
        return l_fd;
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "nconn tcp test", "[nconn_tcp]" )
{
        SECTION("Basic Connection Test")
        {
                uint16_t l_port = 0;
                int l_lfd = local_listen(l_port);
                REQUIRE((l_lfd >= 0));
                ns_hlat::nconn_tcp l_c;
                ns_hlat::host_info l_h;
                int32_t l_s;
                l_s = ns_hlat::nlookup("127.0.0.1", l_port, l_h);
                REQUIRE((l_s == HLAT_STATUS_OK));
                l_c.set_host_info(l_h);
                l_c.set_label("127.0.0.1");
                l_s = l_c.set_opt(ns_hlat::nconn_tcp::OPT_TCP_NO_DELAY, nullptr, 1);
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_OK));
                l_s = l_c.ncsetup();
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_OK));
                REQUIRE((ns_hlat::nconn_get_fd(l_c) >= 0));
                int64_t l_before_ns = ns_hlat::get_time_ns();
                // connect completes against listen backlog
                for (int i_t = 0; i_t < 100; ++i_t)
                {
                        l_s = l_c.ncconnect();
                        REQUIRE((l_s != ns_hlat::nconn::NC_STATUS_ERROR));
                        if (!l_c.is_connecting())
                        {
                                break;
                        }
                        usleep(10000);
                }
                REQUIRE((l_c.is_connecting() == false));
                REQUIRE((ns_hlat::nconn_get_connected_ns(l_c) >= l_before_ns));
                int l_sfd = ::accept(l_lfd, nullptr, nullptr);
                REQUIRE((l_sfd >= 0));
                // client -> server
                uint32_t l_written = 0;
                l_s = l_c.nc_write("ping", 4, l_written);
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_OK));
                REQUIRE((l_written == 4));
                char l_buf[16];
                ssize_t l_r = ::recv(l_sfd, l_buf, sizeof(l_buf), 0);
                REQUIRE((l_r == 4));
                REQUIRE((strncmp(l_buf, "ping", 4) == 0));
                // server -> client
                REQUIRE((::send(l_sfd, "pong", 4, 0) == 4));
                uint32_t l_read = 0;
                for (int i_t = 0; i_t < 100; ++i_t)
                {
                        l_s = l_c.nc_read(l_buf, sizeof(l_buf), l_read);
                        if (l_s != ns_hlat::nconn::NC_STATUS_AGAIN)
                        {
                                break;
                        }
                        usleep(10000);
                }
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_OK));
                REQUIRE((l_read == 4));
                REQUIRE((strncmp(l_buf, "pong", 4) == 0));
                // server close -> eof
                ::close(l_sfd);
                for (int i_t = 0; i_t < 100; ++i_t)
                {
                        l_s = l_c.nc_read(l_buf, sizeof(l_buf), l_read);
                        if (l_s != ns_hlat::nconn::NC_STATUS_AGAIN)
                        {
                                break;
                        }
                        usleep(10000);
                }
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_EOF));
                l_s = l_c.nc_cleanup();
                REQUIRE((l_s == HLAT_STATUS_OK));
                ::close(l_lfd);
        }
        SECTION("Connection refused")
        {
                uint16_t l_port = 0;
                int l_lfd = local_listen(l_port);
                REQUIRE((l_lfd >= 0));
                // nothing listening after close
                ::close(l_lfd);
                ns_hlat::nconn_tcp l_c;
                ns_hlat::host_info l_h;
                int32_t l_s;
                l_s = ns_hlat::nlookup("127.0.0.1", l_port, l_h);
                REQUIRE((l_s == HLAT_STATUS_OK));
                l_c.set_host_info(l_h);
                l_s = l_c.ncsetup();
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_OK));
                for (int i_t = 0; i_t < 100; ++i_t)
                {
                        l_s = l_c.ncconnect();
                        if ((l_s == ns_hlat::nconn::NC_STATUS_ERROR) ||
                           !l_c.is_connecting())
                        {
                                break;
                        }
                        usleep(10000);
                }
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_ERROR));
                REQUIRE((ns_hlat::nconn_get_status(l_c) == ns_hlat::CONN_STATUS_ERROR_CONNECT));
                REQUIRE((ns_hlat::nconn_get_last_error_str(l_c).empty() == false));
                l_s = l_c.nc_cleanup();
                REQUIRE((l_s == HLAT_STATUS_OK));
        }
        SECTION("Setup without host info")
        {
                ns_hlat::nconn_tcp l_c;
                int32_t l_s;
                l_s = l_c.ncsetup();
                REQUIRE((l_s == ns_hlat::nconn::NC_STATUS_ERROR));
                REQUIRE((ns_hlat::nconn_get_status(l_c) == ns_hlat::CONN_STATUS_ERROR_INTERNAL));
        }
}
