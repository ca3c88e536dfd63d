//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    nconn.h
//! \details: non-blocking client connection abstraction
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
#ifndef _HLAT_NCONN_H
#define _HLAT_NCONN_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "nconn/scheme.h"
#include "nconn/conn_status.h"
#include "nconn/host_info.h"
#include "evr/evr.h"
#include "support/trace.h"
#include <stdio.h>
#include <string>
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#define SET_NCONN_OPT(_conn, _opt, _buf, _len) do {\
                int _status = 0;\
                _status = (_conn).set_opt((_opt), (_buf), (_len));\
                if (_status != ns_hlat::nconn::NC_STATUS_OK) {\
                        TRC_ERROR("failed to set_opt %d.  Status: %d.\n", _opt, _status); \
                        return HLAT_STATUS_ERROR;\
                }\
        } while(0)
#define NCONN_ERROR(status, ...) do {\
                  char _buf[1024];\
                  snprintf(_buf, sizeof(_buf), __VA_ARGS__);\
                  m_last_error.assign(_buf);\
                  m_conn_status = status;\
                  TRC_ERROR(__VA_ARGS__);\
          } while(0)
namespace ns_hlat {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! ----------------------------------------------------------------------------
class nconn
{
public:
        // -------------------------------------------------
        // connection status
        // -------------------------------------------------
        typedef enum status_enum {
                NC_STATUS_FREE = -1,
                NC_STATUS_OK = -2,
                NC_STATUS_AGAIN = -3,
                NC_STATUS_ERROR = -4,
                NC_STATUS_UNSUPPORTED = -5,
                NC_STATUS_EOF = -6,
                NC_STATUS_NONE = -10
        } status_t;
        // -------------------------------------------------
        // Connection state
        // -------------------------------------------------
        typedef enum nc_conn_state
        {
                NC_STATE_FREE = 0,
                NC_STATE_CONNECTING,
                NC_STATE_CONNECTED,
                NC_STATE_DONE
        } nc_conn_state_t;
        // -------------------------------------------------
        // Public methods
        // -------------------------------------------------
        nconn(void);
        virtual ~nconn();
        // -------------------------------------------------
        // data
        // -------------------------------------------------
        void set_data(void * a_data) {m_data = a_data;}
        void *get_data(void) {return m_data;}
        // -------------------------------------------------
        // evr
        // -------------------------------------------------
        void set_evr_loop(evr_loop * a_evr_loop) {m_evr_loop = a_evr_loop;}
        evr_loop *get_evr_loop(void) {return m_evr_loop;}
        // -------------------------------------------------
        // Getters
        // -------------------------------------------------
        const std::string &get_label(void) {return m_label;}
        scheme_t get_scheme(void) {return m_scheme;}
        const std::string &get_last_error(void) { return m_last_error;}
        conn_status_t get_status(void) { return m_conn_status;}
        const host_info &get_host_info(void) { return m_host_info;}
        // -------------------------------------------------
        // Setters
        // -------------------------------------------------
        void set_label(const std::string &a_label) {m_label = a_label;}
        void set_host_info(const host_info &a_host_info) {m_host_info = a_host_info; m_host_info_is_set = true;}
        void set_status(conn_status_t a_status) { m_conn_status = a_status;}
        void set_last_error(const std::string &a_err) { m_last_error = a_err;}
        void setup_evr_fd(evr_event_cb_t a_read_cb,
                          evr_event_cb_t a_write_cb,
                          evr_event_cb_t a_error_cb)
        {
                m_evr_fd.m_magic = EVR_EVENT_FD_MAGIC;
                m_evr_fd.m_read_cb = a_read_cb;
                m_evr_fd.m_write_cb = a_write_cb;
                m_evr_fd.m_error_cb = a_error_cb;
                m_evr_fd.m_data = this;
        }
        // -------------------------------------------------
        // State
        // -------------------------------------------------
        nc_conn_state_t get_state(void) { return m_nc_state; }
        void set_state(nc_conn_state_t a_state) { m_nc_state = a_state; }
        bool is_free(void) { return (m_nc_state == NC_STATE_FREE);}
        // -------------------------------------------------
        // Running
        // -------------------------------------------------
        int32_t nc_read(char *a_buf, uint32_t a_buf_len, uint32_t &ao_read);
        int32_t nc_write(const char *a_buf, uint32_t a_buf_len, uint32_t &ao_written);
        int32_t nc_cleanup();
        // -------------------------------------------------
        // Virtual Methods
        // -------------------------------------------------
        virtual int32_t ncsetup() = 0;
        virtual int32_t ncread(char *a_buf, uint32_t a_buf_len) = 0;
        virtual int32_t ncwrite(const char *a_buf, uint32_t a_buf_len) = 0;
        virtual int32_t ncconnect() = 0;
        virtual int32_t nccleanup() = 0;
        virtual int32_t set_opt(uint32_t a_opt, const void *a_buf, uint32_t a_len) = 0;
        virtual int32_t get_opt(uint32_t a_opt, void **a_buf, uint32_t *a_len) = 0;
        virtual bool is_connecting(void) = 0;
        // -------------------------------------------------
        // Protected members
        // -------------------------------------------------
        evr_loop *m_evr_loop;
        evr_fd_t m_evr_fd;
        scheme_t m_scheme;
        std::string m_label;
        void *m_data;
        conn_status_t m_conn_status;
        std::string m_last_error;
        host_info m_host_info;
        bool m_host_info_is_set;
private:
        // -------------------------------------------------
        // Private methods
        // -------------------------------------------------
        nconn& operator=(const nconn &);
        nconn(const nconn &);
        // -------------------------------------------------
        // Private members
        // -------------------------------------------------
        nc_conn_state_t m_nc_state;
};
} //namespace ns_hlat {
#endif
