//! ----------------------------------------------------------------------------
//! Copyright Edgio Inc.
//!
//! \file:    hlat.cc
//! \details: HTTP latency breakdown prober
//!
//! Licensed under the terms of the Apache 2.0 open source license.
//! Please refer to the LICENSE file in the project root for the terms.
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "status.h"
#include "probe/orchestrator.h"
#include "probe/result_set.h"
#include "probe/aggregator.h"
#include "probe/report.h"
#include "probe/errors.h"
#include "support/atomic.h"
#include "support/tls_util.h"
#include "support/trace.h"
// signal
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>
#include <errno.h>
#include <stdint.h>
#ifndef __STDC_FORMAT_MACROS
#define __STDC_FORMAT_MACROS 1
#endif
#include <inttypes.h>
// Profiler
#ifdef ENABLE_PROFILER
#include <gperftools/profiler.h>
#include <gperftools/heap-profiler.h>
#endif
// For AF_INET
#include <sys/types.h>
#include <sys/socket.h>
// openssl
#include <openssl/ssl.h>
#include <string>
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
// stop flag of the running orchestrator -only stored to from sig_handler
static ns_hlat::uint32_atomic_t *g_stop_flag = nullptr;
//! ----------------------------------------------------------------------------
//! \details: Signal handler
//! \return:  NA
//! \param:   signo: signal number
//! ----------------------------------------------------------------------------
void sig_handler(int signo)
{
        if (signo == SIGINT)
        {
                // stop run -workers are woken by the orchestrator
                if (g_stop_flag)
                {
                        *g_stop_flag = 1;
                }
        }
}
//! ----------------------------------------------------------------------------
//! \details: Print the version.
//! \return:  NA
//! \param:   a_stream: output stream
//! \param:   a_exit_code: process exit code
//! ----------------------------------------------------------------------------
void print_version(FILE* a_stream, int a_exit_code)
{
        // print out the version information
        fprintf(a_stream, "hlat HTTP Latency Breakdown.\n");
        fprintf(a_stream, "Copyright (C) Edgio Inc.\n");
        fprintf(a_stream, "               Version: %s\n", HLAT_VERSION);
        fprintf(a_stream, "       OpenSSL Version: 0x%X\n", (uint32_t)OPENSSL_VERSION_NUMBER);
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details: Print the command line help.
//! \return:  NA
//! \param:   a_stream: output stream
//! \param:   a_exit_code: process exit code
//! ----------------------------------------------------------------------------
void print_usage(FILE* a_stream, int a_exit_code)
{
        fprintf(a_stream, "Usage: hlat [http[s]://]hostname[:port]/path [options]\n");
        fprintf(a_stream, "Options are:\n");
        fprintf(a_stream, "  -h, --help            Display this help and exit.\n");
        fprintf(a_stream, "  -V, --version         Display the version number and exit.\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Run Options:\n");
        fprintf(a_stream, "  -c, --connections     Number of concurrent probes. Default: 1\n");
        fprintf(a_stream, "  -n, --samples         Total sample target (target-count mode). Default: one per connection\n");
        fprintf(a_stream, "  -e, --collect_errors  Record failed probes and continue (default: fail fast)\n");
        fprintf(a_stream, "  -T, --timeout         Connect/TLS handshake timeout (seconds). Default: 10\n");
        fprintf(a_stream, "  -I, --idle_timeout    Response idle timeout (seconds). Default: 30\n");
        fprintf(a_stream, "  -4, --ipv4            Resolve name to IPv4 address.\n");
        fprintf(a_stream, "  -6, --ipv6            Resolve name to IPv6 address.\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "TLS Settings:\n");
        fprintf(a_stream, "  -k, --insecure        Skip TLS certificate verification.\n");
        fprintf(a_stream, "  -y, --cipher          Cipher list --see \"openssl ciphers\" for list.\n");
        fprintf(a_stream, "  -O, --tls_options     TLS options string.\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Display Options:\n");
        fprintf(a_stream, "  -v, --verbose         Verbose (per-probe measurements and TLS info).\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Results Options:\n");
        fprintf(a_stream, "  -j, --json            Display results in json.\n");
        fprintf(a_stream, "  -o, --output          Output results to file <FILE> -default to stdout.\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Debug Options:\n");
        fprintf(a_stream, "  -r, --trace           Turn on tracing (error/warn/debug/verbose/all)\n");
#ifdef ENABLE_PROFILER
        fprintf(a_stream, "  -P, --hprofile        Google heap profiler output file\n");
        fprintf(a_stream, "  -G, --cprofile        Google cpu profiler output file\n");
#endif
        fprintf(a_stream, "  \n");
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details: parse positive integer seconds argument
//! \return:  HLAT_STATUS_OK on success
//! \param:   a_arg: argument string
//! \param:   ao_ms: value in milliseconds
//! ----------------------------------------------------------------------------
static int32_t parse_seconds(const std::string &a_arg, uint32_t &ao_ms)
{
        char *l_end = nullptr;
        errno = 0;
        long l_val = strtol(a_arg.c_str(), &l_end, 10);
        if ((errno != 0) ||
           (l_end == a_arg.c_str()) ||
           (*l_end != '\0') ||
           (l_val < 1) ||
           (l_val > 86400))
        {
                return HLAT_STATUS_ERROR;
        }
        ao_ms = (uint32_t)(l_val*1000);
        return HLAT_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int main(int argc, char** argv)
{
        ns_hlat::orchestrator::conf_t l_conf;
        bool l_display_results_json_flag = false;
        std::string l_output_file = "";
        ns_hlat::trc_log_level_set(ns_hlat::TRC_LOG_LEVEL_NONE);
        ns_hlat::tls_init();
        // -------------------------------------------------
        // if is interactive term
        // -------------------------------------------------
        if (isatty(fileno(stdout)))
        {
                l_conf.m_color = true;
        }
        // -------------------------------------------------
        // default tls config
        // -------------------------------------------------
        l_conf.m_tls_options =
                SSL_OP_ALL |
                SSL_OP_NO_SSLv2 |
                SSL_OP_NO_SSLv3 |
                SSL_OP_NO_COMPRESSION |
                SSL_OP_NO_SESSION_RESUMPTION_ON_RENEGOTIATION;
        // -------------------------------------------------
        // Get args...
        // -------------------------------------------------
        char l_opt = '\0';
        std::string l_arg;
        int l_option_index = 0;
        struct option l_long_options[] =
                {
                { "help",           0, 0, 'h' },
                { "version",        0, 0, 'V' },
                { "connections",    1, 0, 'c' },
                { "samples",        1, 0, 'n' },
                { "collect_errors", 0, 0, 'e' },
                { "timeout",        1, 0, 'T' },
                { "idle_timeout",   1, 0, 'I' },
                { "ipv4",           0, 0, '4' },
                { "ipv6",           0, 0, '6' },
                { "insecure",       0, 0, 'k' },
                { "cipher",         1, 0, 'y' },
                { "tls_options",    1, 0, 'O' },
                { "verbose",        0, 0, 'v' },
                { "json",           0, 0, 'j' },
                { "output",         1, 0, 'o' },
                { "trace",          1, 0, 'r' },
#ifdef ENABLE_PROFILER
                { "hprofile",       1, 0, 'P' },
                { "cprofile",       1, 0, 'G' },
#endif
                // list sentinel
                { 0, 0, 0, 0 }
        };
        std::string l_url;
#ifdef ENABLE_PROFILER
        std::string l_hprof_file;
        std::string l_cprof_file;
#endif
#ifdef ENABLE_PROFILER
        char l_short_arg_list[] = "hVc:n:eT:I:46ky:O:vjo:r:P:G:";
#else
        char l_short_arg_list[] = "hVc:n:eT:I:46ky:O:vjo:r:";
#endif
        while(((unsigned char)l_opt != 255))
        {
                l_opt = getopt_long_only(argc, argv, l_short_arg_list, l_long_options, &l_option_index);
                if (optarg)
                {
                        l_arg = std::string(optarg);
                }
                else
                {
                        l_arg.clear();
                }
                switch (l_opt)
                {
                // -----------------------------------------
                // Help
                // -----------------------------------------
                case 'h':
                {
                        print_usage(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // Version
                // -----------------------------------------
                case 'V':
                {
                        print_version(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // connections
                // -----------------------------------------
                case 'c':
                {
                        int l_val = atoi(optarg);
                        if (l_val == 0)
                        {
                                fprintf(stderr, "Error: connections must be at least 1\n");
                                print_usage(stdout, 1);
                        }
                        if (l_val < 0)
                        {
                                fprintf(stderr, "Error: connections must be at least 1\n");
                                return HLAT_STATUS_ERROR;
                        }
                        l_conf.m_concurrency = l_val;
                        break;
                }
                // -----------------------------------------
                // samples
                // -----------------------------------------
                case 'n':
                {
                        l_conf.m_samples = strtoll(optarg, nullptr, 10);
                        break;
                }
                // -----------------------------------------
                // collect errors
                // -----------------------------------------
                case 'e':
                {
                        l_conf.m_failure_policy = ns_hlat::orchestrator::FAILURE_POLICY_COLLECT_ERRORS;
                        break;
                }
                // -----------------------------------------
                // timeout
                // -----------------------------------------
                case 'T':
                {
                        int32_t l_s;
                        l_s = parse_seconds(l_arg, l_conf.m_connect_timeout_ms);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                fprintf(stderr, "Error: timeout must be > 0\n");
                                return HLAT_STATUS_ERROR;
                        }
                        break;
                }
                // -----------------------------------------
                // idle timeout
                // -----------------------------------------
                case 'I':
                {
                        int32_t l_s;
                        l_s = parse_seconds(l_arg, l_conf.m_idle_timeout_ms);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                fprintf(stderr, "Error: idle timeout must be > 0\n");
                                return HLAT_STATUS_ERROR;
                        }
                        break;
                }
                // -----------------------------------------
                // Use IPv4
                // -----------------------------------------
                case '4':
                {
                        l_conf.m_ai_family = AF_INET;
                        break;
                }
                // -----------------------------------------
                // Use IPv6
                // -----------------------------------------
                case '6':
                {
                        l_conf.m_ai_family = AF_INET6;
                        break;
                }
                // -----------------------------------------
                // insecure
                // -----------------------------------------
                case 'k':
                {
                        l_conf.m_tls_verify = false;
                        break;
                }
                // -----------------------------------------
                // cipher
                // -----------------------------------------
                case 'y':
                {
                        l_conf.m_tls_cipher_list = l_arg;
                        break;
                }
                // -----------------------------------------
                // tls options
                // -----------------------------------------
                case 'O':
                {
                        int32_t l_s;
                        long l_tls_options;
                        l_s = ns_hlat::get_tls_options_str_val(l_arg, l_tls_options);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                fprintf(stderr, "Error: performing get_tls_options_str_val with options: %s.  Bad option?\n",
                                           l_arg.c_str());
                                return HLAT_STATUS_ERROR;
                        }
                        l_conf.m_tls_options = l_tls_options;
                        break;
                }
                // -----------------------------------------
                // verbose
                // -----------------------------------------
                case 'v':
                {
                        l_conf.m_verbose = true;
                        break;
                }
                // -----------------------------------------
                // json
                // -----------------------------------------
                case 'j':
                {
                        l_display_results_json_flag = true;
                        break;
                }
                // -----------------------------------------
                // output
                // -----------------------------------------
                case 'o':
                {
                        l_output_file = l_arg;
                        break;
                }
                // -----------------------------------------
                // trace
                // -----------------------------------------
                case 'r':
                {
                        int32_t l_s;
                        ns_hlat::trc_log_level_t l_level;
                        l_s = ns_hlat::trc_log_level_parse(l_arg.c_str(), l_level);
                        if (l_s != HLAT_STATUS_OK)
                        {
                                fprintf(stderr, "Error: unrecognized trace level: %s\n", l_arg.c_str());
                                return HLAT_STATUS_ERROR;
                        }
                        ns_hlat::trc_log_level_set(l_level);
                        l_s = ns_hlat::trc_log_file_open("/dev/stdout");
                        if (l_s != HLAT_STATUS_OK)
                        {
                                fprintf(stderr, "Error: opening trace log file\n");
                                return HLAT_STATUS_ERROR;
                        }
                        break;
                }
#ifdef ENABLE_PROFILER
                // -----------------------------------------
                // Google Profiler Output File
                // -----------------------------------------
                case 'P':
                {
                        l_hprof_file = l_arg;
                        break;
                }
                // -----------------------------------------
                // Google Profiler Output File
                // -----------------------------------------
                case 'G':
                {
                        l_cprof_file = l_arg;
                        break;
                }
#endif
                // -----------------------------------------
                // What???
                // -----------------------------------------
                case '?':
                {
                        // Required argument was missing
                        // '?' is provided when the 3rd arg to getopt_long does not begin with a ':', and preceeded
                        // by an automatic error message.
                        fprintf(stderr, "  Exiting.\n");
                        print_usage(stdout, HLAT_STATUS_ERROR);
                        break;
                }
                // -----------------------------------------
                // Huh???
                // -----------------------------------------
                default:
                {
                        break;
                }
                }
        }
        // -------------------------------------------------
        // url is the unspecified arg
        // -------------------------------------------------
        if (optind < argc)
        {
                l_url = argv[optind];
        }
        if (l_url.empty())
        {
                fprintf(stderr, "Error: No specified URL on cmd line.\n");
                print_usage(stdout, 1);
        }
        l_conf.m_url = l_url;
        // -------------------------------------------------
        // output
        // -------------------------------------------------
        FILE *l_out_file = stdout;
        if (!l_output_file.empty())
        {
                l_out_file = fopen(l_output_file.c_str(), "w");
                if (!l_out_file)
                {
                        fprintf(stderr, "Error: opening output file: %s. Reason: %s\n",
                                l_output_file.c_str(), strerror(errno));
                        return HLAT_STATUS_ERROR;
                }
        }
        ns_hlat::g_trc_out_file = l_out_file;
        // -------------------------------------------------
        // Sigint handler
        // -------------------------------------------------
        ns_hlat::orchestrator *l_orchestrator = new ns_hlat::orchestrator(l_conf);
        g_stop_flag = l_orchestrator->get_stop_flag();
        if (signal(SIGINT, sig_handler) == SIG_ERR)
        {
                fprintf(stderr, "Error: can't catch SIGINT\n");
                return HLAT_STATUS_ERROR;
        }
        // SSL_write on a reset connection
        if (signal(SIGPIPE, SIG_IGN) == SIG_ERR)
        {
                fprintf(stderr, "Error: can't ignore SIGPIPE\n");
                return HLAT_STATUS_ERROR;
        }
#ifdef ENABLE_PROFILER
        // -------------------------------------------------
        // start profiler(s)
        // -------------------------------------------------
        if (!l_hprof_file.empty())
        {
                HeapProfilerStart(l_hprof_file.c_str());
        }
        if (!l_cprof_file.empty())
        {
                ProfilerStart(l_cprof_file.c_str());
        }
#endif
        // -------------------------------------------------
        // run
        // -------------------------------------------------
        ns_hlat::result_set l_results;
        int32_t l_s;
        int l_exit = 0;
        l_s = l_orchestrator->run(l_results);
        signal(SIGINT, SIG_DFL);
        g_stop_flag = nullptr;
#ifdef ENABLE_PROFILER
        if (!l_hprof_file.empty())
        {
                HeapProfilerStop();
        }
        if (!l_cprof_file.empty())
        {
                ProfilerStop();
        }
#endif
        bool l_collect = (l_conf.m_failure_policy == ns_hlat::orchestrator::FAILURE_POLICY_COLLECT_ERRORS);
        if (l_s != HLAT_STATUS_OK)
        {
                fprintf(stderr, "Error: %s: %s\n",
                        ns_hlat::hlat_err_str(l_orchestrator->get_err()),
                        l_orchestrator->get_err_msg().c_str());
                if (l_collect &&
                   (l_orchestrator->get_err() == ns_hlat::HLAT_ERR_ALL_PROBES_FAILED))
                {
                        fprintf(stderr, "Error: %s",
                                ns_hlat::report_samples_line(l_results.get_size(),
                                                             l_results.get_num_failures()).c_str());
                }
                l_exit = HLAT_STATUS_ERROR;
                goto cleanup;
        }
        // -------------------------------------------------
        // summarize and report
        // -------------------------------------------------
        {
        ns_hlat::phase_t l_summary;
        ns_hlat::hlat_err_t l_err = ns_hlat::HLAT_ERR_NONE;
        l_s = ns_hlat::summarize(l_results, l_summary, &l_err);
        if (l_s != HLAT_STATUS_OK)
        {
                fprintf(stderr, "Error: %s\n", ns_hlat::hlat_err_str(l_err));
                l_exit = HLAT_STATUS_ERROR;
                goto cleanup;
        }
        std::string l_report;
        if (l_display_results_json_flag)
        {
                l_s = ns_hlat::report_json(l_summary,
                                           l_results.get_size(),
                                           l_results.get_num_failures(),
                                           l_report);
        }
        else
        {
                l_s = ns_hlat::report_text(l_summary, l_report);
                if (l_collect)
                {
                        l_report += ns_hlat::report_samples_line(l_results.get_size(),
                                                                 l_results.get_num_failures());
                }
        }
        if (l_s != HLAT_STATUS_OK)
        {
                fprintf(stderr, "Error: rendering report\n");
                l_exit = HLAT_STATUS_ERROR;
                goto cleanup;
        }
        fprintf(l_out_file, "%s", l_report.c_str());
        fflush(l_out_file);
        }
cleanup:
        // -------------------------------------------------
        // cleanup
        // -------------------------------------------------
        if (l_orchestrator)
        {
                delete l_orchestrator;
                l_orchestrator = nullptr;
        }
        if (l_out_file &&
           (l_out_file != stdout))
        {
                fclose(l_out_file);
                ns_hlat::g_trc_out_file = stdout;
        }
        ns_hlat::trc_log_file_close();
        ns_hlat::tls_cleanup();
        return l_exit;
}
