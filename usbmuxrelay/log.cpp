//
//  log.cpp
//  usbmuxrelay
//

#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include <syslog.h>
#include <mutex>
#include "log.h"

unsigned int log_level = LL_WARNING;

static bool log_syslog = false;
static std::mutex log_lock;

static const char *log_prefix[] = {
    "FATAL",
    "ERROR",
    "WARNING",
    "INFO",
    "NOTICE",
    "DEBUG"
};

static int level_to_syslog_level(enum loglevel level){
    switch (level) {
        case LL_FATAL:   return LOG_CRIT;
        case LL_ERROR:   return LOG_ERR;
        case LL_WARNING: return LOG_WARNING;
        case LL_NOTICE:  return LOG_NOTICE;
        case LL_INFO:    return LOG_INFO;
        default:         return LOG_DEBUG;
    }
}

void log_enable_syslog(void){
    if (!log_syslog) {
        openlog("usbmuxrelay", LOG_PID, 0);
        log_syslog = true;
    }
}

void log_disable_syslog(void){
    if (log_syslog) {
        closelog();
        log_syslog = false;
    }
}

void usbmuxrelay_log(enum loglevel level, const char *fmt, ...){
    va_list ap;
    char *msg = NULL;

    if (level > log_level)
        return;

    va_start(ap, fmt);
    if (vasprintf(&msg, fmt, ap) == -1) msg = NULL;
    va_end(ap);
    if (!msg) return;

    if (log_syslog) {
        syslog(level_to_syslog_level(level), "[%s] %s", log_prefix[level], msg);
    } else {
        struct timeval ts = {};
        struct tm tp = {};
        char tstr[16] = {};
        gettimeofday(&ts, NULL);
        localtime_r(&ts.tv_sec, &tp);
        strftime(tstr, sizeof(tstr), "%H:%M:%S", &tp);
        std::unique_lock<std::mutex> ul(log_lock);
        fprintf(stderr, "[%s.%03d][%s] %s\n", tstr, (int)(ts.tv_usec / 1000), log_prefix[level], msg);
        fflush(stderr);
    }
    free(msg);
}
