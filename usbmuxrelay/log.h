//
//  log.h
//  usbmuxrelay
//

#ifndef usbmuxrelay_log_h
#define usbmuxrelay_log_h

#include <stdio.h>

/*
 Lower is more severe. A message is written when its level is <= log_level.
 */
enum loglevel {
    LL_FATAL = 0,
    LL_ERROR,
    LL_WARNING, //default
    LL_INFO,
    LL_NOTICE,
    LL_DEBUG
};

extern unsigned int log_level;

//stderr with a timestamp, or syslog once enabled
void log_enable_syslog(void);
void log_disable_syslog(void);
void usbmuxrelay_log(enum loglevel level, const char *fmt, ...) __attribute__ ((format (printf, 2, 3)));

#define fatal(a ...)    usbmuxrelay_log(LL_FATAL,a)
#define error(a ...)    usbmuxrelay_log(LL_ERROR,a)
#define warning(a ...)  usbmuxrelay_log(LL_WARNING,a)
#define info(a ...)     usbmuxrelay_log(LL_INFO,a)
#define notice(a ...)   usbmuxrelay_log(LL_NOTICE,a)

#ifdef DEBUG
#define debug(a ...)    usbmuxrelay_log(LL_DEBUG,a)
#else
#define debug(a ...)
#endif

#endif /* usbmuxrelay_log_h */
