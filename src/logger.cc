// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include "ratelimiter.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#ifndef LOG_MSG_CAP
#  define LOG_MSG_CAP 4096
#endif

namespace beeprof {

namespace {

struct LoggerContext {
  int fd{-1};
  int mode{LOG_STDERR};
  int level{LL_ERROR};
  int facility{LF_USER};
  std::string name;
  std::optional<IntervalRateLimiter> rate_limiter;
};

LoggerContext log_ctx{.fd = STDERR_FILENO, .mode = LOG_STDERR, .level = LL_ERROR};

constexpr const char *k_level_names[LL_LENGTH] = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};
} // namespace

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    log_ctx.level = lvl;
  }
}

int LOG_getlevel() { return log_ctx.level; }

void LOG_setfacility(int fac) {
  if (fac >= LF_KERNEL && fac <= LF_LOCAL7) {
    log_ctx.facility = fac;
  }
}

void LOG_setname(const char *name) { log_ctx.name = name; }

bool LOG_syslog_open() {
  const sockaddr_un sa = {AF_UNIX, "/dev/log"};
  int const fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);

  if (0 > fd) {
    return false;
  }
  if (0 >
      connect(fd, reinterpret_cast<const struct sockaddr *>(&sa), sizeof(sa))) {
    close(fd);
    return false;
  }

  log_ctx.fd = fd;
  return true;
}

void LOG_close() {
  if (LOG_SYSLOG == log_ctx.mode || LOG_FILE == log_ctx.mode) {
    close(log_ctx.fd);
  }
  log_ctx.fd = -1;
}

bool LOG_open(int mode, const char *opts) {
  if (log_ctx.fd >= 0) {
    LOG_close();
  }

  log_ctx.mode = mode;

  switch (mode) {
  case LOG_DISABLE:
    log_ctx.fd = -1;
    break;
  case LOG_SYSLOG:
    if (!LOG_syslog_open()) {
      return false;
    }
    break;
  default:
  case LOG_STDOUT:
    log_ctx.fd = STDOUT_FILENO;
    break;
  case LOG_STDERR:
    log_ctx.fd = STDERR_FILENO;
    break;
  case LOG_FILE: {
    int const fd = open(opts, O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);

    if (-1 == fd) {
      return false;
    }
    log_ctx.fd = fd;
    break;
  }
  }
  return true;
}

void LOG_setratelimit(uint64_t max_log_per_interval,
                      std::chrono::nanoseconds interval) {
  log_ctx.rate_limiter.emplace(max_log_per_interval, interval);
}

// The message is formatted into a stack buffer of LOG_MSG_CAP bytes, header
// included: `<LEVEL>MMM DD hh:mm:ss.uuuuuu NAME[PID]: `
void vlprintfln(int lvl, int fac, const char *name, const char *format,
                va_list args) {
  char buf[LOG_MSG_CAP];
  ssize_t sz = -1;
  ssize_t sz_h = -1;
  ssize_t rc = 0;

  // Special value handling
  if (lvl == -1) {
    lvl = log_ctx.level;
  }
  if (fac == -1) {
    fac = log_ctx.facility;
  }
  if (!log_ctx.name.empty()) {
    name = log_ctx.name.c_str();
  }

  if (log_ctx.fd < 0 || !format) {
    return;
  }

  char tm_str[sizeof("mmm dd HH:MM:SS0")];
  auto d = std::chrono::system_clock::now().time_since_epoch();
  auto d_s = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto d_us = std::chrono::duration_cast<std::chrono::microseconds>(d - d_s);

  time_t const t = d_s.count();
  struct tm lt;
  localtime_r(&t, &lt);
  (void)strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt);

  pid_t const pid = getpid();

  if (log_ctx.mode == LOG_SYSLOG) {
    sz_h = snprintf(buf, LOG_MSG_CAP,
                    "<%d>%s.%06ld %s[%d]: ", lvl + fac * LL_LENGTH, tm_str,
                    static_cast<long>(d_us.count()), name, pid);
  } else {
    sz_h = snprintf(buf, LOG_MSG_CAP, "<%s>%s.%06ld %s[%d]: ",
                    k_level_names[lvl], tm_str,
                    static_cast<long>(d_us.count()), name, pid);
  }

  // Room for optional newline and \0
  ssize_t const cap = LOG_MSG_CAP - sz_h - 2;
  sz = vsnprintf(&buf[sz_h], cap, format, args);

  if (sz > cap) {
    sz = cap;
  }
  sz += sz_h;

  // Some consumers expect newline-delimited logs.
  if (log_ctx.mode != LOG_SYSLOG) {
    buf[sz] = '\n';
    buf[sz + 1] = '\0';
    sz++;
  }

  do {
    if (log_ctx.mode == LOG_SYSLOG) {
      rc = sendto(log_ctx.fd, buf, sz, MSG_NOSIGNAL, nullptr, 0);
    } else {
      rc = write(log_ctx.fd, buf, sz);
    }
  } while (rc < 0 && errno == EINTR);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, int fac, const char *name, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, fac, name, fmt, args);
  va_end(args);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void lprintfln(int lvl, int fac, const char *name, const char *fmt, ...) {
  if (lvl > log_ctx.level) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, fac, name, fmt, args);
  va_end(args);
}

bool LOG_is_logging_enabled_for_level(int level) {
  return (level <= log_ctx.level) &&
      (!log_ctx.rate_limiter || log_ctx.rate_limiter->check());
}

} // namespace beeprof
