// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_base.hpp"
#include "beeres_def.hpp"
#include "beeres_list.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

namespace beeprof {

/// Pass in place of the variadic arguments to suppress the first log line
#define BEERES_NOLOG NULL

/// Standardized way of formatting error log
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", beeres_error_message(what), __FILE__, __LINE__);

/// Returns a fatal BeeRes while using the LG_ERR API
#define BEERES_RETURN_ERROR_LOG(what, ...)                                     \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return beeres_error(what);                                                 \
  } while (0)

/// Returns a warning BeeRes with the appropriate LG_WRN message
#define BEERES_RETURN_WARN_LOG(what, ...)                                      \
  do {                                                                         \
    LG_WRN(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_WRN, what);                                           \
    return beeres_warn(what);                                                  \
  } while (0)

// Implem notes :
// do while idiom is used to expand in a compound statement

/// Evaluate function and return error if -1 (add an error log)
#define BEERES_CHECK_INT(eval, what, ...)                                      \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      BEERES_RETURN_ERROR_LOG(what, __VA_ARGS__);                              \
    }                                                                          \
  } while (0)

/// Evaluate function and return error if -1 (logs errno)
#define BEERES_CHECK_ERRNO(eval, what, ...)                                    \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      return beeres_error(what);                                               \
    }                                                                          \
  } while (0)

/// Evaluate a libbpf style call (negative errno on failure)
#define BEERES_CHECK_NEG_ERRNO(eval, what, ...)                                \
  do {                                                                         \
    const int lerr = (eval);                                                   \
    if (unlikely(lerr < 0)) {                                                  \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", -lerr, strerror(-lerr));                         \
      return beeres_error(what);                                               \
    }                                                                          \
  } while (0)

/// Check boolean and log
#define BEERES_CHECK_BOOL(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely(!(eval))) {                                                   \
      BEERES_RETURN_ERROR_LOG(what, __VA_ARGS__);                              \
    }                                                                          \
  } while (0)

inline int beeres_sev_to_log_level(int sev) {
  switch (sev) {
  case BEE_SEV_ERROR:
    return LL_ERROR;
  case BEE_SEV_WARN:
    return LL_WARNING;
  case BEE_SEV_NOTICE:
    return LL_DEBUG;
  default: // no log
    return LL_LENGTH;
  }
}

/// Forward any result that is not OK
#define BEERES_CHECK_FWD_STRICT(res)                                           \
  do {                                                                         \
    BeeRes lres = res; /* single eval */                                       \
    if (IsBeeResNotOK(lres)) {                                                 \
      LG_IF_LVL_OK(beeres_sev_to_log_level(lres._sev),                         \
                   "Forward error at %s:%u - %s", __FILE__, __LINE__,          \
                   beeres_error_message(lres._what));                          \
      return lres;                                                             \
    }                                                                          \
  } while (0)

/// Forward result if Fatal
#define BEERES_CHECK_FWD(res)                                                  \
  do {                                                                         \
    BeeRes lres = res; /* single eval */                                       \
    if (IsBeeResNotOK(lres)) {                                                 \
      if (IsBeeResFatal(lres)) {                                               \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               beeres_error_message(lres._what));                              \
        return lres;                                                           \
      }                                                                        \
      if (lres._sev == BEE_SEV_WARN) {                                         \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lres._sev, __FILE__,       \
               __LINE__, beeres_error_message(lres._what));                    \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lres._sev, __FILE__,       \
               __LINE__, beeres_error_message(lres._what));                    \
      }                                                                        \
    }                                                                          \
  } while (0)

/// Evaluate function and return error if the error_code is set
#define BEERES_CHECK_ERRORCODE(eval, what, ...)                                \
  do {                                                                         \
    const std::error_code err = (eval);                                        \
    if (err) {                                                                 \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("error_code(%d): %s", err.value(), err.message().c_str());        \
      return beeres_error(what);                                               \
    }                                                                          \
  } while (0)

} // namespace beeprof
