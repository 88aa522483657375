// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"
#include "beeres_helpers.hpp"
#include "beeres_list.hpp"

#include <exception>
#include <new>

namespace beeprof {

/// Standard exception containing a BeeRes
class BeeException : public std::exception {
public:
  explicit BeeException(BeeRes res) : _res(res) {}
  BeeException(int16_t sev, int16_t what) : _res(beeres_create(sev, what)) {}
  [[nodiscard]] BeeRes get_BeeRes() const { return _res; }
  [[nodiscard]] const char *what() const noexcept override {
    return beeres_error_message(_res._what);
  }

private:
  BeeRes _res;
};
} // namespace beeprof

#define BEERES_THROW_EXCEPTION(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    throw beeprof::BeeException(beeres_error(what));                           \
  } while (0)

#define BEERES_CHECK_THROW_EXCEPTION(res)                                      \
  do {                                                                         \
    BeeRes lres = res; /* single eval */                                       \
    if (IsBeeResNotOK(lres)) {                                                 \
      if (IsBeeResFatal(lres)) {                                               \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               beeres_error_message(lres._what));                              \
        throw beeprof::BeeException(lres);                                     \
      } else if (lres._sev == BEE_SEV_WARN) {                                  \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lres._sev, __FILE__,       \
               __LINE__, beeres_error_message(lres._what));                    \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lres._sev, __FILE__,       \
               __LINE__, beeres_error_message(lres._what));                    \
      }                                                                        \
    }                                                                          \
  } while (0)

/// Catch exceptions and convert them to a BeeRes return
#define CatchExcept2BeeRes()                                                   \
  catch (const beeprof::BeeException &e) {                                     \
    BEERES_CHECK_FWD(e.get_BeeRes());                                          \
  }                                                                            \
  catch (const std::bad_alloc &ba) {                                           \
    LOG_ERROR_DETAILS(LG_ERR, BEE_WHAT_BADALLOC);                              \
    return beeres_error(BEE_WHAT_BADALLOC);                                    \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("%s", e.what());                                                    \
    LOG_ERROR_DETAILS(LG_ERR, BEE_WHAT_STDEXCEPT);                             \
    return beeres_error(BEE_WHAT_STDEXCEPT);                                   \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, BEE_WHAT_UKNWEXCEPT);                            \
    return beeres_error(BEE_WHAT_UKNWEXCEPT);                                  \
  }
