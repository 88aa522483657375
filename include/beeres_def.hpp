// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_base.hpp"

#include <cstdint>

// although we keep it in a int16, we only need a uint8 for the enum
enum BEE_RES_SEV : uint8_t {
  BEE_SEV_OK = 0,
  BEE_SEV_NOTICE = 1,
  BEE_SEV_WARN = 2,
  BEE_SEV_ERROR = 3,
};

/// Result structure containing a what / severity
struct BeeRes {
  union {
    struct {
      int16_t _what; // Type of result (see beeres_list.hpp)
      int16_t _sev;  // fatal, warn, OK...
    };
    int32_t _val;
  };
};

#define FillBeeRes(res, sev, what)                                             \
  do {                                                                         \
    (res)._sev = (sev);                                                        \
    (res)._what = (what);                                                      \
  } while (0)

#define InitBeeResOK(res)                                                      \
  do {                                                                         \
    (res)._val = 0;                                                            \
  } while (0)

/// sev, what
inline BeeRes beeres_create(int16_t sev, int16_t what) {
  BeeRes res;
  FillBeeRes(res, sev, what);
  return res;
}

/// Creates a BeeRes taking an error code (what)
inline BeeRes beeres_error(int16_t what) {
  return beeres_create(BEE_SEV_ERROR, what);
}

/// Creates a BeeRes with a warning taking an error code (what)
inline BeeRes beeres_warn(int16_t what) {
  return beeres_create(BEE_SEV_WARN, what);
}

/// Create an OK BeeRes
inline BeeRes beeres_init() {
  BeeRes res = {};
  return res;
}

/// returns a bool : true if they are equal
inline bool beeres_equal(BeeRes lhs, BeeRes rhs) {
  return lhs._val == rhs._val;
}

// Assumption behind these is that SEV_ERROR does not occur often

/// true if res is not OK (unlikely)
#define IsBeeResNotOK(res) unlikely((res)._sev != BEE_SEV_OK)

/// true if res is OK (likely)
#define IsBeeResOK(res) likely((res)._sev == BEE_SEV_OK)

/// true if res is fatal (unlikely)
#define IsBeeResFatal(res) unlikely((res)._sev == BEE_SEV_ERROR)

inline bool operator==(BeeRes lhs, BeeRes rhs) {
  return beeres_equal(lhs, rhs);
}
