// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "dwarf_helpers.hpp"

#include "defer.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <dwarf.h>

namespace beeprof {

const char *die_linkage_name(Dwarf_Die *die) {
  Dwarf_Attribute attr;
  const char *name = dwarf_formstring(
      dwarf_attr_integrate(die, DW_AT_linkage_name, &attr));
  if (!name) {
    name = dwarf_formstring(
        dwarf_attr_integrate(die, DW_AT_MIPS_linkage_name, &attr));
  }
  if (!name) {
    name = dwarf_formstring(dwarf_attr_integrate(die, DW_AT_name, &attr));
  }
  return name;
}

void collect_inlined_scopes(Dwarf_Die *cudie, Dwarf_Addr cu_addr,
                            std::vector<InlinedScope> &scopes,
                            const char **subprogram_name) {
  scopes.clear();
  *subprogram_name = nullptr;

  Dwarf_Die *dies = nullptr;
  int const nb_dies = dwarf_getscopes(cudie, cu_addr, &dies);
  if (nb_dies <= 0) {
    return;
  }
  defer { free(dies); };

  Dwarf_Files *files = nullptr;
  if (dwarf_getsrcfiles(cudie, &files, nullptr) != 0) {
    files = nullptr;
  }

  for (int i = 0; i < nb_dies; ++i) {
    Dwarf_Die *scope = &dies[i];
    int const tag = dwarf_tag(scope);
    if (tag == DW_TAG_subprogram) {
      *subprogram_name = die_linkage_name(scope);
      break;
    }
    if (tag != DW_TAG_inlined_subroutine) {
      // lexical blocks
      continue;
    }
    InlinedScope inlined;
    inlined.func_name = die_linkage_name(scope);
    Dwarf_Attribute attr;
    Dwarf_Word val = 0;
    if (files &&
        dwarf_formudata(dwarf_attr(scope, DW_AT_call_file, &attr), &val) ==
            0) {
      inlined.call_file = dwarf_filesrc(files, val, nullptr, nullptr);
    }
    if (dwarf_formudata(dwarf_attr(scope, DW_AT_call_line, &attr), &val) ==
        0) {
      inlined.call_line = static_cast<int>(val);
    }
    scopes.push_back(inlined);
  }
  LG_DBG("[DWARF] %zu inlined scopes at %lx", scopes.size(), cu_addr);
}

} // namespace beeprof
