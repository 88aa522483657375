// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <elfutils/libdw.h>

#include <vector>

namespace beeprof {

struct InlinedScope {
  // linkage name when present, otherwise the plain name
  const char *func_name{};
  // location of the call in the enclosing function
  const char *call_file{};
  int call_line{0};
};

// Inlined subroutines covering cu_addr (address relative to the CU bias),
// innermost first. subprogram_name receives the name of the concrete
// function they are inlined into, when found.
void collect_inlined_scopes(Dwarf_Die *cudie, Dwarf_Addr cu_addr,
                            std::vector<InlinedScope> &scopes,
                            const char **subprogram_name);

// Name of a DIE, following abstract origins and specifications
const char *die_linkage_name(Dwarf_Die *die);

} // namespace beeprof
