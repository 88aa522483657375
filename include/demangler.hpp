// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace beeprof {

// C++ (Itanium), Rust v0 and Rust legacy names. Unknown input is returned
// unchanged.
std::string demangle(std::string_view mangled);

// Legacy Rust names end with "::h" followed by 16 hex digits
bool is_probably_rust_legacy(std::string_view str);

} // namespace beeprof
