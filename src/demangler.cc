// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "demangler.hpp"

#include <array>
#include <cstdlib>
#include <utility>

#include <llvm/Demangle/Demangle.h>

namespace beeprof {

namespace {
constexpr std::string_view k_hash_prefix = "::h";
constexpr size_t k_hash_len = 16;
constexpr size_t k_hash_suffix_len = k_hash_prefix.size() + k_hash_len;
// "$u7e$" style escapes
constexpr size_t k_unicode_escape_len = 5;

constexpr auto k_rust_escapes =
    std::to_array<std::pair<std::string_view, std::string_view>>({
        {"..", "::"},
        {"$C$", ","},
        {"$BP$", "*"},
        {"$GT$", ">"},
        {"$LT$", "<"},
        {"$LP$", "("},
        {"$RP$", ")"},
        {"$RF$", "&"},
        {"$SP$", "@"},
    });

bool is_lower_hex(char c) { return (c >= 'a' && c <= 'f') || (c >= '0' && c <= '9'); }

int hex_value(char c) {
  constexpr int k_a_hex_value = 0xa;
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + k_a_hex_value;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + k_a_hex_value;
  }
  return -1;
}

bool ends_with_rust_hash(std::string_view str) {
  if (str.size() <= k_hash_suffix_len) {
    return false;
  }
  if (str.substr(str.size() - k_hash_suffix_len, k_hash_prefix.size()) !=
      k_hash_prefix) {
    return false;
  }
  for (char const c : str.substr(str.size() - k_hash_len)) {
    if (!is_lower_hex(c)) {
      return false;
    }
  }
  return true;
}

// Rebuilds a legacy Rust path, dropping the trailing hash
std::string rust_legacy_demangle(std::string_view str) {
  std::string_view body = str.substr(0, str.size() - k_hash_suffix_len);
  // C++ demangling leaves a leading '_' before an escaped first segment
  if (body.starts_with("_$")) {
    body.remove_prefix(1);
  }

  std::string ret;
  ret.reserve(body.size());
  size_t i = 0;
  while (i < body.size()) {
    char const c = body[i];
    if (c != '.' && c != '$') {
      ret += c;
      ++i;
      continue;
    }
    bool replaced = false;
    for (const auto &[pattern, replacement] : k_rust_escapes) {
      if (body.substr(i).starts_with(pattern)) {
        ret += replacement;
        i += pattern.size();
        replaced = true;
        break;
      }
    }
    if (replaced) {
      continue;
    }
    if (c == '.') {
      ret += '-';
      ++i;
    } else if (body.substr(i).starts_with("$u") &&
               i + k_unicode_escape_len <= body.size() &&
               body[i + k_unicode_escape_len - 1] == '$') {
      constexpr int hexa_base = 16;
      int const hi = hex_value(body[i + 2]);
      int const lo = hex_value(body[i + 3]);
      if (hi != -1 && lo != -1) {
        ret += static_cast<char>(lo + (hexa_base * hi));
      } else {
        ret += body.substr(i, k_unicode_escape_len);
      }
      i += k_unicode_escape_len;
    } else {
      ret += c;
      ++i;
    }
  }
  return ret;
}
} // namespace

// Minimal check, '$' handling is not strict
bool is_probably_rust_legacy(std::string_view str) {
  if (!ends_with_rust_hash(str)) {
    return false;
  }
  std::string_view const body = str.substr(0, str.size() - k_hash_suffix_len);
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '$') {
      // Throw out `$$` and `$????$`, but not in-between
      std::string_view const rest = body.substr(i);
      if (rest.size() > 1 && rest[1] == '$') {
        return false;
      }
      return (rest.size() > 2 && rest[2] == '$') ||
          (rest.size() > 3 && rest[3] == '$') ||
          (rest.size() > 4 && rest[4] == '$');
    }
    if (body[i] == '.') {
      // '.' and '..' are fine, '...' is not
      return !body.substr(i).starts_with("...");
    }
  }
  return true;
}

// If it quacks like Rust, treat it like Rust
std::string demangle(std::string_view mangled) {
  std::string const mangled_str{mangled};
  if (mangled.starts_with("_R")) {
    // Rust v0 mangling
    int status = 0;
    char *res = llvm::rustDemangle(mangled_str.c_str(), nullptr, nullptr,
                                   &status);
    if (res) {
      std::string demangled{res};
      std::free(res);
      return demangled;
    }
  }
  std::string demangled = llvm::demangle(mangled_str);
  if (is_probably_rust_legacy(demangled)) {
    return rust_legacy_demangle(demangled);
  }
  return demangled;
}

} // namespace beeprof
