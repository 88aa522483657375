// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "build_id.hpp"

#include "defer.hpp"
#include "unique_fd.hpp"

#include <cstring>
#include <fcntl.h>
#include <gelf.h>
#include <libelf.h>
#include <string_view>
#include <unistd.h>

using namespace std::literals;

namespace beeprof {

namespace {

constexpr std::string_view kGoBuildIdNoteName = "Go\0\0"sv;
constexpr std::string_view kGnuBuildIdNoteName = "GNU\0"sv;
const char *kGoBuildIdSection = ".note.go.buildid";
const char *kGnuBuildIdSection = ".note.gnu.build-id";
const Elf64_Word kGoBuildIdTag = 4;

// convert integer to hex digit
inline char int_to_hex_digit(int c) {
  constexpr int k_a_hex_value = 0xa;
  return c < k_a_hex_value ? '0' + c : 'a' + (c - k_a_hex_value);
}

Elf_Scn *find_note_section(Elf *elf, const char *section_name) {
  size_t stridx;
  if (elf_getshdrstrndx(elf, &stridx) != 0) {
    return nullptr;
  }
  Elf_Scn *section = nullptr;
  GElf_Shdr section_header;
  while ((section = elf_nextscn(elf, section)) != nullptr) {
    if (!gelf_getshdr(section, &section_header) ||
        section_header.sh_type != SHT_NOTE) {
      continue;
    }
    const char *name = elf_strptr(elf, stridx, section_header.sh_name);
    if (name && !strcmp(name, section_name)) {
      return section;
    }
  }
  return nullptr;
}

std::span<const std::byte> match_note(Elf_Data *data, Elf64_Word note_type,
                                      std::string_view note_name) {
  size_t pos = 0;
  GElf_Nhdr note_header;
  size_t name_pos;
  size_t desc_pos;
  while ((pos = gelf_getnote(data, pos, &note_header, &name_pos, &desc_pos)) >
         0) {
    const auto *buf = static_cast<const std::byte *>(data->d_buf);
    if (note_header.n_type == note_type &&
        note_header.n_namesz == note_name.size() &&
        !memcmp(buf + name_pos, note_name.data(), note_name.size())) {
      return {buf + desc_pos, note_header.n_descsz};
    }
  }
  return {};
}

std::span<const std::byte> get_elf_note(Elf *elf, const char *section_name,
                                        Elf64_Word note_type,
                                        std::string_view note_name) {
  // section headers first (stripped files can lack them)
  if (Elf_Scn *note_section = find_note_section(elf, section_name)) {
    if (Elf_Data *data = elf_getdata(note_section, nullptr)) {
      auto result = match_note(data, note_type, note_name);
      if (!result.empty()) {
        return result;
      }
    }
  }

  size_t phnum;
  if (elf_getphdrnum(elf, &phnum) != 0) {
    return {};
  }
  for (size_t i = 0; i < phnum; ++i) {
    GElf_Phdr phdr_mem;
    GElf_Phdr *phdr = gelf_getphdr(elf, i, &phdr_mem);
    if (phdr == nullptr || phdr->p_type != PT_NOTE) {
      continue;
    }
    Elf_Data *data =
        elf_getdata_rawchunk(elf, phdr->p_offset, phdr->p_filesz,
                             (phdr->p_align == 8 ? ELF_T_NHDR8 : ELF_T_NHDR));
    if (data) {
      auto result = match_note(data, note_type, note_name);
      if (!result.empty()) {
        return result;
      }
    }
  }
  return {};
}
} // namespace

BuildIdStr format_build_id(BuildIdSpan build_id_span) {
  std::string build_id_str;
  build_id_str.resize(build_id_span.size() * 2);
  constexpr unsigned char hex_digit_bits = 4;
  constexpr unsigned char hex_digit_mask = (1 << hex_digit_bits) - 1;
  for (int i = 0; auto c : build_id_span) {
    build_id_str[i++] = int_to_hex_digit(c >> hex_digit_bits);
    build_id_str[i++] = int_to_hex_digit(c & hex_digit_mask);
  }
  return build_id_str;
}

std::optional<BuildIdStr> find_build_id(Elf *elf) {
  auto note = get_elf_note(elf, kGnuBuildIdSection, NT_GNU_BUILD_ID,
                           kGnuBuildIdNoteName);
  if (!note.empty()) {
    return format_build_id(BuildIdSpan{
        reinterpret_cast<const unsigned char *>(note.data()), note.size()});
  }
  note =
      get_elf_note(elf, kGoBuildIdSection, kGoBuildIdTag, kGoBuildIdNoteName);
  if (!note.empty()) {
    return std::string{reinterpret_cast<const char *>(note.data()),
                       note.size()};
  }
  return std::nullopt;
}

std::optional<BuildIdStr> find_build_id(const char *filepath) {
  const UniqueFd fd_holder{::open(filepath, O_RDONLY | O_CLOEXEC)};
  if (!fd_holder) {
    return std::nullopt;
  }
  elf_version(EV_CURRENT);
  Elf *elf = elf_begin(fd_holder.get(), ELF_C_READ_MMAP, nullptr);
  if (elf == nullptr) {
    return std::nullopt;
  }
  defer { elf_end(elf); };
  return find_build_id(elf);
}

} // namespace beeprof
