// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeprof_defs.hpp"
#include "beeres_def.hpp"
#include "stack_table.hpp"
#include "unique_fd.hpp"

#include <memory>
#include <string>
#include <vector>

struct bpf_object;
struct bpf_link;
struct bpf_map;
struct ring_buffer;

namespace beeprof {

struct BpfProbeOptions {
  std::string object_path;
  int frequency{kDefaultSamplingFrequency};
  uint32_t stack_mode{BEEPROF_STACK_BOTH};
  uint32_t target_kind{BEEPROF_TARGET_ALL};
  uint32_t target_pid{0};
  uint64_t target_cgroup_id{0};
  uint32_t counts_size{kDefaultCountsTableSize};
  uint32_t stacks_size{kDefaultStackTableSize};
  bool exit_notifications{true};
};

// Loads the sampling probe, attaches it to a cpu-clock event on every online
// CPU and gives access to its tables. Detaches everything on destruction.
class BpfStackTable : public StackTable {
public:
  static BeeRes create(const BpfProbeOptions &options,
                       std::unique_ptr<BpfStackTable> &table);

  ~BpfStackTable() override;

  BpfStackTable(const BpfStackTable &) = delete;
  BpfStackTable &operator=(const BpfStackTable &) = delete;

  BeeRes read_counts(bool clear, std::vector<SampleCount> &counts) override;
  BeeRes read_frames(StackId_t id, std::vector<uint64_t> &frames) override;
  BeeRes release_stacks(std::span<const StackId_t> ids) override;
  BeeRes dropped_samples(uint64_t &total) override;
  BeeRes poll_exited_pids(std::vector<uint32_t> &pids) override;
  // Clearing reads use batch lookup-and-delete, decided when loading
  [[nodiscard]] bool supports_clear() const override {
    return _batch_supported;
  }

  [[nodiscard]] size_t nb_attached_cpus() const { return _links.size(); }

private:
  BpfStackTable() = default;

  BeeRes open_and_load(const BpfProbeOptions &options);
  BeeRes write_config(const BpfProbeOptions &options);
  BeeRes attach_sampling(const BpfProbeOptions &options);
  BeeRes attach_exit_notifications();
  void detach();

  void detect_batch_support();
  BeeRes read_counts_batch(bool clear, std::vector<SampleCount> &counts);
  BeeRes read_counts_iter(std::vector<SampleCount> &counts);

  static int handle_exit_event(void *ctx, void *data, size_t size);

  bpf_object *_obj{nullptr};
  std::vector<bpf_link *> _links;
  bpf_link *_exit_link{nullptr};
  ring_buffer *_exit_rb{nullptr};
  int _counts_fd{-1};
  int _stacks_fd{-1};
  int _dropped_fd{-1};
  uint32_t _counts_size{0};
  int _nb_possible_cpus{0};
  bool _batch_supported{true};
  std::vector<uint32_t> _pending_exits;
};

} // namespace beeprof
