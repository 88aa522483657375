// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "bpf_stack_table.hpp"

#include "beeprof_cpumask.hpp"
#include "beeres.hpp"
#include "perf.hpp"

#include <bpf/bpf.h>
#include <bpf/libbpf.h>

#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <linux/perf_event.h>
#include <unistd.h>

namespace beeprof {

namespace {

int libbpf_print_fn(enum libbpf_print_level level, const char *format,
                    va_list args) {
  int const lvl = level == LIBBPF_WARN ? LL_WARNING : LL_DEBUG;
  if (!LOG_is_logging_enabled_for_level(lvl)) {
    return 0;
  }
  // libbpf messages carry their own newline
  char buf[1024];
  int const len = vsnprintf(buf, sizeof(buf), format, args);
  if (len > 0 && static_cast<size_t>(len) < sizeof(buf) &&
      buf[len - 1] == '\n') {
    buf[len - 1] = '\0';
  }
  lprintfln(lvl, -1, "libbpf", "%s", buf);
  return 0;
}

// Kernel internal ENOTSUPP, leaks to user space from batch operations
constexpr int k_kernel_enotsupp = 524;

bpf_map *find_map(bpf_object *obj, const char *name) {
  bpf_map *map = bpf_object__find_map_by_name(obj, name);
  if (!map) {
    LG_ERR("Map %s not found in probe object", name);
  }
  return map;
}

} // namespace

BeeRes BpfStackTable::create(const BpfProbeOptions &options,
                             std::unique_ptr<BpfStackTable> &table) {
  std::unique_ptr<BpfStackTable> created{new BpfStackTable()};
  BEERES_CHECK_FWD(created->open_and_load(options));
  BEERES_CHECK_FWD(created->write_config(options));
  BEERES_CHECK_FWD(created->attach_sampling(options));
  if (options.exit_notifications) {
    BeeRes const res = created->attach_exit_notifications();
    if (IsBeeResNotOK(res)) {
      LG_WRN("Process exit notifications unavailable, relying on idle "
             "timeout eviction");
    }
  }
  table = std::move(created);
  return {};
}

BpfStackTable::~BpfStackTable() { detach(); }

void BpfStackTable::detach() {
  for (bpf_link *link : _links) {
    bpf_link__destroy(link);
  }
  _links.clear();
  if (_exit_link) {
    bpf_link__destroy(_exit_link);
    _exit_link = nullptr;
  }
  if (_exit_rb) {
    ring_buffer__free(_exit_rb);
    _exit_rb = nullptr;
  }
  if (_obj) {
    bpf_object__close(_obj);
    _obj = nullptr;
  }
}

BeeRes BpfStackTable::open_and_load(const BpfProbeOptions &options) {
  // negative errno returns and NULL on error, whatever the libbpf version
  libbpf_set_strict_mode(LIBBPF_STRICT_ALL);
  libbpf_set_print(libbpf_print_fn);

  _obj = bpf_object__open_file(options.object_path.c_str(), nullptr);
  long const open_err = libbpf_get_error(_obj);
  if (open_err) {
    _obj = nullptr;
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_OPEN,
                            "Unable to open probe object %s: %s",
                            options.object_path.c_str(),
                            strerror(static_cast<int>(-open_err)));
  }

  bpf_map *counts = find_map(_obj, BEEPROF_MAP_COUNTS);
  bpf_map *stacks = find_map(_obj, BEEPROF_MAP_STACKS);
  bpf_map *config = find_map(_obj, BEEPROF_MAP_CONFIG);
  bpf_map *dropped = find_map(_obj, BEEPROF_MAP_DROPPED);
  if (!counts || !stacks || !config || !dropped) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_OPEN, "Incompatible probe object %s",
                            options.object_path.c_str());
  }

  BEERES_CHECK_NEG_ERRNO(bpf_map__set_max_entries(counts, options.counts_size),
                         BEE_WHAT_BPF_OPEN, "Unable to size counts table");
  BEERES_CHECK_NEG_ERRNO(bpf_map__set_max_entries(stacks, options.stacks_size),
                         BEE_WHAT_BPF_OPEN, "Unable to size stack table");

  if (!options.exit_notifications) {
    bpf_program *exit_prog =
        bpf_object__find_program_by_name(_obj, BEEPROF_PROG_EXIT);
    if (exit_prog) {
      bpf_program__set_autoload(exit_prog, false);
    }
  }

  BEERES_CHECK_NEG_ERRNO(bpf_object__load(_obj), BEE_WHAT_BPF_LOAD,
                         "Unable to load probe %s (missing privileges?)",
                         options.object_path.c_str());

  _counts_fd = bpf_map__fd(counts);
  _stacks_fd = bpf_map__fd(stacks);
  _dropped_fd = bpf_map__fd(dropped);
  _counts_size = options.counts_size;
  _nb_possible_cpus = libbpf_num_possible_cpus();
  if (_nb_possible_cpus <= 0) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_LOAD,
                            "Unable to retrieve number of possible cpus");
  }
  detect_batch_support();
  LG_NTC("Loaded probe %s", options.object_path.c_str());
  return {};
}

void BpfStackTable::detect_batch_support() {
  // the counts table is still empty: a supported lookup reports ENOENT
  beeprof_stack_key key = {};
  uint64_t value = 0;
  uint32_t out_batch = 0;
  uint32_t nb = 1;
  bpf_map_batch_opts opts = {};
  opts.sz = sizeof(opts);
  int const err = bpf_map_lookup_batch(_counts_fd, nullptr, &out_batch, &key,
                                       &value, &nb, &opts);
  _batch_supported = !(err == -EINVAL || err == -EOPNOTSUPP ||
                       err == -k_kernel_enotsupp);
  if (!_batch_supported) {
    // lookup then delete would lose the increments made in between
    LG_NTC("Batch map operations unsupported, counts are read without "
           "clearing");
  }
}

BeeRes BpfStackTable::write_config(const BpfProbeOptions &options) {
  bpf_map *config = find_map(_obj, BEEPROF_MAP_CONFIG);
  if (!config) {
    return beeres_error(BEE_WHAT_BPF_MAP);
  }
  beeprof_probe_config cfg = {};
  cfg.stack_mode = options.stack_mode;
  cfg.target_kind = options.target_kind;
  cfg.target_pid = options.target_pid;
  cfg.target_cgroup_id = options.target_cgroup_id;
  cfg.self_pid = getpid();

  uint32_t const zero = 0;
  BEERES_CHECK_NEG_ERRNO(
      bpf_map_update_elem(bpf_map__fd(config), &zero, &cfg, BPF_ANY),
      BEE_WHAT_BPF_MAP, "Unable to write probe configuration");
  return {};
}

BeeRes BpfStackTable::attach_sampling(const BpfProbeOptions &options) {
  bpf_program *prog =
      bpf_object__find_program_by_name(_obj, BEEPROF_PROG_SAMPLE);
  if (!prog) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_ATTACH, "Program %s not found",
                            BEEPROF_PROG_SAMPLE);
  }

  std::vector<int> cpus;
  BEERES_CHECK_FWD(online_cpus(cpus));

  perf_event_attr attr = perf_config_cpu_clock(options.frequency);
  for (int const cpu : cpus) {
    UniqueFd perf_fd{
        perf_event_open(&attr, -1, cpu, -1, PERF_FLAG_FD_CLOEXEC)};
    if (!perf_fd) {
      if (errno == ENODEV) {
        // cpu went offline since the list was read
        LG_DBG("Skipping offline cpu %d", cpu);
        continue;
      }
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_PERFOPEN,
                              "Unable to open %s cpu-clock event on cpu %d: %s",
                              perf_type_str(attr.type), cpu, strerror(errno));
    }
    bpf_link *link = bpf_program__attach_perf_event(prog, perf_fd.get());
    long const link_err = libbpf_get_error(link);
    if (link_err) {
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_ATTACH,
                              "Unable to attach probe on cpu %d: %s", cpu,
                              strerror(static_cast<int>(-link_err)));
    }
    // the link now owns the perf event
    (void)perf_fd.release();
    _links.push_back(link);
  }
  if (_links.empty()) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_ATTACH, "No cpu could be sampled");
  }
  LG_NTC("Sampling at %d Hz on %zu cpus", options.frequency, _links.size());
  return {};
}

BeeRes BpfStackTable::attach_exit_notifications() {
  bpf_program *prog = bpf_object__find_program_by_name(_obj, BEEPROF_PROG_EXIT);
  bpf_map *exits = bpf_object__find_map_by_name(_obj, BEEPROF_MAP_EXITS);
  if (!prog || !exits) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BPF_ATTACH,
                           "Probe object has no exit notification source");
  }
  bpf_link *link = bpf_program__attach(prog);
  long const link_err = libbpf_get_error(link);
  if (link_err) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BPF_ATTACH,
                           "Unable to attach exit tracepoint: %s",
                           strerror(static_cast<int>(-link_err)));
  }
  _exit_link = link;
  _exit_rb = ring_buffer__new(bpf_map__fd(exits), &handle_exit_event, this,
                              nullptr);
  if (!_exit_rb) {
    bpf_link__destroy(_exit_link);
    _exit_link = nullptr;
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BPF_MAP,
                           "Unable to create exit ring buffer");
  }
  return {};
}

int BpfStackTable::handle_exit_event(void *ctx, void *data, size_t size) {
  if (size < sizeof(beeprof_exit_event)) {
    return 0;
  }
  auto *self = static_cast<BpfStackTable *>(ctx);
  const auto *event = static_cast<const beeprof_exit_event *>(data);
  self->_pending_exits.push_back(event->pid);
  return 0;
}

BeeRes BpfStackTable::read_counts(bool clear,
                                  std::vector<SampleCount> &counts) {
  counts.clear();
  if (_batch_supported) {
    return read_counts_batch(clear, counts);
  }
  if (clear) {
    BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_MAP,
                            "Clearing reads need batch map operations");
  }
  return read_counts_iter(counts);
}

BeeRes BpfStackTable::read_counts_batch(bool clear,
                                        std::vector<SampleCount> &counts) {
  std::vector<beeprof_stack_key> keys(_counts_size);
  std::vector<uint64_t> values(_counts_size);
  uint32_t in_batch = 0;
  uint32_t out_batch = 0;
  bool first = true;

  bpf_map_batch_opts opts = {};
  opts.sz = sizeof(opts);
  while (true) {
    uint32_t nb = _counts_size;
    int const err = clear
        ? bpf_map_lookup_and_delete_batch(_counts_fd,
                                          first ? nullptr : &in_batch,
                                          &out_batch, keys.data(),
                                          values.data(), &nb, &opts)
        : bpf_map_lookup_batch(_counts_fd, first ? nullptr : &in_batch,
                               &out_batch, keys.data(), values.data(), &nb,
                               &opts);
    if (err < 0 && err != -ENOENT) {
      // entries of the previous batches are kept in `counts`
      BEERES_RETURN_ERROR_LOG(BEE_WHAT_BPF_MAP,
                              "Unable to read counts table: %s",
                              strerror(-err));
    }
    for (uint32_t i = 0; i < nb; ++i) {
      counts.push_back({RawStackKey::from_kernel(keys[i]), values[i]});
    }
    if (err == -ENOENT) {
      break;
    }
    in_batch = out_batch;
    first = false;
  }
  return {};
}

BeeRes BpfStackTable::read_counts_iter(std::vector<SampleCount> &counts) {
  std::vector<beeprof_stack_key> keys;
  beeprof_stack_key key = {};
  beeprof_stack_key next_key = {};
  const void *prev = nullptr;
  while (bpf_map_get_next_key(_counts_fd, prev, &next_key) == 0) {
    keys.push_back(next_key);
    key = next_key;
    prev = &key;
  }
  for (const auto &k : keys) {
    uint64_t value = 0;
    // removed since the key walk
    if (bpf_map_lookup_elem(_counts_fd, &k, &value) != 0) {
      continue;
    }
    counts.push_back({RawStackKey::from_kernel(k), value});
  }
  return {};
}

BeeRes BpfStackTable::read_frames(StackId_t id, std::vector<uint64_t> &frames) {
  frames.clear();
  if (id < 0) {
    return beeres_warn(BEE_WHAT_STACK_UNAVAILABLE);
  }
  uint64_t ips[kMaxStackDepth] = {};
  if (bpf_map_lookup_elem(_stacks_fd, &id, ips) != 0) {
    LG_DBG("Stack id %d not found (%s)", id, strerror(errno));
    return beeres_warn(BEE_WHAT_STACK_UNAVAILABLE);
  }
  for (uint64_t const ip : ips) {
    if (!ip) {
      break;
    }
    frames.push_back(ip);
  }
  return {};
}

BeeRes BpfStackTable::release_stacks(std::span<const StackId_t> ids) {
  for (StackId_t const id : ids) {
    if (id >= 0 && bpf_map_delete_elem(_stacks_fd, &id) != 0 &&
        errno != ENOENT) {
      BEERES_RETURN_WARN_LOG(BEE_WHAT_BPF_MAP,
                             "Unable to release stack id %d: %s", id,
                             strerror(errno));
    }
  }
  return {};
}

BeeRes BpfStackTable::dropped_samples(uint64_t &total) {
  std::vector<uint64_t> per_cpu(_nb_possible_cpus);
  uint32_t const zero = 0;
  BEERES_CHECK_NEG_ERRNO(
      bpf_map_lookup_elem(_dropped_fd, &zero, per_cpu.data()),
      BEE_WHAT_BPF_MAP, "Unable to read drop counter");
  total = 0;
  for (uint64_t const v : per_cpu) {
    total += v;
  }
  return {};
}

BeeRes BpfStackTable::poll_exited_pids(std::vector<uint32_t> &pids) {
  if (!_exit_rb) {
    return {};
  }
  int const res = ring_buffer__consume(_exit_rb);
  if (res < 0) {
    BEERES_RETURN_WARN_LOG(BEE_WHAT_BPF_MAP,
                           "Unable to consume exit notifications: %s",
                           strerror(-res));
  }
  pids.insert(pids.end(), _pending_exits.begin(), _pending_exits.end());
  _pending_exits.clear();
  return {};
}

} // namespace beeprof
