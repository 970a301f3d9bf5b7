#include "sandbox.h"

#include <unistd.h>
#include <sys/stat.h>
#include <sys/mount.h>

#include <nlohmann/json.hpp>

// CBOR keeps the helper protocol independent of struct layout
SandboxOptions::SandboxOptions(const std::vector<uint8_t>& serial) : SandboxOptions() {
  const auto obj = nlohmann::json::from_cbor(serial);
  obj.at("box").get_to(boxdir);
  obj.at("cmd").get_to(command);
  obj.at("keep_env").get_to(preserve_env);
  obj.at("env").get_to(envs);
  obj.at("cwd").get_to(workdir);
  obj.at("in").get_to(input);
  obj.at("out").get_to(output);
  obj.at("err").get_to(error);
  obj.at("cpus").get_to(cpu_set);
  obj.at("uid").get_to(uid);
  obj.at("gid").get_to(gid);
  const auto& lim = obj.at("lim");
  lim.at("wall").get_to(wall_time);
  lim.at("cpu").get_to(cpu_time);
  lim.at("rss").get_to(rss);
  lim.at("vss").get_to(vss);
  lim.at("proc").get_to(proc_num);
  lim.at("nofile").get_to(file_num);
  lim.at("fsize").get_to(fsize);
  obj.at("mounts").get_to(dirs);
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  nlohmann::json obj = {
    {"box", boxdir},
    {"cmd", command},
    {"keep_env", preserve_env},
    {"env", envs},
    {"cwd", workdir},
    {"in", input},
    {"out", output},
    {"err", error},
    {"cpus", cpu_set},
    {"uid", uid},
    {"gid", gid},
    {"lim", {
      {"wall", wall_time},
      {"cpu", cpu_time},
      {"rss", rss},
      {"vss", vss},
      {"proc", proc_num},
      {"nofile", file_num},
      {"fsize", fsize},
    }},
    {"mounts", dirs},
  };
  return nlohmann::json::to_cbor(obj);
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> filtered;
  for (auto& i : dirs) {
    struct stat st;
    if (lstat(i.c_str(), &st) < 0 || !S_ISDIR(st.st_mode)) continue;
    filtered.push_back(std::move(i));
  }
  dirs = std::move(filtered);
}

void ToCJailCtx(const SandboxOptions& opt, CJailCtxClass& ret) {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (!opt.input.empty()) ctx.redir_input = opt.input.data();
  if (!opt.output.empty()) ctx.redir_output = opt.output.data();
  if (!opt.error.empty()) ctx.redir_error = opt.error.data();
  for (auto& i : opt.command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  if (opt.preserve_env) {
    ctx.environ = environ;
  } else {
    for (auto& i : opt.envs) ret.env_buf_.emplace_back(i.data());
    ret.env_buf_.push_back(nullptr);
    ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  }
  ctx.chroot = opt.boxdir.data();
  ctx.working_dir = opt.workdir.data();
  // default: cgroup_root
  if (opt.cpu_set.empty()) {
    ctx.cpuset = nullptr;
  } else {
    CPU_ZERO(&ret.cpu_set_);
    for (auto& i : opt.cpu_set) CPU_SET(i, &ret.cpu_set_);
    ctx.cpuset = &ret.cpu_set_;
  }
  ctx.uid = opt.uid;
  ctx.gid = opt.gid;
  ctx.rlim_as = opt.vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = opt.file_num;
  ctx.rlim_fsize = opt.fsize;
  ctx.rlim_proc = opt.proc_num;
  // default: rlim_stack (no limit)
  ctx.cg_rss = opt.rss;
  ctx.lim_time.tv_sec = opt.wall_time / 1'000'000;
  ctx.lim_time.tv_usec = opt.wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = opt.cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = opt.cpu_time % 1'000'000;
  // default: cputime_poll_interval
  // default: seccomp_cfg
  // bind mounts
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(opt.dirs.size());
  ret.mnt_buf_.reserve(opt.dirs.size());
  for (auto& i : opt.dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = MS_RDONLY;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}

namespace {

inline long ToUs(const struct timeval& v) {
  return (long)v.tv_sec * 1'000'000 + v.tv_usec;
}

} // namespace

SandboxResult FromCJailResult(const struct cjail_result& res) {
  SandboxResult ret;
  ret.timekill = res.timekill > 0;
  // oomkill = -1 means failed to read oom (see cjail/cjail.h)
  ret.oomkill = res.oomkill > 0;
  ret.si_code = res.info.si_code;
  ret.status = res.info.si_status;
  ret.wall_us = ToUs(res.time);
  ret.user_us = ToUs(res.rus.ru_utime);
  ret.sys_us = ToUs(res.rus.ru_stime);
  ret.max_rss_kib = res.rus.ru_maxrss;
  ret.max_vss_kib = res.stats.hiwater_vm;
  return ret;
}
