#ifndef JRUNNER_SANDBOX_H_
#define JRUNNER_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>
#include <jrunner/sandbox.h>

// Owns every buffer a cjail_ctx points into
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend void ToCJailCtx(const SandboxOptions&, CJailCtxClass&);
};

// ctx is invalidated after reassignment/reallocation of any string/vector member of opt
void ToCJailCtx(const SandboxOptions& opt, CJailCtxClass& ctx);
SandboxResult FromCJailResult(const struct cjail_result&);

#endif  // JRUNNER_SANDBOX_H_
