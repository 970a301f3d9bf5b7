// sandbox-exec: runs one cjail sandbox
// stdin: size + SandboxOptions::Serialize(); stdout: SandboxResult
#include <errno.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include "sandbox.h"

namespace {

bool ReadAll(int fd, void* buf, size_t sz) {
  for (size_t cur = 0; cur < sz;) {
    ssize_t ret = read(fd, (char*)buf + cur, sz - cur);
    if (ret <= 0) {
      if (ret < 0 && errno == EINTR) continue;
      return false;
    }
    cur += ret;
  }
  return true;
}

SandboxResult SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  ToCJailCtx(opt, ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) return SandboxResult::Error(errno);
  return FromCJailResult(ret);
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  SandboxResult res;
  try {
    res = SandboxExec(SandboxOptions(buf));
  } catch (nlohmann::json::exception&) {
    res = SandboxResult::Error(EINVAL);
  }
  if (write(1, &res, sizeof(res)) != sizeof(res)) return 1;
}
