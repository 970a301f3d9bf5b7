#include "job_request.h"

#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

#include <zstd.h>
#include <jrunner/paths.h>
#include <jrunner/toolchain.h>
#include <jrunner/utils.h>

namespace {

unsigned char Base64CharToValue(const unsigned char chr) {
  if      (chr >= 'A' && chr <= 'Z') return chr - 'A';
  else if (chr >= 'a' && chr <= 'z') return chr - 'a' + ('Z' - 'A')               + 1;
  else if (chr >= '0' && chr <= '9') return chr - '0' + ('Z' - 'A') + ('z' - 'a') + 2;
  else if (chr == '+' || chr == '-') return 62;
  else if (chr == '/' || chr == '_') return 63;
  throw RequestError("Invalid base64 character");
}

std::string DecodeBase64(const std::string& str) {
  std::ostringstream out;
  OutputBase64(out, str);
  return out.str();
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  if (!fout) throw std::runtime_error("Cannot write " + path.string());
  fout << content;
}

std::string ReadSource(const nlohmann::json& obj) {
  if (obj.contains("source_base64")) return DecodeBase64(obj["source_base64"].get<std::string>());
  return obj.at("source").get<std::string>();
}

// ms in the request, us in Limits
int64_t ParseMilliseconds(const nlohmann::json& obj, const char* key) {
  int64_t ms = obj.value(key, (int64_t)0);
  if (ms < 0) throw RequestError("Negative limit");
  if (ms > std::numeric_limits<int64_t>::max() / 1000) {
    throw RequestError(std::string("Limit out of range: ") + key);
  }
  return ms * 1000;
}

Limits ParseLimits(const nlohmann::json& obj) {
  Limits lim;
  lim.cpu_time = ParseMilliseconds(obj, "cpu_time_ms");
  lim.wall_time = ParseMilliseconds(obj, "wall_time_ms");
  lim.memory = obj.value("memory_kib", (int64_t)0);
  lim.output = obj.value("output_kib", (int64_t)0);
  lim.proc_num = obj.value("processes", 0);
  if (!IsValidLimits(lim)) throw RequestError("Negative limit");
  return lim;
}

Language ParseLanguage(const nlohmann::json& val) {
  std::string name = val.get<std::string>();
  auto lang = GetLanguage(name);
  // disabled or missing toolchains are answered like unknown languages
  if (!lang || !IsLanguageAvailable(lang.value())) throw UnsupportedLanguage(name);
  return lang.value();
}

void WriteCase(const fs::path& path, const nlohmann::json& obj, const char* key,
               const std::string& encoding) {
  std::string payload = obj.at(key).get<std::string>();
  std::ofstream fout(path, std::ios::binary);
  if (!fout) throw std::runtime_error("Cannot write " + path.string());
  if (encoding == "plain") {
    fout << payload;
  } else if (encoding == "base64") {
    OutputBase64(fout, payload);
  } else if (encoding == "zstd-base64") {
    OutputZstdBase64(fout, payload);
  } else {
    throw RequestError("Unknown encoding: " + encoding);
  }
}

} // namespace

void OutputBase64(std::ostream& fout, const std::string& str) {
  size_t i = 0;
  for (; i + 4 < str.size(); i += 4) {
    unsigned char v[4] = {
      Base64CharToValue(str[i]),
      Base64CharToValue(str[i+1]),
      Base64CharToValue(str[i+2]),
      Base64CharToValue(str[i+3])
    };
    fout << static_cast<unsigned char>((v[0] << 2) | (v[1] & 0x30) >> 4);
    fout << static_cast<unsigned char>((v[1] & 0x0f) << 4 | (v[2] & 0x3c) >> 2);
    fout << static_cast<unsigned char>((v[2] & 0x03) << 6 | v[3]);
  }
  if (i + 1 >= str.size() || str[i+1] == '=') return;
  unsigned char v[4] = {Base64CharToValue(str[i]), Base64CharToValue(str[i+1])};
  fout << static_cast<unsigned char>((v[0] << 2) | (v[1] & 0x30) >> 4);
  if (i + 2 >= str.size() || str[i+2] == '=') return;
  v[2] = Base64CharToValue(str[i+2]);
  fout << static_cast<unsigned char>((v[1] & 0x0f) << 4 | (v[2] & 0x3c) >> 2);
  if (i + 3 >= str.size() || str[i+3] == '=') return;
  v[3] = Base64CharToValue(str[i+3]);
  fout << static_cast<unsigned char>((v[2] & 0x03) << 6 | v[3]);
}

void OutputZstdBase64(std::ostream& fout, const std::string& str) {
  std::string data = DecodeBase64(str);
  std::vector<uint8_t> bufOut(ZSTD_DStreamOutSize());
  ZSTD_DCtx* const dctx = ZSTD_createDCtx();
  if (!dctx) throw std::runtime_error("ZSTD_createDCtx failed");
  ZSTD_inBuffer input = {data.data(), data.size(), 0};
  size_t ret = 0;
  while (input.pos < input.size) {
    ZSTD_outBuffer output = {bufOut.data(), bufOut.size(), 0};
    ret = ZSTD_decompressStream(dctx, &output, &input);
    if (ZSTD_isError(ret)) {
      ZSTD_freeDCtx(dctx);
      throw RequestError(std::string("Corrupted zstd payload: ") + ZSTD_getErrorName(ret));
    }
    fout.write((char*)bufOut.data(), output.pos);
  }
  ZSTD_freeDCtx(dctx);
  // nonzero: the last frame is incomplete
  if (ret != 0) throw RequestError("Truncated zstd payload");
}

void ParseJobRequest(const nlohmann::json& data, Submission& sub) {
  if (!data.is_object()) throw RequestError("Request must be an object");
  sub.submission_id = data.at("submission_id").get<std::string>();
  if (sub.submission_id.empty()) throw RequestError("Empty submission_id");
  sub.lang = ParseLanguage(data.at("language"));
  if (data.contains("limits")) sub.limits = ParseLimits(data["limits"]);
  sub.early_exit = data.value("early_exit", false);

  if (data.contains("compare")) {
    auto& cmp = data["compare"];
    if (cmp.contains("mode")) {
      std::string name = cmp["mode"].get<std::string>();
      auto mode = GetCompareMode(name);
      if (!mode) throw RequestError("Unknown compare mode: " + name);
      sub.compare_mode = mode.value();
    }
    if (cmp.contains("float_mode")) {
      std::string name = cmp["float_mode"].get<std::string>();
      auto mode = GetFloatMode(name);
      if (!mode) throw RequestError("Unknown float mode: " + name);
      sub.float_mode = mode.value();
    }
    sub.float_tolerance = cmp.value("tolerance", sub.float_tolerance);
    if (!(sub.float_tolerance >= 0)) throw RequestError("Negative tolerance");
  }

  auto& cases = data.at("cases");
  if (!cases.is_array() || cases.empty()) throw RequestError("No test cases");

  const long id = sub.submission_internal_id;
  fs::path dir = SubmissionCodePath(id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
  WriteFile(SubmissionUserCode(id), ReadSource(data));

  if (data.contains("checker") && !data["checker"].is_null()) {
    auto& checker = data["checker"];
    sub.checker_type = CheckerType::CUSTOM;
    sub.checker_lang = ParseLanguage(checker.at("language"));
    if (checker.contains("limits")) sub.checker_limits = ParseLimits(checker["limits"]);
    WriteFile(SubmissionCheckerCode(id), ReadSource(checker));
  }

  sub.testcases.clear();
  for (size_t i = 0; i < cases.size(); i++) {
    auto& item = cases[i];
    std::string encoding = item.value("encoding", std::string("plain"));
    Submission::TestCase tc;
    tc.name = item.contains("name") ? item["name"].get<std::string>() : std::to_string(i + 1);
    tc.input_file = SubmissionCaseInput(id, i);
    tc.answer_file = SubmissionCaseAnswer(id, i);
    WriteCase(tc.input_file, item, "input", encoding);
    WriteCase(tc.answer_file, item, "expected", encoding);
    sub.testcases.push_back(std::move(tc));
  }
}
