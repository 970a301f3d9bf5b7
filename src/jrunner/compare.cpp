#include <jrunner/compare.h>

#include <cmath>
#include <locale>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace {

void EOFMessage(std::stringstream& message, bool ans_eof, size_t line, size_t user_lines) {
  if (ans_eof) message << "Unexpected line " << line;
  else message << "Unexpected EOF after line " << user_lines;
}

void DifferMessage(std::stringstream& message, const std::string& ans, const std::string& usr) {
  size_t pos = 0;
  for (; pos < ans.size() && pos < usr.size() && ans[pos] == usr[pos]; pos++);
  message << "Expected: ";
  if (pos <= 40 || ans.size() <= 80) {
    message << ans;
  } else {
    message << "..." << ans.substr(pos - 40, 80);
    if (ans.size() > pos + 40) message << "...";
  }
  message << "\nGot: ";
  if (pos <= 40 || usr.size() <= 80) {
    message << usr;
  } else {
    message << "..." << usr.substr(pos - 40, 80);
    if (usr.size() > pos + 40) message << "...";
  }
}

bool LineCompare(std::ifstream& f_ans, std::ifstream& f_usr, std::stringstream& message) {
  constexpr char kWhites[] = " \n\r\t";
  size_t line = 1;
  for (; f_ans.eof() == f_usr.eof(); line++) {
    if (f_ans.eof()) return true;
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    // std::string::npos + 1 == 0
    s.erase(s.find_last_not_of(kWhites) + 1);
    t.erase(t.find_last_not_of(kWhites) + 1);
    if (s != t) {
      message << "Line " << line << " differ.\n";
      DifferMessage(message, s, t);
      return false;
    }
  }
  size_t user_lines = line - 1;
  // only blank lines may remain in the longer file
  while (!f_ans.eof() || !f_usr.eof()) {
    std::string s;
    if (!f_ans.eof()) {
      getline(f_ans, s);
    } else {
      getline(f_usr, s);
    }
    if (s.find_last_not_of(kWhites) != std::string::npos) {
      EOFMessage(message, f_ans.eof(), line, user_lines);
      return false;
    }
    line++;
  }
  return true;
}

bool StrictCompare(std::ifstream& f_ans, std::ifstream& f_usr, std::stringstream& message) {
  constexpr size_t kBufSize = 65536;
  std::string buf1(kBufSize, '\0'), buf2(kBufSize, '\0');
  size_t pos = 0;
  while (f_ans) {
    f_ans.read(buf1.data(), kBufSize);
    f_usr.read(buf2.data(), kBufSize);
    if (f_ans.eof() != f_usr.eof() || f_ans.gcount() != f_usr.gcount()) {
      message << "Length differ: expected " << (pos + f_ans.gcount()) << " bytes, got "
          << (pos + f_usr.gcount()) << " bytes";
      return false;
    }
    if (memcmp(buf1.data(), buf2.data(), f_ans.gcount()) != 0) {
      long offset = 0;
      for (; offset < f_ans.gcount() && buf1[offset] == buf2[offset]; offset++);
      message << "Byte " << (pos + offset) << " differ: expected 0x"
          << std::hex << std::setfill('0') << std::setw(2) << (uint32_t)(uint8_t)buf1[offset] << ", got 0x"
          << std::setw(2) << (uint32_t)(uint8_t)buf2[offset];
      return false;
    }
    pos += f_usr.gcount();
  }
  return true;
}

template <class Func>
bool WordCompare(std::ifstream& f_ans, std::ifstream& f_usr, std::stringstream& message, Func&& func) {
  constexpr char kWhites[] = " \n\r\t\x0b\x0c";
  size_t line = 1;
  for (; f_ans.eof() == f_usr.eof(); line++) {
    if (f_ans.eof()) return true;
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    for (size_t i1 = 0, i2 = 0, word = 1;; word++) {
      i1 = s.find_first_not_of(kWhites, i1);
      i2 = t.find_first_not_of(kWhites, i2);
      if ((i1 == std::string::npos) != (i2 == std::string::npos)) {
        if (i1 == std::string::npos) message << "Unexpected word: line " << line << ", word " << word;
        else message << "Unexpected EOL after line " << line << ", word " << word - 1;
        return false;
      }
      if (i1 == std::string::npos) break;
      size_t j1 = s.find_first_of(kWhites, i1);
      size_t j2 = t.find_first_of(kWhites, i2);
      if (j1 == std::string::npos) j1 = s.size();
      if (j2 == std::string::npos) j2 = t.size();
      if (!func(s.substr(i1, j1 - i1), t.substr(i2, j2 - i2))) {
        message << "Line " << line << ", word " << word << " differ.\n";
        DifferMessage(message, s.substr(i1, j1 - i1), t.substr(i2, j2 - i2));
        return false;
      }
      i1 = j1, i2 = j2;
    }
  }
  size_t user_lines = line - 1;
  while (!f_ans.eof() || !f_usr.eof()) {
    std::string s;
    if (!f_ans.eof()) {
      getline(f_ans, s);
    } else {
      getline(f_usr, s);
    }
    if (s.find_last_not_of(kWhites) != std::string::npos) {
      EOFMessage(message, f_ans.eof(), line, user_lines);
      return false;
    }
  }
  return true;
}

// Tokens containing any of ".eExXnN" are compared numerically, others exactly;
// this avoids treating integers as floating point
template <class Func>
auto FloatCheck(Func func) {
  return [func](std::string&& ans, std::string&& usr) {
    if (ans.find_first_of(".eExXnN") == std::string::npos) return ans == usr;
    long double fans, fusr;
    {
      // stold depends on the global locale; parse in the classic one
      std::istringstream s_ans(ans), s_usr(usr);
      s_ans.imbue(std::locale::classic());
      s_usr.imbue(std::locale::classic());
      if (!(s_ans >> fans) || !(s_usr >> fusr)) return ans == usr;
      if (s_usr.peek() != std::istringstream::traits_type::eof()) return ans == usr;
    }
    return func(fans, fusr);
  };
}

} // namespace

CompareResult CompareOutput(const std::filesystem::path& answer, const std::filesystem::path& user_output,
                            CompareMode mode, FloatMode float_mode, double tolerance) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(user_output, ec)) {
    return {false, "No output"};
  }
  std::ifstream f_ans(answer, std::ios::binary), f_usr(user_output, std::ios::binary);
  std::stringstream message;
  bool res = false;
  switch (mode) {
    case CompareMode::STRICT: {
      res = StrictCompare(f_ans, f_usr, message);
      break;
    }
    case CompareMode::LINE: {
      res = LineCompare(f_ans, f_usr, message);
      break;
    }
    case CompareMode::WHITE_DIFF: {
      res = WordCompare(f_ans, f_usr, message,
                        [](std::string&& ans, std::string&& usr) { return ans == usr; });
      break;
    }
    case CompareMode::FLOAT_DIFF: {
      const long double threshold = tolerance;
      switch (float_mode) {
        case FloatMode::ABSOLUTE: {
          res = WordCompare(f_ans, f_usr, message, FloatCheck([threshold](long double ans, long double usr) {
            return std::fabs(ans - usr) <= threshold;
          }));
          break;
        }
        case FloatMode::RELATIVE: {
          res = WordCompare(f_ans, f_usr, message, FloatCheck([threshold](long double ans, long double usr) {
            return std::fabs(ans - usr) <= threshold * std::fabs(ans);
          }));
          break;
        }
        case FloatMode::ABSOLUTE_RELATIVE: {
          res = WordCompare(f_ans, f_usr, message, FloatCheck([threshold](long double ans, long double usr) {
            return std::fabs(ans - usr) <= threshold * std::max(1.0L, std::fabs(ans));
          }));
          break;
        }
      }
      break;
    }
  }
  if (res) return {true, ""};
  return {false, message.str()};
}
