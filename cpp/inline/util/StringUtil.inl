#include "util/StringUtil.hpp"

#include <cctype>
#include <string_view>

namespace util {

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  split(result, s, t);
  return result;
}

inline int split(std::vector<std::string>& result, const std::string& s, const char* t) {
  std::string_view sep(t);
  std::size_t token_count = 0;

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      std::string_view tok = sv.substr(start, pos - start);

      if (token_count < result.size())
        result[token_count] = tok;
      else
        result.emplace_back(tok);

      ++token_count;
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      std::string_view tok(s.data() + start, end - start);
      if (token_count < result.size())
        result[token_count] = tok;
      else
        result.emplace_back(tok);
      ++token_count;
      start = end + sep.size();
    }
    // last segment
    std::string_view tok(s.data() + start, s.size() - start);
    if (token_count < result.size())
      result[token_count] = tok;
    else
      result.emplace_back(tok);
    ++token_count;
  }

  return int(token_count);
}

}  // namespace util
