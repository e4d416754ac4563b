#pragma once

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

// namespace text: transcript normalisation and small string helpers shared by
// the dispatcher and option parsing.
namespace text {

inline bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool IsClosingPunct(char c) {
  return c == '.' || c == ',' || c == '!' || c == '?' || c == ';' || c == ':';
}

// Removes runs of two or more '/' separators (with the whitespace around
// them), collapses whitespace to single spaces, drops whitespace before
// closing punctuation and trims both ends. A single '/' is kept.
inline std::string CleanTranscript(std::string_view in) {
  std::string stage;
  stage.reserve(in.size());
  std::size_t i = 0;
  while (i < in.size()) {
    // Measure a candidate run: (ws* '/' ws*){2,}
    std::size_t j = i;
    int slashes = 0;
    for (;;) {
      std::size_t k = j;
      while (k < in.size() && IsSpace(in[k])) {
        ++k;
      }
      if (k < in.size() && in[k] == '/') {
        ++k;
        while (k < in.size() && IsSpace(in[k])) {
          ++k;
        }
        ++slashes;
        j = k;
        continue;
      }
      break;
    }
    if (slashes >= 2) {
      stage.push_back(' ');
      i = j;
      continue;
    }
    stage.push_back(in[i]);
    ++i;
  }

  std::string out;
  out.reserve(stage.size());
  bool pending_space = false;
  for (char c : stage) {
    if (IsSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.empty() && !IsClosingPunct(c)) {
      out.push_back(' ');
    }
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

inline std::string ToLower(const std::string &s) {
  return boost::algorithm::to_lower_copy(s);
}

// Cuts after every '.', '?', '!' and Arabic question mark, trimming the
// pieces and dropping empty ones. Text without a terminator is one sentence.
inline std::vector<std::string> SplitSentences(std::string_view in) {
  static constexpr std::string_view kArabicQuestion = "\xD8\x9F";
  std::vector<std::string> out;
  std::string current;
  auto cut = [&] {
    boost::algorithm::trim(current);
    if (!current.empty()) {
      out.push_back(std::move(current));
    }
    current.clear();
  };
  std::size_t i = 0;
  while (i < in.size()) {
    if (in.substr(i, kArabicQuestion.size()) == kArabicQuestion) {
      current.append(kArabicQuestion);
      i += kArabicQuestion.size();
      cut();
      continue;
    }
    const char c = in[i++];
    current.push_back(c);
    if (c == '.' || c == '?' || c == '!') {
      cut();
    }
  }
  cut();
  return out;
}

// Splits "en, ar ,fr" into {"en","ar","fr"}, lower-cased, empties dropped.
inline std::vector<std::string> SplitList(const std::string &csv) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, csv, boost::algorithm::is_any_of(","));
  std::vector<std::string> out;
  for (auto &p : parts) {
    boost::algorithm::trim(p);
    if (p.empty()) {
      continue;
    }
    out.push_back(ToLower(p));
  }
  return out;
}

inline bool ContainsIgnoreCase(const std::vector<std::string> &set,
                               std::string_view value) {
  for (const auto &s : set) {
    if (boost::algorithm::iequals(s, value)) {
      return true;
    }
  }
  return false;
}

} // namespace text
