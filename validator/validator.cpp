#include "validator/validator.hpp"

#include <ctype.h>

#include <algorithm>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace {
bool IsIdentStart(char c) {
  // Bytes of multi-byte UTF-8 sequences are treated as letters.
  return isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || isdigit(static_cast<unsigned char>(c));
}

// An import of path is forbidden if path is a forbidden module or one of its
// submodules.
std::string MatchImport(absl::string_view path,
                        const proto::SecurityPolicy& policy) {
  for (const std::string& name : policy.forbidden_imports()) {
    if (path == name ||
        (absl::StartsWith(path, name) && path.size() > name.size() &&
         path[name.size()] == '.')) {
      return name;
    }
  }
  return "";
}

// A call of path is forbidden if its last segments are a forbidden name.
std::string MatchCall(absl::string_view path,
                      const proto::SecurityPolicy& policy) {
  for (const std::string& name : policy.forbidden_calls()) {
    if (path == name ||
        (absl::EndsWith(path, name) && path.size() > name.size() &&
         path[path.size() - name.size() - 1] == '.')) {
      return name;
    }
  }
  return "";
}
}  // namespace

namespace validator {

std::vector<Token> Tokenize(absl::string_view source) {
  std::vector<Token> tokens;
  size_t i = 0;
  const size_t n = source.size();
  while (i < n) {
    char c = source[i];
    if (isspace(static_cast<unsigned char>(c))) {
      i++;
    } else if (isdigit(static_cast<unsigned char>(c))) {
      // Numbers, including 1.5e3 and 0x1f.
      while (i < n && (IsIdentChar(source[i]) || source[i] == '.')) i++;
    } else if (IsIdentStart(c)) {
      size_t start = i;
      while (i < n && IsIdentChar(source[i])) i++;
      while (i + 1 < n && source[i] == '.' && IsIdentStart(source[i + 1])) {
        i++;
        while (i < n && IsIdentChar(source[i])) i++;
      }
      tokens.push_back(
          Token{Token::Kind::PATH, source.substr(start, i - start)});
    } else {
      tokens.push_back(Token{Token::Kind::PUNCT, source.substr(i, 1)});
      i++;
    }
  }
  return tokens;
}

std::string FindForbiddenConstruct(absl::string_view source,
                                   const proto::SecurityPolicy& policy) {
  std::vector<Token> tokens = Tokenize(source);
  auto is_path = [&tokens](size_t i) {
    return i < tokens.size() && tokens[i].kind == Token::Kind::PATH;
  };
  auto is_word = [&tokens, &is_path](size_t i, absl::string_view word) {
    return is_path(i) && tokens[i].text == word;
  };
  auto is_punct = [&tokens](size_t i, char c) {
    return i < tokens.size() && tokens[i].kind == Token::Kind::PUNCT &&
           tokens[i].text[0] == c;
  };

  for (size_t i = 0; i < tokens.size(); i++) {
    if (!is_path(i)) continue;
    if (tokens[i].text == "import") {
      size_t j = i + 1;
      // DSL form: import:py module;
      if (is_punct(j, ':') && is_path(j + 1)) j += 2;
      if (is_punct(j, '(')) j++;
      while (is_path(j)) {
        if (tokens[j].text == "from") {
          j++;
          continue;
        }
        std::string match = MatchImport(tokens[j].text, policy);
        if (!match.empty()) return match;
        j++;
        if (is_word(j, "as")) j += 2;
        if (!is_punct(j, ',')) break;
        j++;
      }
    } else if (tokens[i].text == "from" && is_path(i + 1)) {
      std::string match = MatchImport(tokens[i + 1].text, policy);
      if (!match.empty()) return match;
    }
    if (is_punct(i + 1, '(')) {
      std::string match = MatchCall(tokens[i].text, policy);
      if (!match.empty()) return match;
    }
  }
  return "";
}

ValidationOutcome Validate(const proto::ExecutionRequest& request,
                           const proto::SecurityPolicy& policy) {
  if (static_cast<int64_t>(request.source_text().size()) >
      policy.max_source_bytes()) {
    return ValidationOutcome::Rejected("source_too_large");
  }
  const auto& enabled = policy.languages_enabled();
  if (std::find(enabled.begin(), enabled.end(), request.language()) ==
      enabled.end()) {
    return ValidationOutcome::Rejected("language_disabled");
  }
  std::string match = FindForbiddenConstruct(request.source_text(), policy);
  if (!match.empty()) {
    return ValidationOutcome::Rejected(
        absl::StrCat("forbidden_construct(", match, ")"));
  }
  return ValidationOutcome::Accepted();
}

}  // namespace validator
