#ifndef VALIDATOR_VALIDATOR_HPP
#define VALIDATOR_VALIDATOR_HPP

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "proto/execution.pb.h"
#include "proto/policy.pb.h"

namespace validator {

struct ValidationOutcome {
  bool accepted = true;
  // Set only for rejections: source_too_large, language_disabled or
  // forbidden_construct(<name>).
  std::string reason;

  static ValidationOutcome Accepted() { return ValidationOutcome(); }
  static ValidationOutcome Rejected(std::string reason) {
    ValidationOutcome outcome;
    outcome.accepted = false;
    outcome.reason = std::move(reason);
    return outcome;
  }
};

// Checks a request against the policy before anything is run. The scan is
// lexical: forbidden names inside strings and comments are rejected too.
ValidationOutcome Validate(const proto::ExecutionRequest& request,
                           const proto::SecurityPolicy& policy);

// A token of the lexical scan: either a dotted identifier path ("a.b.c") or
// a single punctuation character.
struct Token {
  enum class Kind { PATH, PUNCT };
  Kind kind;
  absl::string_view text;
};

std::vector<Token> Tokenize(absl::string_view source);

// Returns the first forbidden import or call of source, or an empty string.
std::string FindForbiddenConstruct(absl::string_view source,
                                   const proto::SecurityPolicy& policy);

}  // namespace validator

#endif
