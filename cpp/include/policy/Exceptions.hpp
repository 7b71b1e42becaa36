#pragma once

#include "util/Exception.hpp"

namespace policy {

/*
 * Thrown by a tree policy's validate_evaluations() when the priors supplied by the client's
 * evaluator break the policy's requirements (e.g. AlphaGoPolicy expects an approximate probability
 * distribution). This indicates a bug in the evaluator, not a transient condition: the search that
 * received the priors cannot continue meaningfully, but the hosting process can.
 */
class EvaluatorContractError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace policy
