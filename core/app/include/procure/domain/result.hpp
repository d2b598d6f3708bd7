#pragma once

#include <string>
#include <utility>
#include <variant>

namespace procure {
namespace domain {

struct SynthesisError {
  std::string reason;
};

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
//
// @brief  Either a fully built value or the reason it could not be built.
//
// @details
// Returned by the fallback synthesis steps (ContractFallbackPolicy,
// OrderPlacementPolicy). The engine inserts the value on success and
// records a SynthesisFailure in the step's change-log on failure; the
// synthesizers themselves never touch engine state, so a failure can never
// leave a half-constructed entity behind.
//
// Backed by std::variant, the same closed-sum idiom the engine uses
// elsewhere for value-typed alternatives.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  static Result success(T value) { return Result(std::move(value)); }

  static Result failure(std::string reason) {
    return Result(SynthesisError{std::move(reason)});
  }

  bool ok() const { return std::holds_alternative<T>(state_); }

  const T& value() const { return std::get<T>(state_); }
  T& value() { return std::get<T>(state_); }

  const SynthesisError& error() const {
    return std::get<SynthesisError>(state_);
  }

 private:
  explicit Result(T value) : state_(std::move(value)) {}
  explicit Result(SynthesisError error) : state_(std::move(error)) {}

  std::variant<T, SynthesisError> state_;
};

}  // namespace domain
}  // namespace procure
