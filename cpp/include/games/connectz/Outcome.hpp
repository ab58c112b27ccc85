#pragma once

#include "games/connectz/Constants.hpp"

#include <fmt/format.h>

#include <expected>
#include <string>
#include <utility>

namespace cz {

/*
 * A terminal reason why a game log is not a legal, decided game.
 *
 * The message is diagnostic only; callers branch on kind.
 */
struct Failure {
  Failure(FailureKind k, std::string m) : kind(k), message(std::move(m)) {}

  bool operator==(const Failure&) const = default;

  FailureKind kind;
  std::string message;
};

using Outcome = std::expected<GameResult, Failure>;

// Helper for the common `return fail(...)` pattern in functions returning std::expected.
template <typename... Ts>
std::unexpected<Failure> fail(FailureKind kind, fmt::format_string<Ts...> fmt, Ts&&... ts) {
  return std::unexpected<Failure>(std::in_place, kind,
                                  fmt::format(fmt, std::forward<Ts>(ts)...));
}

int to_exit_code(const Outcome& outcome);

}  // namespace cz
