#pragma once

/** \file specification.hpp
 *  \brief The specification contract: a pure boolean test over a candidate of type T.
 *
 * Thread-safety: implementations are immutable after construction; is_satisfied_by may be
 * called concurrently on a shared instance without synchronization.
 * Totality: is_satisfied_by never throws for a well-typed candidate. Missing or empty input
 * is a normal "not satisfied" outcome.
 * Ownership: specifications are shared through specification_ptr and are never mutated.
 */

#include <memory>
#include <string>

namespace criteria {

/** \brief Abstract boolean condition over candidates of type T. */
template <typename T>
class specification {
public:
  using candidate_type = T;

  virtual ~specification() = default;

  /** \brief True iff candidate satisfies the condition. Pure and deterministic. */
  [[nodiscard]] virtual auto is_satisfied_by(const T& candidate) const -> bool = 0;

  /** \brief Short diagnostic rendering, e.g. "in_range[1, 100]". */
  [[nodiscard]] virtual auto describe() const -> std::string { return "specification"; }

protected:
  specification() = default;
  specification(const specification&) = default;
  specification& operator=(const specification&) = default;
};

/** \brief Shared, immutable reference to a specification. */
template <typename T>
using specification_ptr = std::shared_ptr<const specification<T>>;

} // namespace criteria
