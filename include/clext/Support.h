//===- clext/Support.h - Error values and output helpers --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Lightweight Error / Expected<T> values, fatal error reporting and stream
// helpers shared by the rest of the library.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_SUPPORT_H
#define CLEXT_SUPPORT_H

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clext {

//===----------------------------------------------------------------------===//
// Error handling
//===----------------------------------------------------------------------===//

/// A move-only error message. A default constructed Error represents
/// success; moving out of an Error leaves success behind.
class Error {
  std::string Message;
  bool IsError = false;

public:
  Error() = default;
  explicit Error(std::string Msg) : Message(std::move(Msg)), IsError(true) {}
  Error(const Error &) = delete;
  Error &operator=(const Error &) = delete;
  Error(Error &&Other) noexcept
      : Message(std::move(Other.Message)), IsError(Other.IsError) {
    Other.IsError = false;
  }
  Error &operator=(Error &&Other) noexcept {
    Message = std::move(Other.Message);
    IsError = Other.IsError;
    Other.IsError = false;
    return *this;
  }

  static Error success() { return Error(); }
  explicit operator bool() const { return IsError; }

  const std::string &message() const { return Message; }

  friend std::string toString(Error E);
};

inline Error createStringError(std::string Msg) {
  return Error(std::move(Msg));
}

/// Consume \p E and return its message.
inline std::string toString(Error E) {
  E.IsError = false;
  return std::move(E.Message);
}

/// Drop an error the caller has decided it does not care about.
inline void consumeError(Error E) { (void)toString(std::move(E)); }

/// Holds either a value of type T or an Error.
template <typename T> class Expected {
  std::optional<T> Val;
  Error Err;

public:
  Expected(T V) : Val(std::move(V)) {}
  Expected(Error E) : Err(std::move(E)) {
    assert(Err && "Cannot create Expected<T> from Error success value.");
  }

  explicit operator bool() const { return Val.has_value(); }

  T &get() {
    assert(Val && "Cannot get value when an error exists!");
    return *Val;
  }
  const T &get() const {
    assert(Val && "Cannot get value when an error exists!");
    return *Val;
  }
  T &operator*() { return get(); }
  const T &operator*() const { return get(); }
  T *operator->() { return &get(); }
  const T *operator->() const { return &get(); }

  /// Take ownership of the stored error. Returns success when a value is
  /// held.
  Error takeError() { return std::move(Err); }
};

/// report_fatal_error - print \p Msg to stderr and abort. Reserved for bugs
/// in a program's own command definition.
[[noreturn]] inline void report_fatal_error(std::string_view Msg) {
  std::cerr << "FATAL ERROR: " << Msg << "\n";
  std::abort();
}

/// Report a fatal error if \p Err is a failure.
inline void cantFail(Error Err) {
  if (Err)
    report_fatal_error(toString(std::move(Err)));
}

/// Unwrap \p ValOrErr, reporting a fatal error if it holds a failure.
template <typename T> T cantFail(Expected<T> ValOrErr) {
  if (!ValOrErr)
    report_fatal_error(toString(ValOrErr.takeError()));
  return std::move(*ValOrErr);
}

//===----------------------------------------------------------------------===//
// Output helpers
//===----------------------------------------------------------------------===//

inline std::ostream &outs() { return std::cout; }
inline std::ostream &errs() { return std::cerr; }

/// indent helper
inline std::ostream &indent(std::ostream &OS, size_t N) {
  for (size_t I = 0; I < N; ++I)
    OS << ' ';
  return OS;
}

/// Split \p S at the first \p Sep. The separator itself is dropped.
std::pair<std::string_view, std::string_view> split(std::string_view S,
                                                    char Sep);

/// Levenshtein edit distance between two strings. When \p MaxEditDistance is
/// non-zero the computation stops early and returns MaxEditDistance + 1 once
/// the bound is exceeded.
unsigned editDistance(std::string_view From, std::string_view To,
                      unsigned MaxEditDistance = 0);

/// Return the candidate closest to \p Name, or an empty string if none is
/// within \p MaxEditDistance edits.
std::string findNearest(std::string_view Name,
                        const std::vector<std::string_view> &Candidates,
                        unsigned MaxEditDistance = 2);

} // end namespace clext

#endif // CLEXT_SUPPORT_H
