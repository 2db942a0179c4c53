#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace arbor::ui {

// Index-addressed arena id. generation is bumped whenever the slot is
// released so stale handles are detectable.
struct ComponentId {
  std::uint32_t index{};
  std::uint32_t generation{};

  bool valid() const noexcept { return generation != 0; }

  friend bool operator==(const ComponentId &, const ComponentId &) = default;
};

enum class ErrorKind {
  // Degraded to ReplaceNode by the diff engine; never surfaced.
  StructuralMismatch,
  DuplicateKey,
  SurfaceApplicationFailure,
  WriteAfterUnmount,
  RenderPanic,
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::StructuralMismatch:
    return "StructuralMismatch";
  case ErrorKind::DuplicateKey:
    return "DuplicateKey";
  case ErrorKind::SurfaceApplicationFailure:
    return "SurfaceApplicationFailure";
  case ErrorKind::WriteAfterUnmount:
    return "WriteAfterUnmount";
  case ErrorKind::RenderPanic:
    return "RenderPanic";
  }
  return "Unknown";
}

struct Error {
  ErrorKind kind{ErrorKind::RenderPanic};
  ComponentId component{};
  std::string message;
};

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  os << to_string(e.kind);
  if (e.component.valid()) {
    os << " (component " << e.component.index << ")";
  }
  return os << ": " << e.message;
}

class Status {
public:
  Status() = default;

  static Status success() { return Status{}; }

  static Status failure(Error error) {
    Status s;
    s.error_ = std::move(error);
    return s;
  }

  static Status failure(ErrorKind kind, std::string message,
                        ComponentId component = {}) {
    return failure(Error{kind, component, std::move(message)});
  }

  bool ok() const noexcept { return !error_.has_value(); }

  explicit operator bool() const noexcept { return ok(); }

  const std::optional<Error> &error() const noexcept { return error_; }

private:
  std::optional<Error> error_;
};

} // namespace arbor::ui

template <> struct std::hash<arbor::ui::ComponentId> {
  std::size_t operator()(const arbor::ui::ComponentId &id) const noexcept {
    return (static_cast<std::size_t>(id.generation) << 32) ^ id.index;
  }
};
