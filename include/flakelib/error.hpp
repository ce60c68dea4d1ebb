#pragma once

#include <string>
#include <system_error>

namespace flakelib {

enum class FlakeErrc {
  ok = 0,
  clock_is_running_backwards = 1,
  invalid_identifier = 2,
  sequence_exhausted = 3,
  invalid_id = 4,
  invalid_config = 5,
  moved_from = 6,
};

class FlakeErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "flakelib"; }
  std::string message(int ev) const override {
    switch (static_cast<FlakeErrc>(ev)) {
      case FlakeErrc::ok: return "ok";
      case FlakeErrc::clock_is_running_backwards: return "clock is running backwards";
      case FlakeErrc::invalid_identifier: return "identifier must be exactly 6 bytes";
      case FlakeErrc::sequence_exhausted: return "sequence exhausted for this millisecond";
      case FlakeErrc::invalid_id: return "invalid flake id";
      case FlakeErrc::invalid_config: return "invalid configuration";
      case FlakeErrc::moved_from: return "generator has been moved from";
      default: return "unknown error";
    }
  }
};

inline const std::error_category& flake_error_category() {
  static FlakeErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(FlakeErrc e) {
  return {static_cast<int>(e), flake_error_category()};
}

} // namespace flakelib

namespace std {
template<> struct is_error_code_enum<flakelib::FlakeErrc> : true_type {};
}
