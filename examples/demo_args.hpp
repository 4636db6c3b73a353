#pragma once

#include <charconv>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>

namespace ripple::ui::examples {

struct DemoArgs {
  std::size_t frames{10};
  int interval_ms{16};
  bool trace{};
};

namespace detail {
template <typename T>
bool parse_non_negative(std::string_view text, T &out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  T value{};
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return false;
  }
  out = value;
  return true;
}
} // namespace detail

// Usage: [frames] [--trace] [--interval MS]
// Reports the first bad argument on `err` and returns nullopt.
inline std::optional<DemoArgs> parse_demo_args(int argc, const char *const *argv,
                                               std::ostream &err) {
  DemoArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--trace") {
      args.trace = true;
    } else if (arg == "--interval") {
      if (i + 1 >= argc) {
        err << "--interval needs a value in milliseconds\n";
        return std::nullopt;
      }
      const std::string_view value{argv[++i]};
      if (!detail::parse_non_negative(value, args.interval_ms)) {
        err << "bad --interval value: " << value << "\n";
        return std::nullopt;
      }
    } else if (!detail::parse_non_negative(arg, args.frames)) {
      err << "bad argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  return args;
}

} // namespace ripple::ui::examples
