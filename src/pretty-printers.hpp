#pragma once

#include <filesystem>
#include <string>
#include <type_traits>

#include <fmt/color.h>
#include <fmt/core.h>

namespace fcd_digest {

namespace escape_codes {
constexpr const char* reset = "\033[0m";
namespace color::fg {
constexpr const char* green = "\033[32m";
constexpr const char* cyan = "\033[36m";
} // namespace color::fg
namespace markup {
constexpr const char* bold = "\033[1m";
} // namespace markup
} // namespace escape_codes

[[nodiscard]] inline auto pformat(const std::string& s) -> std::string {
	return fmt::format("{}\"{}\"{}", escape_codes::color::fg::green, s, escape_codes::reset);
}

[[nodiscard]] inline auto pformat(const char* s) -> std::string {
	return pformat(std::string(s));
}

[[nodiscard]] inline auto pformat(const bool b) -> std::string {
	return fmt::format(b ? fg(fmt::color::green) : fg(fmt::color::red), "{}", b);
}

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
[[nodiscard]] auto pformat(const T f) -> std::string {
	return fmt::format(fg(fmt::color::orange), "{}", f);
}

template <typename T,
		  std::enable_if_t<std::is_integral_v<T> && ! std::is_same_v<T, bool>, bool> = true>
[[nodiscard]] auto pformat(const T i) -> std::string {
	return fmt::format(fg(fmt::color::blue), "{}", i);
}

// Bold green for an existing file, blue for a directory, red when missing
[[nodiscard]] inline auto pformat(const std::filesystem::path& p) -> std::string {
	if (! std::filesystem::exists(p)) {
		return fmt::format(fmt::emphasis::bold | fg(fmt::color::red), "{}", p.string());
	}
	if (std::filesystem::is_directory(p)) {
		return fmt::format(fmt::emphasis::bold | fg(fmt::color::blue), "{}", p.string());
	}
	return fmt::format(fmt::emphasis::bold | fg(fmt::color::green), "{}", p.string());
}

// One `.field = value,` line of a pprint() dump
template <typename T>
auto pprint_field(const char* name, const T& value, const int indent_by = 4) -> void {
	fmt::print("{}{}.{}{} = {},\n", std::string(indent_by, ' '), escape_codes::markup::bold, name,
				 escape_codes::reset, pformat(value));
}

} // namespace fcd_digest
