#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace fcd_digest {

enum class decode_error {
	missing_attribute,
	malformed_number,
};

[[nodiscard]]
auto pformat(decode_error err) -> std::string;

// Returns the raw value of `name="..."` inside a single tag line.
// The name only matches at an attribute boundary (preceded by whitespace), so
// looking up `id` never hits `vid="..."` or the tail of another attribute.
[[nodiscard]]
auto find_attribute(std::string_view line, std::string_view name)
	-> std::optional<std::string_view>;

[[nodiscard]]
auto decode_string(std::string_view line, std::string_view name)
	-> tl::expected<std::string_view, decode_error>;

// Finite decimal numbers only; "nan", "inf" and trailing garbage are rejected.
[[nodiscard]]
auto decode_double(std::string_view line, std::string_view name)
	-> tl::expected<double, decode_error>;

[[nodiscard]]
auto parse_double(std::string_view text) -> std::optional<double>;

} // namespace fcd_digest
