#include "field-decoder.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace fcd_digest {

namespace {

auto is_space(const char c) -> bool {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

[[nodiscard]] auto pformat(const decode_error err) -> std::string {
	switch (err) {
		case decode_error::missing_attribute:
			return "missing attribute";
		case decode_error::malformed_number:
			return "malformed number";
	}
	return "unknown decode error";
}

[[nodiscard]] auto find_attribute(std::string_view line, std::string_view name)
	-> std::optional<std::string_view> {
	if (name.empty()) {
		return std::nullopt;
	}

	std::size_t pos = 0;
	while ((pos = line.find(name, pos)) != std::string_view::npos) {
		const auto after = pos + name.size();
		const bool at_boundary = pos > 0 && is_space(line[pos - 1]);
		if (at_boundary && after + 1 < line.size() && line[after] == '=' &&
			line[after + 1] == '"') {
			const auto value_start = after + 2;
			const auto value_end = line.find('"', value_start);
			if (value_end == std::string_view::npos) {
				// Unterminated value, the line is truncated
				return std::nullopt;
			}
			return line.substr(value_start, value_end - value_start);
		}
		pos = after;
	}
	return std::nullopt;
}

[[nodiscard]] auto decode_string(std::string_view line, std::string_view name)
	-> tl::expected<std::string_view, decode_error> {
	const auto value = find_attribute(line, name);
	if (! value.has_value() || value->empty()) {
		return tl::make_unexpected(decode_error::missing_attribute);
	}
	return *value;
}

[[nodiscard]] auto parse_double(std::string_view text) -> std::optional<double> {
	if (text.empty()) {
		return std::nullopt;
	}
	// std::from_chars does not accept a leading '+'
	if (text.front() == '+') {
		text.remove_prefix(1);
	}
	double value = 0.0;
	const auto* const end = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, value);
	if (ec != std::errc {} || ptr != end || ! std::isfinite(value)) {
		return std::nullopt;
	}
	return value;
}

[[nodiscard]] auto decode_double(std::string_view line, std::string_view name)
	-> tl::expected<double, decode_error> {
	const auto value = find_attribute(line, name);
	if (! value.has_value()) {
		return tl::make_unexpected(decode_error::missing_attribute);
	}
	const auto number = parse_double(*value);
	if (! number.has_value()) {
		return tl::make_unexpected(decode_error::malformed_number);
	}
	return *number;
}

} // namespace fcd_digest
