#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fcd_digest {

class Timer {
  public:
	Timer() : t_start(std::chrono::steady_clock::now()) { }

	auto elapsed_us() const -> std::uint64_t {
		const auto t_now = std::chrono::steady_clock::now();
		const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(t_now - t_start);
		return elapsed.count();
	}

	auto elapsed_ms() const -> std::uint64_t { return this->elapsed_us() / 1000; }

	auto elapsed_s() const -> double { return static_cast<double>(this->elapsed_us()) / 1e6; }

	auto reset() -> void { t_start = std::chrono::steady_clock::now(); }

  private:
	std::chrono::steady_clock::time_point t_start;
};

// t is in microseconds
[[nodiscard]] inline auto humantime(const std::uint64_t t) -> std::string {
	using namespace std::chrono;
	const auto total = microseconds(t);
	const auto h = duration_cast<hours>(total);
	const auto m = duration_cast<minutes>(total - h);
	const auto s = duration_cast<seconds>(total - h - m);
	const auto ms = duration_cast<milliseconds>(total - h - m - s);

	std::string result = "";
	if (h.count() > 0) {
		result += std::to_string(h.count()) + "h ";
	}
	if (m.count() > 0) {
		result += std::to_string(m.count()) + "m ";
	}
	if (s.count() > 0) {
		result += std::to_string(s.count()) + "s ";
	}
	if (ms.count() > 0 || result.empty()) {
		result += std::to_string(ms.count()) + "ms";
	}
	if (! result.empty() && result.back() == ' ') {
		result.pop_back();
	}
	return result;
}

// Simulated seconds as hh:mm:ss
[[nodiscard]] inline auto sim_clock(const double seconds) -> std::string {
	const auto total = static_cast<std::int64_t>(seconds);
	const auto h = total / 3600;
	const auto m = (total % 3600) / 60;
	const auto s = total % 60;
	auto pad = [](const std::int64_t v) { return (v < 10 ? "0" : "") + std::to_string(v); };
	return pad(h) + ":" + pad(m) + ":" + pad(s);
}

} // namespace fcd_digest
