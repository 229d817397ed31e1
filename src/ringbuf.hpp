#pragma once

#include <array>
#include <cstddef>
#include <optional>

namespace fcd_digest {

// Fixed-capacity FIFO that overwrites its oldest item once full.
template <typename T, std::size_t N>
class RingBuffer {
	static_assert(N > 0, "RingBuffer needs a capacity of at least one");

  public:
	auto push_back(const T& item) -> void {
		this->buffer[this->tail] = item;
		this->tail = (this->tail + 1) % N;
		if (this->num_items == N) {
			this->head = (this->head + 1) % N;
		} else {
			this->num_items++;
		}
	}

	auto back() const -> std::optional<T> {
		return ! this->empty() ? std::optional<T> {this->buffer[(this->tail + N - 1) % N]}
							   : std::nullopt;
	}
	auto front() const -> std::optional<T> {
		return ! this->empty() ? std::optional<T> {this->buffer[this->head]} : std::nullopt;
	}
	auto empty() const -> bool { return this->num_items == 0; }
	auto size() const -> std::size_t { return this->num_items; }

  private:
	std::array<T, N> buffer {};
	std::size_t		 head = 0;
	std::size_t		 tail = 0;
	std::size_t		 num_items = 0;
};

} // namespace fcd_digest
