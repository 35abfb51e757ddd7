#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/error.hpp"

namespace lowrank_core {
struct ProgressSinkVTable;

// subscriber for pipeline checkpoints. notifications are observational only,
// nothing a sink does changes the computation
class ProgressSink {
	  public:
		ProgressSink() noexcept = default;

		bool available() const noexcept { return vtable_ != nullptr && ctx_ != nullptr; }

		void notify(In std::uint8_t percent, In const char* label) const noexcept;

		static ProgressSink make(void* ctx, const ProgressSinkVTable* vtable) noexcept;

	  private:
		void* ctx_ = nullptr;
		const ProgressSinkVTable* vtable_ = nullptr;
};

struct ProgressSinkVTable {
		void (*on_progress)(InOut void*, In std::uint8_t, In const char*) noexcept;
};

struct ProgressEntry {
		std::uint8_t percent = 0;
		char label[40] = {};
};

// records checkpoints for callers that poll instead of subscribing.
// entries past the capacity are dropped but last() stays current
class ProgressLog final {
	  public:
		static constexpr std::size_t kCapacity = 16;

		ProgressLog() noexcept = default;
		ProgressLog(const ProgressLog&) = delete;
		ProgressLog& operator=(const ProgressLog&) = delete;

		std::size_t count() const noexcept { return count_; }
		const ProgressEntry& at(std::size_t index) const noexcept;
		const ProgressEntry& last() const noexcept { return last_; }
		bool empty() const noexcept { return count_ == 0 && !seen_; }

		void record(std::uint8_t percent, const char* label) noexcept;
		void clear() noexcept;

		ProgressSink sink() noexcept;

	  private:
		ProgressEntry entries_[kCapacity]{};
		ProgressEntry last_{};
		std::size_t count_ = 0;
		bool seen_ = false;
};

} // namespace lowrank_core
