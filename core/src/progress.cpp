#include "lowrank_core/progress.hpp"

namespace lowrank_core {
namespace {
void log_on_progress(void* ctx, std::uint8_t percent, const char* label) noexcept {
		static_cast<ProgressLog*>(ctx)->record(percent, label);
}

constexpr ProgressSinkVTable kLogVTable = {
        .on_progress = &log_on_progress,
};

void copy_label(char* dst, std::size_t cap, const char* src) noexcept {
		std::size_t i = 0;
		if (src) {
				for (; i + 1 < cap && src[i] != '\0'; i++)
						dst[i] = src[i];
		}
		dst[i] = '\0';
}
} // namespace

void ProgressSink::notify(std::uint8_t percent, const char* label) const noexcept {
		if (!available())
				return;
		if (percent > 100)
				percent = 100;
		vtable_->on_progress(ctx_, percent, label ? label : "");
}

ProgressSink ProgressSink::make(void* ctx, const ProgressSinkVTable* vtable) noexcept {
		ProgressSink s;
		s.ctx_ = ctx;
		s.vtable_ = vtable;
		return s;
}

const ProgressEntry& ProgressLog::at(std::size_t index) const noexcept {
		if (index >= count_)
				return last_;
		return entries_[index];
}

void ProgressLog::record(std::uint8_t percent, const char* label) noexcept {
		last_.percent = percent;
		copy_label(last_.label, sizeof(last_.label), label);
		seen_ = true;
		if (count_ < kCapacity)
				entries_[count_++] = last_;
}

void ProgressLog::clear() noexcept {
		count_ = 0;
		seen_ = false;
		last_ = ProgressEntry{};
}

ProgressSink ProgressLog::sink() noexcept {
		return ProgressSink::make(this, &kLogVTable);
}

} // namespace lowrank_core
