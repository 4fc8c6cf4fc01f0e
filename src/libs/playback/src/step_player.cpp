#include <playback/step_player.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace playback {

StepPlayer::StepPlayer() = default;

StepPlayer::StepPlayer(std::size_t step_count) : step_count_(step_count) {}

void StepPlayer::set_step_count(std::size_t step_count) {
    step_count_ = step_count;
    seek(cursor_);
}

bool StepPlayer::next() {
    if (at_end()) return false;
    ++cursor_;
    return true;
}

bool StepPlayer::previous() {
    if (cursor_ == 0) return false;
    --cursor_;
    return true;
}

void StepPlayer::seek(std::size_t index) {
    cursor_ = step_count_ == 0 ? 0 : std::min(index, step_count_ - 1);
}

void StepPlayer::reset() {
    cursor_ = 0;
    elapsed_ = 0.0f;
    playing_ = false;
}

void StepPlayer::play() {
    if (at_end()) return;
    playing_ = true;
    elapsed_ = 0.0f;
}

std::size_t StepPlayer::tick(float dt) {
    if (!playing_ || dt <= 0.f) return 0;
    if (interval_ <= 0.f) {
        const std::size_t moved = at_end() ? 0 : step_count_ - 1 - cursor_;
        cursor_ += moved;
        playing_ = false;
        return moved;
    }

    elapsed_ += dt;
    std::size_t moved = 0;
    while (elapsed_ >= interval_ && next()) {
        elapsed_ -= interval_;
        ++moved;
    }
    if (at_end()) {
        playing_ = false;
        elapsed_ = 0.0f;
        spdlog::debug("playback_finished cursor={} steps={}", cursor_, step_count_);
    }
    return moved;
}

} // namespace playback
