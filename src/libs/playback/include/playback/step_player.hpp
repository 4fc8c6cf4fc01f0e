#pragma once

#include <cstddef>

namespace playback {

// Replay cursor over a recorded step sequence. tick() drives autoplay: one
// step per elapsed interval, stopping on the last step.
class StepPlayer {
public:
    StepPlayer();
    explicit StepPlayer(std::size_t step_count);

    void set_step_count(std::size_t step_count);
    std::size_t step_count() const { return step_count_; }

    void set_interval(float seconds) { interval_ = seconds; }
    float interval() const { return interval_; }

    std::size_t cursor() const { return cursor_; }
    bool at_end() const { return step_count_ == 0 || cursor_ + 1 >= step_count_; }

    bool next();
    bool previous();
    void seek(std::size_t index);
    void reset();

    void play();
    void pause() { playing_ = false; }
    bool is_playing() const { return playing_; }

    // Returns the number of steps advanced.
    std::size_t tick(float dt);

private:
    std::size_t step_count_ = 0;
    std::size_t cursor_ = 0;
    float interval_ = 0.3f;
    float elapsed_ = 0.0f;
    bool playing_ = false;
};

} // namespace playback
