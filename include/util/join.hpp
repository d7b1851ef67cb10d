#pragma once

#include <functional>
#include <optional>
#include <utility>

namespace filetar {

// Fan-in of two independent outcomes: done runs once, after both are set.
template <typename First, typename Second>
class Join2 {
public:
    using Done = std::function<void(First, Second)>;

    Join2() = default;
    explicit Join2(Done done) : done_(std::move(done)) {}

    void OnDone(Done done) { done_ = std::move(done); }

    void SetFirst(First v) {
        if (fired_ || first_) return;
        first_.emplace(std::move(v));
        Fire();
    }

    void SetSecond(Second v) {
        if (fired_ || second_) return;
        second_.emplace(std::move(v));
        Fire();
    }

    bool HasFirst() const { return first_.has_value(); }
    bool HasSecond() const { return second_.has_value(); }
    bool Fired() const { return fired_; }

    // Drops stored outcomes; done never runs.
    void Abandon() {
        fired_ = true;
        first_.reset();
        second_.reset();
        done_ = nullptr;
    }

private:
    void Fire() {
        if (!first_ || !second_) return;
        fired_ = true;
        auto done = std::move(done_);
        First a = std::move(*first_);
        Second b = std::move(*second_);
        first_.reset();
        second_.reset();
        if (done) done(std::move(a), std::move(b));
    }

    std::optional<First> first_;
    std::optional<Second> second_;
    Done done_;
    bool fired_ = false;
};

} // namespace filetar
