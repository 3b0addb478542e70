/**
 * @file clock.hpp
 * @brief Timestamp source for task history entries.
 *
 * The engine never reads the system clock directly so that history and
 * createdAt values are reproducible in tests.
 */

#pragma once

#include "core/types.hpp"

namespace conductor {

class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{}) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_; }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }
    void set(Timestamp t) { now_ = t; }

private:
    Timestamp now_;
};

}  // namespace conductor
