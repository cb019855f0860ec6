// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef EXEC_CONTEXT_H_2938475610293847561
#define EXEC_CONTEXT_H_2938475610293847561

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>


namespace vfs
{
//cancellation and deadline for connection setup (dial + login); copies share the cancel flag
class ExecContext
{
public:
    ExecContext() {}
    explicit ExecContext(std::chrono::steady_clock::time_point deadline) : deadline_(deadline) {}

    static ExecContext withTimeout(std::chrono::milliseconds timeout) { return ExecContext(std::chrono::steady_clock::now() + timeout); }

    void cancel() { *cancelled_ = true; }

    bool isDone() const
    {
        return *cancelled_ || (deadline_ && std::chrono::steady_clock::now() >= *deadline_);
    }

    const std::optional<std::chrono::steady_clock::time_point>& getDeadline() const { return deadline_; }

private:
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_ = std::make_shared<std::atomic<bool>>(false);
};
}

#endif //EXEC_CONTEXT_H_2938475610293847561
