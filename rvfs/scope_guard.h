// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_4721098561230984
#define SCOPE_GUARD_H_4721098561230984

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace rvfs
{
/*  Scope Guard

        auto guardTmp = rvfs::makeGuard<ScopeGuardRunMode::onFail>([&] { removeTempFile(); });
            ...
        guardTmp.dismiss();

    Scope Exit:
        RVFS_ON_SCOPE_EXIT   (closeSession());
        RVFS_ON_SCOPE_FAIL   (discardUpload());
        RVFS_ON_SCOPE_SUCCESS(resetCursor());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        //while unwinding, fun_ must not throw: cleanup code reports via logExtraError() instead
        switch (runMode)
        {
            case ScopeGuardRunMode::onExit:
                fun_(); //throw X (only if !failed)
                break;
            case ScopeGuardRunMode::onSuccess:
                if (!failed)
                    fun_(); //throw X
                break;
            case ScopeGuardRunMode::onFail:
                if (failed)
                    fun_();
                break;
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define RVFS_CONCAT_SUB(X, Y) X ## Y
#define RVFS_CONCAT(X, Y) RVFS_CONCAT_SUB(X, Y)

#define RVFS_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto RVFS_CONCAT(scopeGuard, __LINE__) = rvfs::makeGuard<rvfs::ScopeGuardRunMode::onExit   >([&]{ X; });
#define RVFS_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto RVFS_CONCAT(scopeGuard, __LINE__) = rvfs::makeGuard<rvfs::ScopeGuardRunMode::onFail   >([&]{ X; });
#define RVFS_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto RVFS_CONCAT(scopeGuard, __LINE__) = rvfs::makeGuard<rvfs::ScopeGuardRunMode::onSuccess>([&]{ X; });

#define RVFS_CHECK_CASE_FOR_CONSTANT(X) case X: return RVFS_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define RVFS_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#endif //SCOPE_GUARD_H_4721098561230984
