// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_3096714520987341
#define SCOPE_GUARD_H_3096714520987341

#include <exception>
#include <type_traits>
#include <utility>


namespace sshb
{
/*  Scope Guard

        auto guardHandle = sshb::makeGuard<ScopeGuardRunMode::onExit>([&] { closeHandle(h); });
            ...
        guardHandle.dismiss();

    Scope Exit:
        SSHB_ON_SCOPE_EXIT   (cleanUp());
        SSHB_ON_SCOPE_FAIL   (undoTemporaryWork());
        SSHB_ON_SCOPE_SUCCESS(notifySuccess());

    clean up code running while an exception is in flight must not throw!  */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool /*failed*/, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    fun(); //throw X (only if not failed!)
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onSuccess>)
{
    if (!failed)
        fun(); //throw X
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onFail>) noexcept
{
    if (failed)
        fun(); //std::terminate() if violating nothrow contract
}


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
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;
            runScopeGuardDestructor(fun_, failed, std::integral_constant<ScopeGuardRunMode, runMode>());
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

#define SSHB_CONCAT_SUB(X, Y) X ## Y
#define SSHB_CONCAT(X, Y) SSHB_CONCAT_SUB(X, Y)

#define SSHB_CHECK_CASE_FOR_CONSTANT(X) case X: return #X

#define SSHB_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto SSHB_CONCAT(scopeGuard, __LINE__) = sshb::makeGuard<sshb::ScopeGuardRunMode::onExit   >([&]{ X; });
#define SSHB_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto SSHB_CONCAT(scopeGuard, __LINE__) = sshb::makeGuard<sshb::ScopeGuardRunMode::onFail   >([&]{ X; });
#define SSHB_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto SSHB_CONCAT(scopeGuard, __LINE__) = sshb::makeGuard<sshb::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_3096714520987341
