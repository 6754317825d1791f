// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_2390458127345098123
#define SCOPE_GUARD_H_2390458127345098123

#include <exception> //std::uncaught_exceptions
#include <type_traits>
#include <utility>


namespace heat
{
/*  Scope Guard

        auto guardDepth = heat::makeGuard<ScopeGuardRunMode::onExit>([&] { --callbackDepth_; });
            ...
        guardDepth.dismiss();

    Scope Exit:
        HEAT_ON_SCOPE_EXIT   (cleanUp());
        HEAT_ON_SCOPE_FAIL   (undoTemporaryWork());
        HEAT_ON_SCOPE_SUCCESS(notifySuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool /*failed*/, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    fun(); //throw X: only if !failed, a second exception while unwinding terminates
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
        fun(); //must not throw
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

#define HEAT_CONCAT_SUB(X, Y) X ## Y
#define HEAT_CONCAT(X, Y) HEAT_CONCAT_SUB(X, Y)

#define HEAT_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto HEAT_CONCAT(scopeGuard, __LINE__) = heat::makeGuard<heat::ScopeGuardRunMode::onExit   >([&]{ X; });
#define HEAT_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto HEAT_CONCAT(scopeGuard, __LINE__) = heat::makeGuard<heat::ScopeGuardRunMode::onFail   >([&]{ X; });
#define HEAT_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto HEAT_CONCAT(scopeGuard, __LINE__) = heat::makeGuard<heat::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_2390458127345098123
