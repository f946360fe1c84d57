// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GLOBALS_H_5509173240982245
#define GLOBALS_H_5509173240982245

#include <atomic>
#include <memory>
#include <utility>


namespace sshb
{
/*  process-wide singletons: libssh2 initializer, extra log, translation handler

    - constinit: usable before main() and after static destruction has begun
      e.g. a session's destructor on a late thread calls logExtraError()
    - callers share ownership via get(): the instance lives until the last user lets go
    - the storage itself is trivially destructible: a spin lock instead of std::mutex  */
template <class T>
class Global //namespace scope only!
{
public:
    consteval Global() {}

    ~Global()
    {
        std::shared_ptr<T>* oldInst = nullptr;
        {
            SpinLock dummy(lockFlag_);
            oldInst = std::exchange(inst_, nullptr);
            destroyed_ = true;
        }
        delete oldInst;
    }

    std::shared_ptr<T> get() //nullptr before initialization or after destruction
    {
        SpinLock dummy(lockFlag_);
        return inst_ ? *inst_ : nullptr;
    }

    void set(std::unique_ptr<T>&& newInst)
    {
        std::shared_ptr<T>* tmpInst = newInst ? new std::shared_ptr<T>(std::move(newInst)) : nullptr;
        {
            SpinLock dummy(lockFlag_);
            if (!destroyed_)
                std::swap(inst_, tmpInst);
            initialized_ = true;
        }
        delete tmpInst;
    }

    //lazy initialization from any thread; a throwing factory leaves the global uninitialized
    template <class Function>
    void setOnce(Function makeInstance /*-> std::unique_ptr<T>*/)
    {
        SpinLock dummy(lockFlag_);
        if (!initialized_ && !destroyed_)
        {
            if (std::unique_ptr<T> newInst = makeInstance()) //throw X
                inst_ = new std::shared_ptr<T>(std::move(newInst));
            initialized_ = true;
        }
    }

private:
    Global           (const Global&) = delete;
    Global& operator=(const Global&) = delete;

    class SpinLock
    {
    public:
        explicit SpinLock(std::atomic_flag& flag) : flag_(flag)
        {
            while (flag_.test_and_set(std::memory_order_acquire))
                flag_.wait(true, std::memory_order_relaxed);
        }
        ~SpinLock()
        {
            flag_.clear(std::memory_order_release);
            flag_.notify_one();
        }
    private:
        std::atomic_flag& flag_;
    };

    std::atomic_flag lockFlag_{}; //C++20: clear state by static initialization
    std::shared_ptr<T>* inst_ = nullptr;
    bool initialized_ = false;
    bool destroyed_ = false;
};
}

#endif //GLOBALS_H_5509173240982245
