// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <atomic>

namespace lib
{
    class spinlock
    {
        private:
        std::atomic_flag _locked { };

        public:
        constexpr spinlock() = default;

        spinlock(const spinlock &) = delete;
        spinlock &operator=(const spinlock &) = delete;

        void lock()
        {
            while (_locked.test_and_set(std::memory_order_acquire))
            {
                while (_locked.test(std::memory_order_relaxed))
                    __builtin_ia32_pause();
            }
        }

        bool try_lock()
        {
            return !_locked.test_and_set(std::memory_order_acquire);
        }

        void unlock()
        {
            _locked.clear(std::memory_order_release);
        }

        bool is_locked() const
        {
            return _locked.test(std::memory_order_relaxed);
        }
    };
} // namespace lib
