// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace httprpc
{

/// Generates random RFC 4122 version 4 UUID strings for request ids
///
/// Thread-safe. Each instance seeds its own engine from std::random_device.
class IdGenerator
{
  public:
    IdGenerator() : engine_(seed()) {}

    // Non-copyable (owns an engine state that must not be duplicated)
    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    /// Next id, e.g. "3b241101-e2bb-4255-8caf-4136c566a962"
    std::string next()
    {
        uint64_t hi;
        uint64_t lo;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hi = engine_();
            lo = engine_();
        }

        // Version 4, variant 10xx
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (int i = 0; i < 32; ++i)
        {
            if (i == 8 || i == 12 || i == 16 || i == 20)
                out += '-';
            uint64_t word = i < 16 ? hi : lo;
            int shift = 60 - 4 * (i % 16);
            out += hex[(word >> shift) & 0xF];
        }
        return out;
    }

  private:
    static std::mt19937_64 seed()
    {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }

    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace httprpc
