// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <memory>
#include <random>

namespace luhn {

// Per-thread engine, lazily seeded from std::random_device.
class random_source {
public:
    using engine_type = std::mt19937_64;

    static void seed(engine_type::result_type value)
    {
        rng_ = std::make_unique<engine_type>(value);
    }

    static engine_type &engine()
    {
        if (!rng_) {
            rng_ = std::make_unique<engine_type>(std::random_device{}());
        }
        return *rng_;
    }

protected:
    static thread_local std::unique_ptr<engine_type> rng_;
};

} // namespace luhn
