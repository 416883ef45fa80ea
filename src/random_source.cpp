// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <memory>

#include "random_source.hpp"

namespace luhn {

thread_local std::unique_ptr<random_source::engine_type> random_source::rng_ = nullptr;

} // namespace luhn
