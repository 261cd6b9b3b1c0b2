#pragma once

/// lease - scoped resource lifetimes over a pluggable host effect
///
/// Include this file to get the factory combinators, the shipped host
/// effects and the coroutine runtime that task_effect runs on.

#define LEASE_VERSION_MAJOR 0
#define LEASE_VERSION_MINOR 1
#define LEASE_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Coroutines and runtime
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "runtime/scheduler.hpp"
#include "runtime/async_main.hpp"

// Host effects
#include "effect/concepts.hpp"
#include "effect/outcome.hpp"
#include "effect/errors.hpp"
#include "effect/identity.hpp"
#include "effect/immediate.hpp"
#include "effect/task_effect.hpp"

// Factories and their combinators
#include "core/handle.hpp"
#include "core/factory.hpp"
#include "core/construct.hpp"
#include "core/bind.hpp"
#include "core/ap.hpp"
#include "core/error.hpp"
#include "core/race.hpp"

