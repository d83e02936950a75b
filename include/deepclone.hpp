//! # deepclone
//!
//! Runtime deep cloning of object graphs. Include this header for the whole
//! public surface: the object model, type registration, the `clone()` entry
//! point and plan cache administration.

#pragma once

#include "cache/cache_config.hpp"
#include "cache/plan_cache.hpp"
#include "core/clone.hpp"
#include "core/errors.hpp"
#include "core/identity_map.hpp"
#include "plan/classifier.hpp"
#include "plan/clone_plan.hpp"
#include "plan/plan_compiler.hpp"
#include "reflect/type_builder.hpp"
#include "reflect/type_info.hpp"
#include "reflect/type_registry.hpp"
#include "runtime/array.hpp"
#include "runtime/delegate.hpp"
#include "runtime/object.hpp"
