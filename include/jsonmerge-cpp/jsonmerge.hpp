/// @file jsonmerge.hpp
/// @brief Umbrella header for the jsonmerge-cpp library.
///
/// Include this single header for access to all public types:
/// Json, Pointer, Container, Operation, Patch, ApplyOptions, PatchError,
/// and the apply functions.

#pragma once

#include <jsonmerge-cpp/container.hpp>
#include <jsonmerge-cpp/engine.hpp>
#include <jsonmerge-cpp/error.hpp>
#include <jsonmerge-cpp/operation.hpp>
#include <jsonmerge-cpp/options.hpp>
#include <jsonmerge-cpp/patch.hpp>
#include <jsonmerge-cpp/pointer.hpp>
#include <jsonmerge-cpp/resolver.hpp>
#include <jsonmerge-cpp/value.hpp>
