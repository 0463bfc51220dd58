/// @file nodeedit.hpp
/// @brief Umbrella header for the nodeedit-cpp library.
///
/// Include this single header for access to all public types:
/// JsonValue, Path, NodeRow, NodeData, the path and row functions,
/// DraftValidator, the store interfaces, EditSession, Logger and Error.

#pragma once

#include <nodeedit-cpp/draft.hpp>
#include <nodeedit-cpp/error.hpp>
#include <nodeedit-cpp/json.hpp>
#include <nodeedit-cpp/log.hpp>
#include <nodeedit-cpp/path.hpp>
#include <nodeedit-cpp/rows.hpp>
#include <nodeedit-cpp/session.hpp>
#include <nodeedit-cpp/store.hpp>
#include <nodeedit-cpp/types.hpp>
