#pragma once

/// @file patchguard.hpp
/// @brief Main header file for the patchguard library.
///
/// @code
///   auto doc    = patchguard::parse(R"({"items":["a","b"]})");
///   auto schema = patchguard::parse(R"({"type":"object","properties":{"items":{"type":"array"}}})");
///   auto ops    = patchguard::parse_patch_ops(patchguard::parse(
///       R"([{"op":"add","path":"/items/-","value":"c"}])"));
///
///   auto out = patchguard::submit_patches(doc, ops, &schema);
///   if (out.result.ok) doc = out.result.final_doc;
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "serializer.hpp"
#include "parser.hpp"
#include "json_pointer.hpp"
#include "patch_op.hpp"
#include "patch.hpp"
#include "schema.hpp"
#include "formats.hpp"
#include "validator.hpp"
#include "guard.hpp"
#include "engine.hpp"
#include "truncator.hpp"
#include "inspect.hpp"
#include "read_value.hpp"
#include "search.hpp"
