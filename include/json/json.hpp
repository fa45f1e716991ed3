//! # JSON
//!
//! Value model, parser and serializer used for the on-disk comment sets.
//!
//! ```cpp
//! auto parsed = vcm::json::parse_json(text);
//! if (vcm::is_ok(parsed)) {
//!     const auto& doc = vcm::unwrap(parsed);
//!     const auto* file = doc.get("file");
//! }
//! ```

#pragma once

#include "json/json_error.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
