//! # jemit JSON Emission Library
//!
//! Main public header. It pulls in the streaming writer and everything it is
//! built from.
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace jemit::json;
//!
//! auto ctx = make_rc<SerializerContext>();
//! ctx->register_function<Point>([](const Point& p, JsonWriter& out) {
//!     out.begin_object();
//!     out.write_property("x", p.x);
//!     out.write_property("y", p.y);
//!     out.end_object();
//! });
//!
//! StreamSink sink(std::cout);
//! JsonWriter writer(ctx, sink);
//! writer.write_value(std::vector<Point>{{1, 2}, {3, 4}});
//! writer.finish();
//! ```
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | `WriterError` hierarchy |
//! | `output_sink.hpp` | String, stream and file sinks |
//! | `json_text.hpp` | String escaping and number formatting |
//! | `indent_cache.hpp` | Cached indentation strings per depth |
//! | `field_name_encoder.hpp` | Property-name policies |
//! | `serializer.hpp` | Serializer interface and type-erased values |
//! | `serializer_context.hpp` | Type to serializer resolution |
//! | `json_writer.hpp` | The protocol-enforcing writer |

#pragma once

#include "json/field_name_encoder.hpp"
#include "json/indent_cache.hpp"
#include "json/json_error.hpp"
#include "json/json_text.hpp"
#include "json/json_writer.hpp"
#include "json/output_sink.hpp"
#include "json/serializer.hpp"
#include "json/serializer_context.hpp"
