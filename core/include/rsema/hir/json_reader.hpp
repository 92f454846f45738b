// rsema/hir/json_reader.hpp - Build HIR from its JSON interchange form
//
// The upstream lowering pass hands programs over as JSON:
//
//   {
//     "items": [
//       { "kind": "fn", "name": "first", "lifetime_params": ["a"],
//         "params": [ { "name": "xs", "type": { "kind": "ref", "lifetime": "a",
//                                                "inner": { "kind": "vec", "element": "i32" } } } ],
//         "return": { "kind": "ref", "inner": "i32" },
//         "body": [ { "let": "n", "type": "i32", "init": { "kind": "int", "value": 1 } } ],
//         "tail": { "kind": "var", "name": "n" } },
//       { "kind": "impl", "id": "counter_iter", "trait": "Iterator", "self": "Counter",
//         "assoc": [ { "name": "Item", "type": "u32" } ], "methods": [] }
//     ]
//   }
//
// A bare string is shorthand for a named type; bare JSON numbers and
// booleans are shorthand for literals.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "rsema/basic/result.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/hir/hir_context.hpp"

namespace rsema
{

/// Parse a program from JSON text. Nodes are allocated in `ctx`.
[[nodiscard]] Result<Program *, std::string> read_program_json(
  std::string_view text, HirContext & ctx);

/// Read and parse a program file.
[[nodiscard]] Result<Program *, std::string> read_program_file(
  const std::filesystem::path & path, HirContext & ctx);

}  // namespace rsema
