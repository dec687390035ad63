#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Sanitizer
// ═══════════════════════════════════════════════════════════════════════════
// Converts an arbitrary Value graph into a JSON-safe one: only null, bool,
// numbers, strings, lists/tuples and string-keyed maps remain. The output is
// built from fresh nodes and never shares a node with the input.
//
// Resolution order for each node (first match wins):
//   1. Timestamp / Date        -> ISO-8601 string
//   2. Object with dump()      -> dump (JSON mode, then native), re-sanitized
//   3. Object with attributes()/to_mapping() -> map of public attributes
//   4. Scalars                 -> unchanged
//   5. List / Tuple            -> element-wise, sequence kind preserved
//   6. Map                     -> value-wise, keys coerced to strings
//   7. Other objects           -> to_string(), or null if that throws
//
// A node that is reached again while it is still being converted (a cycle)
// is replaced by kCircularReference instead of being descended into again.
// The same node reached through two independent branches is converted
// independently each time. Compound nodes nested kMaxSanitizeDepth levels
// below the root are replaced by null, with a warning.

#include "memcp/value/value.hpp"

#include <cstddef>
#include <string_view>

namespace memcp {

inline constexpr std::string_view kCircularReference = "[Circular]";
inline constexpr std::size_t kDefaultMaxSanitizePasses = 4;
inline constexpr std::size_t kMaxSanitizeDepth = 512;

/// One sanitizing pass. Never throws for finite or cyclic inputs.
[[nodiscard]] Value sanitize(const Value& value);

struct SanitizeOutcome {
    Value value;
    std::size_t passes{0};
    bool converged{false};   // Last pass reproduced its input
};

/// Applies sanitize() until the result stops changing, at most max_passes
/// times (a max_passes of 0 is treated as 1).
[[nodiscard]] SanitizeOutcome sanitize_to_fixed_point(
    const Value& value,
    std::size_t max_passes = kDefaultMaxSanitizePasses);

/// True when the graph only holds JSON-safe kinds. Expects an acyclic graph.
[[nodiscard]] bool is_json_safe(const Value& value);

}  // namespace memcp
