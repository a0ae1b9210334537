#ifndef JCX_DIVAN_VIEW_FINDER_SPEC_H
#define JCX_DIVAN_VIEW_FINDER_SPEC_H

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace jcailloux::divan::view {

// =============================================================================
// FinderSpec — declarative (predicate, emission) pair behind one finder
//
// Declared once per finder name, e.g.
//   {"findByStatus", {"doc.status == \"ACTIVE\"", "emit(meta.id, null)"}}
// =============================================================================

struct FinderSpec {
    std::string predicate;
    std::string emit;

    bool operator==(const FinderSpec&) const = default;
};

/// Finder name -> spec, for one entity type.
using FinderTable = std::map<std::string, FinderSpec, std::less<>>;

/// Per-call arguments of a finder. key is JSON-encoded.
struct FinderArgs {
    std::optional<std::string> key;
    std::optional<size_t> limit;
    size_t skip = 0;
    bool descending = false;
};

/// Map function source stored on the server for a finder.
[[nodiscard]] inline std::string buildMapFunction(const FinderSpec& spec) {
    std::string fn;
    fn.reserve(64 + spec.predicate.size() + spec.emit.size());
    fn += "function (doc, meta) {\n";
    fn += "  if (";
    fn += spec.predicate;
    fn += ") {\n";
    fn += "    ";
    fn += spec.emit;
    fn += ";\n";
    fn += "  }\n";
    fn += "}";
    return fn;
}

}  // namespace jcailloux::divan::view

#endif  // JCX_DIVAN_VIEW_FINDER_SPEC_H
