#ifndef JCX_DIVAN_IO_STORE_VIEW_QUERY_H
#define JCX_DIVAN_IO_STORE_VIEW_QUERY_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jcailloux::divan::io {

// =============================================================================
// Staleness — how up to date the view index must be before rows are returned
// =============================================================================

enum class Stale : uint8_t {
    False,        // update the index first (reflects recent writes)
    Ok,           // serve the index as it is
    UpdateAfter   // serve as-is, then trigger an index update
};

[[nodiscard]] constexpr std::string_view staleParam(Stale s) noexcept {
    switch (s) {
        case Stale::False:       return "false";
        case Stale::Ok:          return "ok";
        case Stale::UpdateAfter: return "update_after";
    }
    return "false";
}

namespace detail {

inline void appendPercentEncoded(std::string& out, std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    for (unsigned char c : in) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
}

}  // namespace detail

// =============================================================================
// ViewQuery — one request against a (design document, view) pair
// =============================================================================

struct ViewQuery {
    std::string design;
    std::string view;
    Stale stale = Stale::False;

    /// JSON-encoded key to match exactly (e.g. "\"ACTIVE\"" or "42").
    std::optional<std::string> key;
    std::optional<size_t> limit;
    size_t skip = 0;
    bool descending = false;

    /// Rows carry the full document body.
    bool include_docs = true;

    /// Query-string form used by HTTP view endpoints:
    ///   stale=false&include_docs=true&key=%22ACTIVE%22&limit=10
    [[nodiscard]] std::string toQueryString() const {
        std::string qs;
        qs.reserve(64);
        qs += "stale=";
        qs += staleParam(stale);
        if (include_docs) qs += "&include_docs=true";
        if (key) {
            qs += "&key=";
            detail::appendPercentEncoded(qs, *key);
        }
        if (limit) {
            qs += "&limit=";
            qs += std::to_string(*limit);
        }
        if (skip > 0) {
            qs += "&skip=";
            qs += std::to_string(skip);
        }
        if (descending) qs += "&descending=true";
        return qs;
    }

    /// Path of the view endpoint relative to the bucket root.
    [[nodiscard]] std::string path() const {
        return "_design/" + design + "/_view/" + view;
    }
};

// =============================================================================
// ViewRow / ViewResult — raw rows in index order
// =============================================================================

struct ViewRow {
    std::string id;        // document key
    std::string key;       // emitted key, raw JSON
    std::string value;     // emitted value, raw JSON
    std::string document;  // document content, raw JSON (include_docs)
};

struct ViewResult {
    std::vector<ViewRow> rows;
    size_t total_rows = 0;
};

}  // namespace jcailloux::divan::io

#endif  // JCX_DIVAN_IO_STORE_VIEW_QUERY_H
