#ifndef JCX_DIVAN_VIEW_DESIGN_DOCUMENT_H
#define JCX_DIVAN_VIEW_DESIGN_DOCUMENT_H

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>

namespace jcailloux::divan::view {

// =============================================================================
// ViewDescriptor — a named, server-persisted view definition
// =============================================================================

struct ViewDescriptor {
    std::string name;
    std::string map;
    std::optional<std::string> reduce;

    bool operator==(const ViewDescriptor&) const = default;
};

namespace detail {

// Wire shape of a design document body:
//   {"views":{"findByStatus":{"map":"function (doc, meta) {...}"}}}
struct WireView {
    std::string map;
    std::optional<std::string> reduce;
};

struct WireDesignDocument {
    std::map<std::string, WireView> views;
};

}  // namespace detail

// =============================================================================
// DesignDocument — named container of views, one per entity type
//
// views keeps catalog order (the order the store returned them, then the
// order they were appended). The wire form is keyed by view name.
// =============================================================================

struct DesignDocument {
    std::string name;
    std::vector<ViewDescriptor> views;

    bool operator==(const DesignDocument&) const = default;

    [[nodiscard]] static DesignDocument create(std::string name) {
        return DesignDocument{std::move(name), {}};
    }

    [[nodiscard]] const ViewDescriptor* findView(std::string_view view_name) const noexcept {
        auto it = std::find_if(views.begin(), views.end(),
            [&](const ViewDescriptor& v) { return v.name == view_name; });
        return it != views.end() ? &*it : nullptr;
    }

    /// Serialize the body (without the name, which lives in the document id).
    /// Returns nullopt if glaze fails to write.
    [[nodiscard]] std::optional<std::string> toJson() const {
        detail::WireDesignDocument wire;
        for (const auto& v : views) {
            wire.views[v.name] = detail::WireView{v.map, v.reduce};
        }
        std::string out;
        if (glz::write_json(wire, out)) return std::nullopt;
        return out;
    }

    /// Parse a body returned by the store. Unknown members (e.g. "language")
    /// are ignored. Returns nullopt on malformed JSON.
    [[nodiscard]] static std::optional<DesignDocument> fromJson(std::string name, std::string_view json) {
        detail::WireDesignDocument wire;
        if (glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, json)) {
            return std::nullopt;
        }
        DesignDocument doc{std::move(name), {}};
        doc.views.reserve(wire.views.size());
        for (auto& [view_name, body] : wire.views) {
            doc.views.push_back(ViewDescriptor{view_name, std::move(body.map), std::move(body.reduce)});
        }
        return doc;
    }
};

}  // namespace jcailloux::divan::view

#endif  // JCX_DIVAN_VIEW_DESIGN_DOCUMENT_H
