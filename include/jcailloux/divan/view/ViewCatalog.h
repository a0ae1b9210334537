#ifndef JCX_DIVAN_VIEW_VIEW_CATALOG_H
#define JCX_DIVAN_VIEW_VIEW_CATALOG_H

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "jcailloux/divan/view/DesignDocument.h"

namespace jcailloux::divan::view {

// =============================================================================
// ViewCatalog — finder name -> resolved view, owned by one accessor
//
// Not thread-safe. Filled by a single-threaded rebuild before any dispatch;
// afterwards dispatchers only call find(). Never invalidated implicitly.
// =============================================================================

class ViewCatalog {
    struct Hash {
        using is_transparent = void;
        size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };

public:
    void clear() noexcept { views_.clear(); }

    void put(std::string finder, ViewDescriptor view) {
        views_.insert_or_assign(std::move(finder), std::move(view));
    }

    /// nullptr when the finder has no cached view.
    [[nodiscard]] const ViewDescriptor* find(std::string_view finder) const noexcept {
        auto it = views_.find(finder);
        return it != views_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view finder) const noexcept {
        return views_.find(finder) != views_.end();
    }

    [[nodiscard]] size_t size() const noexcept { return views_.size(); }
    [[nodiscard]] bool empty() const noexcept { return views_.empty(); }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(views_.size());
        for (const auto& [name, _] : views_) out.push_back(name);
        return out;
    }

    void swap(ViewCatalog& other) noexcept { views_.swap(other.views_); }

private:
    std::unordered_map<std::string, ViewDescriptor, Hash, std::equal_to<>> views_;
};

}  // namespace jcailloux::divan::view

#endif  // JCX_DIVAN_VIEW_VIEW_CATALOG_H
