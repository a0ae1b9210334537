#ifndef JCX_DIVAN_VIEW_VIEW_PROVISIONER_H
#define JCX_DIVAN_VIEW_VIEW_PROVISIONER_H

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "jcailloux/divan/Errors.h"
#include "jcailloux/divan/Log.h"
#include "jcailloux/divan/config/accessor_config.h"
#include "jcailloux/divan/io/AsyncMutex.h"
#include "jcailloux/divan/io/Task.h"
#include "jcailloux/divan/io/store/DocumentStore.h"
#include "jcailloux/divan/view/DesignDocument.h"
#include "jcailloux/divan/view/FinderSpec.h"

namespace jcailloux::divan::view {

// =============================================================================
// ViewProvisioner — resolve-or-create of a finder's server-side view
//
//   1. fetch the design document (empty in-memory one if absent)
//   2. a view with the finder's name exists -> return it verbatim
//   3. otherwise append a view built from the FinderSpec and upsert the
//      whole design document
//
// An existing remote view is never compared with the local FinderSpec: if a
// finder's predicate/emit changes without a matching server update, the
// remote definition keeps being used.
//
// Unguarded mode is a plain read-modify-upsert. Two concurrent first
// resolutions on the same design document can both read "absent" and the
// later upsert replaces the earlier one, dropping its view. Guarded mode
// runs the whole sequence under an AsyncMutex, which covers every accessor
// sharing this provisioner (not other processes). guardedFor() hands out
// one Guarded provisioner per store, so guarded accessors over the same
// store exclude each other without being wired together explicitly.
// =============================================================================

class ViewProvisioner {
public:
    explicit ViewProvisioner(std::shared_ptr<io::DocumentStore> store,
                             config::ProvisioningMode mode = config::ProvisioningMode::Unguarded)
        : store_(std::move(store)), mode_(mode)
    {
        if (!store_) throw std::invalid_argument("ViewProvisioner: null document store");
    }

    ViewProvisioner(const ViewProvisioner&) = delete;
    ViewProvisioner& operator=(const ViewProvisioner&) = delete;

    [[nodiscard]] config::ProvisioningMode mode() const noexcept { return mode_; }

    /// The process-wide Guarded provisioner of `store`, created on first use.
    /// Lives as long as some accessor holds it.
    [[nodiscard]] static std::shared_ptr<ViewProvisioner> guardedFor(
        const std::shared_ptr<io::DocumentStore>& store)
    {
        if (!store) throw std::invalid_argument("ViewProvisioner: null document store");

        auto& reg = registry();
        std::lock_guard lock(reg.mutex);
        auto& slot = reg.guarded[store.get()];
        if (auto existing = slot.lock()) return existing;

        // A live provisioner keeps its store alive, so an expired slot is
        // the only way a store address can be reused.
        std::erase_if(reg.guarded, [](const auto& entry) { return entry.second.expired(); });
        auto created = std::make_shared<ViewProvisioner>(store, config::ProvisioningMode::Guarded);
        reg.guarded[store.get()] = created;
        return created;
    }

    io::Task<ViewDescriptor> resolve(std::string design, std::string finder, FinderSpec spec) {
        if (mode_ == config::ProvisioningMode::Unguarded) {
            co_return co_await resolveOrCreate(std::move(design), std::move(finder), std::move(spec));
        }

        co_await mutex_.lock();
        std::optional<ViewDescriptor> resolved;
        try {
            resolved = co_await resolveOrCreate(std::move(design), std::move(finder), std::move(spec));
        } catch (...) {
            mutex_.unlock();
            throw;
        }
        mutex_.unlock();
        co_return std::move(*resolved);
    }

private:
    io::Task<ViewDescriptor> resolveOrCreate(std::string design, std::string finder, FinderSpec spec) {
        std::optional<DesignDocument> fetched;
        try {
            fetched = co_await store_->getDesignDocument(design);
        } catch (const io::StoreError& e) {
            DIVAN_LOG_ERROR << "ViewProvisioner: cannot fetch design document " << design << " - " << e.what();
            throw RemoteUnavailableError("getDesignDocument " + design, e.what());
        }

        DesignDocument doc;
        if (fetched) {
            doc = std::move(*fetched);
        } else {
            DIVAN_LOG_INFO << "Design document " << design << " does not exist, creating it.";
            doc = DesignDocument::create(design);
        }

        DIVAN_LOG_DEBUG << "ViewProvisioner: " << design << " holds " << doc.views.size() << " view(s)";

        if (const auto* existing = doc.findView(finder)) {
            DIVAN_LOG_DEBUG << "ViewProvisioner: view " << finder << " returned from server";
            co_return *existing;
        }

        DIVAN_LOG_INFO << "View " << finder << " not present in " << design << ", creating.";

        ViewDescriptor created{finder, buildMapFunction(spec), std::nullopt};
        doc.views.push_back(created);

        try {
            co_await store_->upsertDesignDocument(std::move(doc));
        } catch (const io::StoreError& e) {
            DIVAN_LOG_ERROR << "ViewProvisioner: cannot upsert design document " << design << " - " << e.what();
            throw RemoteUnavailableError("upsertDesignDocument " + design, e.what());
        }
        co_return created;
    }

    struct Registry {
        std::mutex mutex;
        std::unordered_map<const io::DocumentStore*, std::weak_ptr<ViewProvisioner>> guarded;
    };

    static Registry& registry() {
        static Registry r;
        return r;
    }

    std::shared_ptr<io::DocumentStore> store_;
    config::ProvisioningMode mode_;
    io::AsyncMutex mutex_;
};

}  // namespace jcailloux::divan::view

#endif  // JCX_DIVAN_VIEW_VIEW_PROVISIONER_H
