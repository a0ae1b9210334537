#ifndef JCX_DIVAN_ACCESSOR_H
#define JCX_DIVAN_ACCESSOR_H

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jcailloux/divan/Errors.h"
#include "jcailloux/divan/Log.h"
#include "jcailloux/divan/accessor/FinderExecutor.h"
#include "jcailloux/divan/config/FixedString.h"
#include "jcailloux/divan/config/accessor_config.h"
#include "jcailloux/divan/io/Task.h"
#include "jcailloux/divan/io/store/DocumentStore.h"
#include "jcailloux/divan/view/FinderSpec.h"
#include "jcailloux/divan/view/ViewCatalog.h"
#include "jcailloux/divan/view/ViewProvisioner.h"
#include "jcailloux/divan/wrapper/Serializer.h"

namespace jcailloux::divan {

// =========================================================================
// Accessor - typed CRUD and declared finders for one entity type
// =========================================================================
//
// Name is the entity's stable name. Its upper-case form is both the key
// namespace ("ACCOUNT:<id>") and the design document holding the finders'
// views ("ACCOUNT").
//
//   using Accounts = Accessor<Account, "Account">;
//   Accounts accounts{store, {
//       {"findByStatus", {"doc.status == \"ACTIVE\"", "emit(meta.id, null)"}},
//   }};
//   co_await accounts.rebuildViews();
//   auto active = co_await accounts.invokeFinder("findByStatus");
//
// Every operation is a lazy io::Task and reports failure by throwing from
// co_await (see Errors.h). The accessor must outlive the tasks it returns.
//
// The view catalog is per instance and not synchronized: call rebuildViews()
// once, before dispatching finders from several threads.
//

template<JsonEntity Entity, config::FixedString Name, config::AccessorConfig Cfg = config::Default>
class Accessor : public FinderExecutor<Entity> {
    using Codec = wrapper::Serializer<Entity>;

    static constexpr auto upper_name_ = Name.upper();

public:
    using EntityType = Entity;

    static constexpr auto config = Cfg;
    static constexpr const char* name() { return Name; }

    /// Design document holding this entity's views.
    static constexpr std::string_view designDocumentName() { return upper_name_.view(); }

    /// "<NAME_UPPERCASE>:<id>"
    [[nodiscard]] static std::string makeKey(std::string_view id) {
        std::string key;
        key.reserve(designDocumentName().size() + 1 + id.size());
        key += designDocumentName();
        key += ':';
        key += id;
        return key;
    }

    explicit Accessor(std::shared_ptr<io::DocumentStore> store, view::FinderTable finders = {})
        : Accessor(std::move(store), nullptr, std::move(finders)) {}

    /// Share a provisioner between accessors (Guarded mode then serializes
    /// their resolve-or-create sequences together). Without one, Guarded
    /// accessors use ViewProvisioner::guardedFor(store).
    Accessor(std::shared_ptr<io::DocumentStore> store,
             std::shared_ptr<view::ViewProvisioner> provisioner,
             view::FinderTable finders = {})
        : store_(std::move(store))
        , provisioner_(std::move(provisioner))
        , finders_(std::move(finders))
    {
        if (!store_) throw std::invalid_argument(std::string(name()) + ": null document store");
        if (!provisioner_) {
            if constexpr (Cfg.provisioning == config::ProvisioningMode::Guarded) {
                provisioner_ = view::ViewProvisioner::guardedFor(store_);
            } else {
                provisioner_ = std::make_shared<view::ViewProvisioner>(store_, Cfg.provisioning);
            }
        }
    }

    Accessor(const Accessor&) = delete;
    Accessor& operator=(const Accessor&) = delete;

    // =====================================================================
    // CRUD
    // =====================================================================

    /// Insert a new document. DuplicateKeyError if the key is occupied.
    io::Task<void> create(std::string id, Entity entity)
        requires (!Cfg.read_only)
    {
        auto key = makeKey(id);
        DIVAN_LOG_DEBUG << name() << ": create " << key;
        auto json = encode(entity);
        try {
            co_await store_->insert(key, std::move(json));
        } catch (const io::DocumentExistsError&) {
            DIVAN_LOG_WARN << name() << ": create on occupied key " << key;
            throw DuplicateKeyError(key);
        } catch (const io::StoreError& e) {
            throw remoteError("insert", key, e);
        }
    }

    /// Completes with the entity, NotFoundError or DeserializationError.
    io::Task<Entity> read(std::string id) {
        auto key = makeKey(id);
        DIVAN_LOG_DEBUG << name() << ": read " << key;
        std::optional<std::string> raw;
        try {
            raw = co_await store_->get(key);
        } catch (const io::StoreError& e) {
            throw remoteError("get", key, e);
        }
        if (!raw) {
            DIVAN_LOG_WARN << name() << ": read on absent key " << key;
            throw NotFoundError(key);
        }
        co_return decode(*raw);
    }

    /// Replace an existing document. NotFoundError if absent.
    io::Task<void> update(std::string id, Entity entity)
        requires (!Cfg.read_only)
    {
        auto key = makeKey(id);
        DIVAN_LOG_DEBUG << name() << ": update " << key;
        auto json = encode(entity);
        try {
            co_await store_->replace(key, std::move(json));
        } catch (const io::DocumentNotFoundError&) {
            DIVAN_LOG_WARN << name() << ": update on absent key " << key;
            throw NotFoundError(key);
        } catch (const io::StoreError& e) {
            throw remoteError("replace", key, e);
        }
    }

    /// Remove a document. NotFoundError if absent.
    io::Task<void> erase(std::string id)
        requires (!Cfg.read_only)
    {
        auto key = makeKey(id);
        DIVAN_LOG_DEBUG << name() << ": erase " << key;
        try {
            co_await store_->remove(key);
        } catch (const io::DocumentNotFoundError&) {
            DIVAN_LOG_WARN << name() << ": erase on absent key " << key;
            throw NotFoundError(key);
        } catch (const io::StoreError& e) {
            throw remoteError("remove", key, e);
        }
    }

    /// Upsert: creates or replaces.
    io::Task<void> set(std::string id, Entity entity)
        requires (!Cfg.read_only)
    {
        auto key = makeKey(id);
        DIVAN_LOG_DEBUG << name() << ": set " << key;
        auto json = encode(entity);
        try {
            co_await store_->upsert(key, std::move(json));
        } catch (const io::StoreError& e) {
            throw remoteError("upsert", key, e);
        }
    }

    // =====================================================================
    // Finders
    // =====================================================================

    /// Clear the view catalog, then resolve (creating when absent) the view
    /// of every registered finder. On failure the catalog is left empty.
    io::Task<void> rebuildViews() {
        views_.clear();
        DIVAN_LOG_INFO << "Scanning " << name() << " for declared finders ...";

        view::ViewCatalog rebuilt;
        for (const auto& [finder, spec] : finders_) {
            auto resolved = co_await provisioner_->resolve(
                std::string(designDocumentName()), finder, spec);
            DIVAN_LOG_DEBUG << name() << ": caching view " << resolved.name;
            rebuilt.put(finder, std::move(resolved));
        }
        views_.swap(rebuilt);
    }

    /// Replace the registered finders, then rebuild.
    io::Task<void> rebuildViews(view::FinderTable finders) {
        finders_ = std::move(finders);
        co_await rebuildViews();
    }

    using FinderExecutor<Entity>::invokeFinder;

    /// Run a cached finder. Rows come back in store order; one row that does
    /// not parse into Entity fails the whole call.
    io::Task<std::vector<Entity>> invokeFinder(std::string finder, view::FinderArgs args) override {
        const auto* view = views_.find(finder);
        if (!view) {
            DIVAN_LOG_WARN << name() << ": " << finder << " has no cached view";
            throw UnannotatedFinderError(finder);
        }

        io::ViewQuery query{
            .design = std::string(designDocumentName()),
            .view = view->name,
            .stale = Cfg.stale,
            .key = std::move(args.key),
            .limit = args.limit,
            .skip = args.skip,
            .descending = args.descending,
        };

        io::ViewResult result;
        try {
            result = co_await store_->query(std::move(query));
        } catch (const io::StoreError& e) {
            throw remoteError("query", finder, e);
        }

        std::vector<Entity> entities;
        entities.reserve(result.rows.size());
        for (const auto& row : result.rows) {
            entities.push_back(decode(row.document));
        }
        DIVAN_LOG_DEBUG << name() << ": " << finder << " returned " << entities.size() << " row(s)";
        co_return entities;
    }

    // =====================================================================
    // Introspection
    // =====================================================================

    [[nodiscard]] const view::ViewCatalog& views() const noexcept { return views_; }
    [[nodiscard]] const view::FinderTable& finders() const noexcept { return finders_; }
    [[nodiscard]] const std::shared_ptr<io::DocumentStore>& store() const noexcept { return store_; }
    [[nodiscard]] const std::shared_ptr<view::ViewProvisioner>& provisioner() const noexcept { return provisioner_; }

private:
    static std::string encode(const Entity& entity) {
        try {
            return Codec::toJson(entity, name());
        } catch (const SerializationError& e) {
            DIVAN_LOG_WARN << e.what();
            throw;
        }
    }

    static Entity decode(std::string_view json) {
        try {
            return Codec::fromJson(json, name());
        } catch (const DeserializationError& e) {
            DIVAN_LOG_WARN << e.what();
            throw;
        }
    }

    static RemoteUnavailableError remoteError(std::string_view op, const std::string& target,
                                              const io::StoreError& e) {
        DIVAN_LOG_ERROR << name() << ": " << op << " " << target << " - " << e.what();
        return RemoteUnavailableError(std::string(op) + " " + target, e.what());
    }

    std::shared_ptr<io::DocumentStore> store_;
    std::shared_ptr<view::ViewProvisioner> provisioner_;
    view::FinderTable finders_;
    view::ViewCatalog views_;
};

}  // namespace jcailloux::divan

#endif  // JCX_DIVAN_ACCESSOR_H
