/**
 * test_view_provisioner.cpp
 *
 * Tests for ViewProvisioner resolve-or-create.
 *
 *   1. Resolution      — existing view, absent document, append
 *   2. Failures        — catalog fetch / upsert failures
 *   3. Interleaving    — unguarded lost update vs guarded serialization
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "fixtures/test_helper.h"

#include <jcailloux/divan/view/ViewProvisioner.h>

#include <optional>
#include <string>
#include <vector>

using namespace divan_test;

using divan::view::FinderSpec;
using divan::view::ViewDescriptor;
using divan::view::ViewProvisioner;

namespace {

const FinderSpec kActive{"doc.status == \"ACTIVE\"", "emit(meta.id, null)"};
const FinderSpec kRich{"doc.balance > 100", "emit(doc.balance, null)"};

io::Task<void> resolveInto(ViewProvisioner& provisioner, std::string finder, FinderSpec spec,
                           std::optional<ViewDescriptor>& out) {
    out = co_await provisioner.resolve(kAccountDesign, std::move(finder), std::move(spec));
}

}  // namespace

// #############################################################################
//
//  1. Resolution
//
// #############################################################################

TEST_CASE("ViewProvisioner - resolution", "[provisioner]") {
    auto store = makeStore();
    ViewProvisioner provisioner{store};

    SECTION("[provisioner] absent design document is created with the new view") {
        auto view = syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));

        REQUIRE(view.name == "findByStatus");
        REQUIRE(view.map == findByStatusMap());
        REQUIRE_FALSE(view.reduce.has_value());

        auto design = store->designDocument(kAccountDesign);
        REQUIRE(design.has_value());
        REQUIRE(design->views == std::vector<ViewDescriptor>{view});
    }

    SECTION("[provisioner] existing view is returned verbatim without writing") {
        ViewDescriptor remote{"findByStatus", "function (doc, meta) { emit(doc.status, null); }", "_count"};
        store->putDesignDocument({kAccountDesign, {remote}});

        auto view = syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));

        REQUIRE(view == remote);
        REQUIRE(store->calls.upsert_design.load() == 0);
    }

    SECTION("[provisioner] missing view is appended, other views are preserved") {
        ViewDescriptor legacy{"legacy", "function (doc, meta) { emit(null, null); }", "_count"};
        store->putDesignDocument({kAccountDesign, {legacy}});

        syncWait(provisioner.resolve(kAccountDesign, "findRich", kRich));

        auto design = store->designDocument(kAccountDesign);
        REQUIRE(design->views.size() == 2);
        REQUIRE(design->views[0] == legacy);
        REQUIRE(design->views[1].name == "findRich");
        REQUIRE(design->views[1].map ==
                "function (doc, meta) {\n  if (doc.balance > 100) {\n    emit(doc.balance, null);\n  }\n}");
    }

    SECTION("[provisioner] resolving twice writes once") {
        auto first = syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));
        auto second = syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));

        REQUIRE(first == second);
        REQUIRE(store->calls.upsert_design.load() == 1);
        REQUIRE(store->calls.get_design.load() == 2);
    }

    SECTION("[provisioner] design documents of different entities are independent") {
        syncWait(provisioner.resolve("TESTACCOUNT", "findByStatus", kActive));
        syncWait(provisioner.resolve("TESTORDER", "findByStatus", kActive));

        REQUIRE(store->designDocument("TESTACCOUNT")->views.size() == 1);
        REQUIRE(store->designDocument("TESTORDER")->views.size() == 1);
    }

    SECTION("[provisioner] null store is rejected") {
        REQUIRE_THROWS_AS(ViewProvisioner(nullptr), std::invalid_argument);
    }

    SECTION("[provisioner] mode defaults to unguarded") {
        REQUIRE(provisioner.mode() == cfg::ProvisioningMode::Unguarded);
    }
}

// #############################################################################
//
//  2. Failures
//
// #############################################################################

TEST_CASE("ViewProvisioner - failures", "[provisioner][errors]") {
    auto store = makeStore();
    auto mode = GENERATE(cfg::ProvisioningMode::Unguarded, cfg::ProvisioningMode::Guarded);
    ViewProvisioner provisioner{store, mode};

    SECTION("[errors] catalog fetch failure is reported and nothing is written") {
        store->failOn(MemoryStore::Op::GetDesign);

        try {
            syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));
            FAIL("expected RemoteUnavailableError");
        } catch (const divan::RemoteUnavailableError& e) {
            REQUIRE(e.operation() == "getDesignDocument TESTACCOUNT");
        }
        REQUIRE(store->calls.upsert_design.load() == 0);
    }

    SECTION("[errors] upsert failure is reported") {
        store->failOn(MemoryStore::Op::UpsertDesign);

        REQUIRE_THROWS_AS(syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive)),
                          divan::RemoteUnavailableError);
        REQUIRE_FALSE(store->designDocument(kAccountDesign).has_value());
    }

    SECTION("[errors] a failed resolution does not wedge later ones") {
        store->failOn(MemoryStore::Op::UpsertDesign);
        REQUIRE_THROWS(syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive)));

        store->clearFaults();
        auto view = syncWait(provisioner.resolve(kAccountDesign, "findByStatus", kActive));
        REQUIRE(view.name == "findByStatus");
    }
}

// #############################################################################
//
//  3. Interleaving
//
// Both resolutions are started while the store holds every design-document
// read at the gate, after the read has taken its snapshot.
//
// #############################################################################

TEST_CASE("ViewProvisioner - concurrent first resolutions", "[provisioner][race]") {
    auto store = makeStore();
    std::optional<ViewDescriptor> a;
    std::optional<ViewDescriptor> b;

    SECTION("[race] unguarded: the later upsert drops the earlier view") {
        ViewProvisioner provisioner{store, cfg::ProvisioningMode::Unguarded};
        store->design_read_gate.close();

        Spawned first{resolveInto(provisioner, "findByStatus", kActive, a)};
        Spawned second{resolveInto(provisioner, "findRich", kRich, b)};
        REQUIRE(store->design_read_gate.waiting() == 2);

        store->design_read_gate.open();
        REQUIRE(first.done());
        REQUIRE(second.done());
        first.get();
        second.get();

        // Each caller got its view back ...
        REQUIRE(a->name == "findByStatus");
        REQUIRE(b->name == "findRich");
        // ... but only the last writer's view survived remotely.
        auto design = store->designDocument(kAccountDesign);
        REQUIRE(design->views.size() == 1);
        REQUIRE(design->views[0].name == "findRich");
        REQUIRE(store->calls.upsert_design.load() == 2);
    }

    SECTION("[race] guarded: the second resolution sees the first one's write") {
        ViewProvisioner provisioner{store, cfg::ProvisioningMode::Guarded};
        store->design_read_gate.close();

        Spawned first{resolveInto(provisioner, "findByStatus", kActive, a)};
        Spawned second{resolveInto(provisioner, "findRich", kRich, b)};
        // The second resolution is parked on the mutex, not on the store.
        REQUIRE(store->design_read_gate.waiting() == 1);
        REQUIRE(store->calls.get_design.load() == 1);

        store->design_read_gate.open();
        REQUIRE(first.done());
        REQUIRE(second.done());
        first.get();
        second.get();

        auto design = store->designDocument(kAccountDesign);
        REQUIRE(design->views.size() == 2);
        REQUIRE(design->views[0].name == "findByStatus");
        REQUIRE(design->views[1].name == "findRich");
    }

    SECTION("[race] guarded: same finder resolved twice is created once") {
        ViewProvisioner provisioner{store, cfg::ProvisioningMode::Guarded};
        store->design_read_gate.close();

        Spawned first{resolveInto(provisioner, "findByStatus", kActive, a)};
        Spawned second{resolveInto(provisioner, "findByStatus", kActive, b)};

        store->design_read_gate.open();
        REQUIRE(second.done());

        REQUIRE(*a == *b);
        REQUIRE(store->calls.upsert_design.load() == 1);
    }

    SECTION("[race] guarded accessors sharing a provisioner keep both finders") {
        auto shared = std::make_shared<ViewProvisioner>(store, cfg::ProvisioningMode::Guarded);
        GuardedAccountAccessor statuses{store, shared, accountFinders()};
        GuardedAccountAccessor balances{store, shared, divan::view::FinderTable{{"findRich", kRich}}};
        store->design_read_gate.close();

        Spawned first{statuses.rebuildViews()};
        Spawned second{balances.rebuildViews()};

        store->design_read_gate.open();
        REQUIRE(first.done());
        REQUIRE(second.done());
        first.get();
        second.get();

        REQUIRE(statuses.views().contains("findByStatus"));
        REQUIRE(balances.views().contains("findRich"));
        REQUIRE(store->designDocument(kAccountDesign)->views.size() == 2);
    }
}

// #############################################################################
//
//  4. Per-store guarded provisioner
//
// #############################################################################

TEST_CASE("ViewProvisioner - guarded provisioner per store", "[provisioner][guarded]") {
    auto store = makeStore();

    SECTION("[guarded] one instance per store while it is held") {
        auto first = ViewProvisioner::guardedFor(store);
        auto second = ViewProvisioner::guardedFor(store);
        auto other = ViewProvisioner::guardedFor(makeStore());

        REQUIRE(first == second);
        REQUIRE(first != other);
        REQUIRE(first->mode() == cfg::ProvisioningMode::Guarded);
    }

    SECTION("[guarded] null store is rejected") {
        REQUIRE_THROWS_AS(ViewProvisioner::guardedFor(nullptr), std::invalid_argument);
    }

    SECTION("[guarded] independent guarded accessors share it, unguarded ones do not") {
        GuardedAccountAccessor g1{store};
        GuardedAccountAccessor g2{store};
        AccountAccessor u1{store};
        AccountAccessor u2{store};

        REQUIRE(g1.provisioner() == g2.provisioner());
        REQUIRE(u1.provisioner() != u2.provisioner());
        REQUIRE(u1.provisioner()->mode() == cfg::ProvisioningMode::Unguarded);
    }

    SECTION("[guarded] independent guarded accessors keep both views") {
        GuardedAccountAccessor statuses{store, accountFinders()};
        GuardedAccountAccessor balances{store, divan::view::FinderTable{{"findRich", kRich}}};
        store->design_read_gate.close();

        Spawned first{statuses.rebuildViews()};
        Spawned second{balances.rebuildViews()};
        REQUIRE(store->design_read_gate.waiting() == 1);

        store->design_read_gate.open();
        REQUIRE(first.done());
        REQUIRE(second.done());
        first.get();
        second.get();

        auto design = store->designDocument(kAccountDesign);
        REQUIRE(design->views.size() == 2);
        REQUIRE(design->findView("findByStatus") != nullptr);
        REQUIRE(design->findView("findRich") != nullptr);
    }
}
