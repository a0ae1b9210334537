#ifndef JCX_DIVAN_IO_STORE_DOCUMENT_STORE_H
#define JCX_DIVAN_IO_STORE_DOCUMENT_STORE_H

#include <optional>
#include <string>

#include "jcailloux/divan/io/Task.h"
#include "jcailloux/divan/io/store/StoreError.h"
#include "jcailloux/divan/io/store/ViewQuery.h"
#include "jcailloux/divan/view/DesignDocument.h"

namespace jcailloux::divan::io {

// =============================================================================
// DocumentStore — driver interface for a JSON document store
//
// Implemented by the application's store client (network connection,
// pooling and persistence are its business). Accessors only see this
// interface, held through a shared_ptr so several accessors can share one
// connection.
//
// Error contract:
//   insert  throws DocumentExistsError   when the key is occupied
//   replace throws DocumentNotFoundError when the key is absent
//   remove  throws DocumentNotFoundError when the key is absent
//   get     returns nullopt              when the key is absent
//   getDesignDocument returns nullopt    when the design document is absent
//   anything else                        throws StoreError
//
// Completion may happen on a driver-owned thread; the io::Task carries the
// value or the exception back into the awaiting coroutine.
//
// Wire helpers for HTTP-style drivers (the accessor itself never calls them):
//   view::DesignDocument::toJson / fromJson   design document body
//   ViewQuery::path / toQueryString           view endpoint and parameters
// =============================================================================

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Keyed documents (raw JSON payloads)

    virtual Task<std::optional<std::string>> get(std::string key) = 0;
    virtual Task<void> insert(std::string key, std::string json) = 0;
    virtual Task<void> replace(std::string key, std::string json) = 0;
    virtual Task<void> upsert(std::string key, std::string json) = 0;
    virtual Task<void> remove(std::string key) = 0;

    // Design-document catalog

    virtual Task<std::optional<view::DesignDocument>> getDesignDocument(std::string name) = 0;

    /// Full replace of the named design document (create if absent).
    virtual Task<void> upsertDesignDocument(view::DesignDocument doc) = 0;

    // View queries

    virtual Task<ViewResult> query(ViewQuery query) = 0;
};

}  // namespace jcailloux::divan::io

#endif  // JCX_DIVAN_IO_STORE_DOCUMENT_STORE_H
