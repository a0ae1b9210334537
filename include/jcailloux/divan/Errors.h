#ifndef JCX_DIVAN_ERRORS_H
#define JCX_DIVAN_ERRORS_H

#include <stdexcept>
#include <string>
#include <string_view>

namespace jcailloux::divan {

// =============================================================================
// Accessor error taxonomy
//
// Every accessor operation reports failure by throwing one of these through
// its io::Task. Driver-level io::StoreError subclasses never escape an
// accessor: they are mapped here.
//
//   NotFoundError           read/update/erase on an absent key
//   DuplicateKeyError       create on an occupied key
//   SerializationError      Entity -> JSON failed (nothing was sent)
//   DeserializationError    JSON -> Entity failed (payload attached)
//   UnannotatedFinderError  invokeFinder on a name with no cached view
//   RemoteUnavailableError  the store failed for transport/server reasons
// =============================================================================

class DivanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public DivanError {
public:
    explicit NotFoundError(const std::string& key)
        : DivanError("no document at key " + key), key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class DuplicateKeyError : public DivanError {
public:
    explicit DuplicateKeyError(const std::string& key)
        : DivanError("a document already exists at key " + key), key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class SerializationError : public DivanError {
public:
    SerializationError(std::string_view type_name, std::string_view detail)
        : DivanError("Cannot convert " + std::string(type_name) + " to JSON: " + std::string(detail))
        , type_name_(type_name) {}

    [[nodiscard]] const std::string& typeName() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class DeserializationError : public DivanError {
public:
    DeserializationError(std::string_view type_name, std::string_view payload, std::string_view detail)
        : DivanError("Cannot convert JSON: " + std::string(payload) + " to "
                     + std::string(type_name) + " (" + std::string(detail) + ")")
        , type_name_(type_name)
        , payload_(payload) {}

    [[nodiscard]] const std::string& typeName() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& payload() const noexcept { return payload_; }

private:
    std::string type_name_;
    std::string payload_;
};

class UnannotatedFinderError : public DivanError {
public:
    explicit UnannotatedFinderError(const std::string& finder)
        : DivanError("method not declared as a finder: " + finder), finder_(finder) {}

    [[nodiscard]] const std::string& finder() const noexcept { return finder_; }

private:
    std::string finder_;
};

class RemoteUnavailableError : public DivanError {
public:
    RemoteUnavailableError(std::string_view operation, std::string_view detail)
        : DivanError(std::string(operation) + " failed: " + std::string(detail))
        , operation_(operation) {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

private:
    std::string operation_;
};

}  // namespace jcailloux::divan

#endif  // JCX_DIVAN_ERRORS_H
