#ifndef JCX_DIVAN_IO_STORE_ERROR_H
#define JCX_DIVAN_IO_STORE_ERROR_H

#include <stdexcept>
#include <string>

namespace jcailloux::divan::io {

/// Any failure reported by a document store driver (transport, server, protocol).
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// replace/remove targeted a key that holds no document.
class DocumentNotFoundError : public StoreError {
public:
    explicit DocumentNotFoundError(const std::string& key)
        : StoreError("document not found: " + key), key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// insert targeted a key that already holds a document.
class DocumentExistsError : public StoreError {
public:
    explicit DocumentExistsError(const std::string& key)
        : StoreError("document already exists: " + key), key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

} // namespace jcailloux::divan::io

#endif // JCX_DIVAN_IO_STORE_ERROR_H
