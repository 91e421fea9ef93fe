#pragma once

#include <stdexcept>
#include <string>

namespace obr::domain {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Worth retrying: I/O hiccup, lock timeout, filesystem temporarily unavailable.
class TransientStoreError : public StoreError {
public:
    using StoreError::StoreError;
};

// Retrying cannot help: invalid record, orphan level, corrupt file.
class PermanentStoreError : public StoreError {
public:
    using StoreError::StoreError;
};

class MalformedFeedMessage : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The start point a client attached with no longer names a stored Snapshot.
class StaleReferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace obr::domain
