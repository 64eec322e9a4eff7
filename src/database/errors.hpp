#pragma once

#include <stdexcept>
#include <string>

/**
 * Every error reported by the roster store derives from this one, so a
 * caller can catch them all at once.
 */
struct StoreError: public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

/**
 * The store was created without a database location.
 */
struct NotConfigured: public StoreError
{
  using StoreError::StoreError;
};

/**
 * The database engine failed: I/O error, SQL error, busy database, etc. The
 * message names the statement or the operation that failed.
 */
struct StorageFailure: public StoreError
{
  using StoreError::StoreError;
};

/**
 * An address could not be mapped to an identity, nor a new one created.
 */
struct IdentityResolutionFailure: public StoreError
{
  using StoreError::StoreError;
};

/**
 * A transaction found the database in a state it did not expect, for
 * example a row that disappeared between a read and a write.
 */
struct InconsistentState: public StoreError
{
  using StoreError::StoreError;
};
