#ifndef CONVSYNC_ERRORS_HPP
#define CONVSYNC_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by the server and client sides.
 *
 *  - StorageUnavailable : persistence backend failure (server store)
 *  - ValidationError    : malformed session id, invalid role, bad argument
 *  - QuotaExceeded      : client durable tier is full
 *
 * Channel drops are not exceptions: they travel as boost::system::error_code
 * through the transport and end up in ConnectionManager's backoff path.
 * Unparseable envelopes are reported as std::nullopt by Envelope::parse.
 */

#include <stdexcept>
#include <string>

namespace convsync
{
    class SyncError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class StorageUnavailable : public SyncError
    {
    public:
        using SyncError::SyncError;
    };

    class ValidationError : public SyncError
    {
    public:
        using SyncError::SyncError;
    };

    class QuotaExceeded : public SyncError
    {
    public:
        using SyncError::SyncError;
    };

} // namespace convsync

#endif // CONVSYNC_ERRORS_HPP
