#pragma once

#include "errors/error_base.hpp"

namespace authz::errors {

    namespace kinds {
        inline constexpr std::string_view INVALID_ARGUMENT = "InvalidArgument";
        inline constexpr std::string_view CONFIG = "ConfigError";
        inline constexpr std::string_view STORAGE = "StorageError";
        inline constexpr std::string_view ENFORCEMENT = "EnforcementError";
    } // namespace kinds

    /**
     * Caller supplied an empty identifier, an unknown role or an empty tenant list. Always
     * raised before the engine or the store is touched.
     */
    class InvalidArgument : public Error {
    public:
        explicit InvalidArgument(const std::string &msg) : Error(kinds::INVALID_ARGUMENT, msg) {
        }
    };

    /**
     * Policy document or service configuration is malformed or fails validation.
     */
    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string &msg) : Error(kinds::CONFIG, msg) {
        }
    };

    /**
     * Infrastructure failure in the durable assignment store. Retryable failures (busy
     * database, timeout) are flagged so the caller can apply its own retry policy.
     */
    class StorageError : public Error {
        bool _retryable{false};

    public:
        explicit StorageError(const std::string &msg, bool retryable = false)
            : Error(kinds::STORAGE, msg), _retryable(retryable) {
        }

        [[nodiscard]] bool isRetryable() const noexcept {
            return _retryable;
        }
    };

    /**
     * The engine could not produce a decision. Always paired with a deny.
     */
    class EnforcementError : public Error {
    public:
        explicit EnforcementError(const std::string &msg) : Error(kinds::ENFORCEMENT, msg) {
        }
    };

} // namespace authz::errors
