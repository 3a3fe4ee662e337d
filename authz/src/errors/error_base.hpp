#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace authz::errors {

    /**
     * Base class for authorization core exceptions. This exception class carries through a
     * "kind" string that identifies the failure category independent of the C++ type, so
     * that callers on the far side of an API boundary can still branch on it.
     */
    class Error : public std::runtime_error {
        std::string _kind;

        template<typename E>
        static std::string typeKind() {
            static_assert(std::is_base_of_v<std::exception, E>);
            return typeid(E).name();
        }

    public:
        Error(const Error &) = default;
        Error(Error &&) noexcept = default;
        Error &operator=(const Error &) = default;
        Error &operator=(Error &&) noexcept = default;
        ~Error() override = default;

        explicit Error(std::string_view kind, const std::string &what = "Unspecified Error")
            : std::runtime_error(what), _kind(kind) {
        }

        template<typename E>
        static Error of(const E &error) {
            static_assert(std::is_base_of_v<std::exception, E>);
            if constexpr(std::is_base_of_v<Error, E>) {
                return static_cast<const Error &>(error);
            } else {
                return Error(typeKind<E>(), error.what());
            }
        }

        [[nodiscard]] const std::string &kind() const noexcept {
            return _kind;
        }

        [[nodiscard]] bool isKind(std::string_view kind) const noexcept {
            return _kind == kind;
        }
    };

    /**
     * Translate any in-flight exception into an Error. Must be called from within a catch
     * block.
     */
    Error currentAsError();

} // namespace authz::errors
