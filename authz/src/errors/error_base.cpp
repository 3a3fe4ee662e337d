#include "errors/error_base.hpp"

#include <exception>

namespace authz::errors {

    Error currentAsError() {
        try {
            throw;
        } catch(const Error &e) {
            return e;
        } catch(const std::exception &e) {
            return Error::of(e);
        } catch(...) {
            return Error("UnknownError", "Non-standard exception");
        }
    }

} // namespace authz::errors
