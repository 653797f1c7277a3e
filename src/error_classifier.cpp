#include "error_classifier.h"

#include "errors.h"
#include "obs/error_codes.h"

namespace chatgate {

namespace {

constexpr const char* kTransportPrefix = "Error connecting to backend server: ";
constexpr const char* kProxyPrefix = "Proxy error: ";

} // namespace

auto ClassifyError(const std::exception_ptr& error) -> ClassifiedError {
    if (!error) {
        return {500, std::string(kProxyPrefix) + "unknown error", obs::kErrInternal};
    }
    try {
        std::rethrow_exception(error);
    } catch (const ValidationError& e) {
        const char* code = e.kind() == ValidationError::Kind::MissingField
                               ? obs::kErrHttpMissingField
                               : obs::kErrHttpInvalidArgument;
        return {400, e.what(), code};
    } catch (const TransportError& e) {
        return {502, std::string(kTransportPrefix) + e.what(), obs::kErrBackendUnreachable};
    } catch (const NullResponseError& e) {
        return {500, std::string(kProxyPrefix) + e.what(), obs::kErrBackendNullResponse};
    } catch (const InvocationError& e) {
        return {500, std::string(kProxyPrefix) + e.what(), obs::kErrBackendInvocation};
    } catch (const std::exception& e) {
        return {500, std::string(kProxyPrefix) + e.what(), obs::kErrInternal};
    } catch (...) {
        return {500, std::string(kProxyPrefix) + "unknown error", obs::kErrInternal};
    }
}

} // namespace chatgate
