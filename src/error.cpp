#include "memcp/error.hpp"

#include <nlohmann/json.hpp>

namespace memcp {

std::string error_kind(const std::exception& e) {
    if (const auto* app_error = dynamic_cast<const Error*>(&e)) {
        return app_error->kind();
    }
    if (dynamic_cast<const nlohmann::json::exception*>(&e) != nullptr) {
        return "JsonError";
    }
    if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        return "InvalidArgument";
    }
    if (dynamic_cast<const std::out_of_range*>(&e) != nullptr) {
        return "OutOfRange";
    }
    return "RuntimeError";
}

}  // namespace memcp
