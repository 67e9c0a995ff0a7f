#pragma once

#include <string>

namespace NixBlitz {

struct ApiError {
    std::string message;

    ApiError() = default;
    explicit ApiError(std::string msg) : message(std::move(msg)) {}
};

} // namespace NixBlitz
