#include "roar/errors.hpp"

#include <fmt/format.h>

namespace roar {

RenderFailure::RenderFailure(std::size_t failure_count, const std::string& first_error)
    : std::runtime_error(fmt::format("failed to process {} application(s), first error: {}", failure_count, first_error)),
      failure_count_(failure_count) {}

std::size_t RenderFailure::failure_count() const noexcept {
    return failure_count_;
}

}  // namespace roar
