#pragma once

#include <cstdlib> // std::getenv

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace signrelay::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;

    using error::RelayError;
    using enum error::RelayErrorCode;
  } // namespace

  /**
   * @brief Retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return The value of the variable, or NotFound if it is unset or empty.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<PCStr> {
    const PCStr value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)

    if (!value || *value == '\0')
      return Err(RelayError(NotFound, std::format("Environment variable {} not found", name)));

    return value;
  }
} // namespace signrelay::utils::env
