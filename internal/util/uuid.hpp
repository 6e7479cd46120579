#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace usbforge::util {

/*
  UUID helpers

  Job tokens are "job-" + RFC4122 v4 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateJobToken();

} // namespace usbforge::util
