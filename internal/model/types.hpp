#pragma once

#include <cstdint>
#include <string>

namespace settlement::model {

using Account   = std::string;
using Amount    = std::uint64_t;
using RequestId = std::uint64_t;
using AssetId   = std::uint64_t;
using LicenseId = std::uint64_t;

// Opaque reference to an encrypted value, hex encoded. Only the oracle can
// turn it back into a number.
using CiphertextHandle = std::string;

} // namespace settlement::model
