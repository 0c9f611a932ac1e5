#pragma once
#include <cstdint>
#include <string>

namespace ids
{

// Initializes libsodium; safe to call more than once.
bool init();

// Positive, non-zero 63-bit payload id from the libsodium CSPRNG.
std::int64_t new_payload_id();

// 128-bit service UUID derived from a service id string (BLAKE2b), formatted
// as "xxxxxxxx-xxxx-8xxx-yxxx-xxxxxxxxxxxx".
std::string service_uuid(const std::string &service_id);

// Short random endpoint id, four characters from [A-Z0-9].
std::string new_endpoint_id();

}  // namespace ids
