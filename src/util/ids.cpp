#include <array>
#include <cstdio>
#include <cstring>
#include <sodium.h>

#include "util/ids.hpp"
#include "util/log.hpp"

namespace ids
{

bool init()
{
    static const bool ok = [] {
        if (sodium_init() < 0)
        {
            LOG_ERROR("sodium_init failed");
            return false;
        }
        return true;
    }();
    return ok;
}

std::int64_t new_payload_id()
{
    (void)init();
    std::uint64_t v = 0;
    do
    {
        randombytes_buf(&v, sizeof(v));
        v &= 0x7fffffffffffffffULL;
    } while (v == 0);
    return static_cast<std::int64_t>(v);
}

std::string service_uuid(const std::string &service_id)
{
    (void)init();
    std::array<unsigned char, 16> h{};
    crypto_generichash(h.data(), h.size(),
                       reinterpret_cast<const unsigned char *>(service_id.data()),
                       service_id.size(), nullptr, 0);
    // name-based custom UUID: version 8, RFC4122 variant
    h[6] = static_cast<unsigned char>((h[6] & 0x0f) | 0x80);
    h[8] = static_cast<unsigned char>((h[8] & 0x3f) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", h[0],
                  h[1], h[2], h[3], h[4], h[5], h[6], h[7], h[8], h[9], h[10], h[11], h[12], h[13],
                  h[14], h[15]);
    return std::string(out);
}

std::string new_endpoint_id()
{
    static constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    (void)init();
    std::string out(4, 'A');
    for (auto &c : out)
        c = ALPHABET[randombytes_uniform(sizeof(ALPHABET) - 1)];
    return out;
}

}  // namespace ids
