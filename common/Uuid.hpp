#pragma once

#include <string>

namespace net_recon::common
{
    // Random (version 4) UUID in canonical 8-4-4-4-12 form. Throws std::runtime_error if
    // the OpenSSL generator cannot be seeded.
    std::string NewUuid();
}
