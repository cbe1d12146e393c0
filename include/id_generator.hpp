#pragma once

#include <string>
#include <stdexcept>
#include <openssl/rand.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace keypub {

class IdGenerator {
public:
    // Random (version 4) UUID drawn from the OpenSSL CSPRNG, in canonical
    // lowercase hyphenated form.
    static std::string generate_id() {
        boost::uuids::uuid u;
        if (RAND_bytes(u.data, static_cast<int>(u.size())) != 1) {
            throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
        }

        u.data[6] = static_cast<uint8_t>((u.data[6] & 0x0F) | 0x40);  // version 4
        u.data[8] = static_cast<uint8_t>((u.data[8] & 0x3F) | 0x80);  // RFC 4122 variant

        return boost::uuids::to_string(u);
    }
};

}
