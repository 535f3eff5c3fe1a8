#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace pea {

class NonceGenerator {
public:
    static std::vector<unsigned char> random_bytes(size_t count) {
        std::vector<unsigned char> buffer(count);
        if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
            throw std::runtime_error("CSPRNG failure while generating random bytes");
        }
        return buffer;
    }

    // Random (version 4) UUID in canonical 8-4-4-4-12 text form.
    static std::string uuid_v4() {
        auto b = random_bytes(16);
        b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
        b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

        std::stringstream ss;
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
        }
        return ss.str();
    }
};

}
