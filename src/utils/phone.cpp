#include "voice_bridge/utils/phone.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace voice_bridge::utils {

std::string mask_phone_number(const std::string& phone) {
    if (phone.size() < 8) {
        return phone;
    }
    size_t run_start = 0;
    size_t run_length = 0;
    for (size_t i = 0; i < phone.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(phone[i]))) {
            if (run_length == 0) {
                run_start = i;
            }
            ++run_length;
            if (run_length == 10) {
                std::string masked = phone;
                masked.replace(run_start + 3, 4, "****");
                return masked;
            }
        } else {
            run_length = 0;
        }
    }
    return phone;
}

std::string format_e164(const std::string& phone) {
    std::string digits;
    for (unsigned char ch : phone) {
        if (std::isdigit(ch)) {
            digits.push_back(static_cast<char>(ch));
        }
    }
    if (digits.rfind("44", 0) == 0) {
        return "+" + digits;
    }
    if (digits.rfind("07", 0) == 0 || digits.rfind("01", 0) == 0 ||
        digits.rfind("02", 0) == 0) {
        return "+44" + digits.substr(1);
    }
    return phone;
}

std::string random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (auto byte : buffer) {
        out << std::setw(2) << static_cast<int>(byte);
    }
    return out.str();
}

}
