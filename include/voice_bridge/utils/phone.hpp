#pragma once

#include <cstddef>
#include <string>

namespace voice_bridge::utils {

// Masks four digits of the first ten-digit run: 07700900123 -> 077****0123.
std::string mask_phone_number(const std::string& phone);

// UK numbers to E.164; anything unrecognised is returned unchanged.
std::string format_e164(const std::string& phone);

std::string random_hex(size_t bytes);

}
