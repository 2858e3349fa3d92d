#include "util.hpp"
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <cstring>

namespace util {

namespace {
const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_index(char c) {
    const char* p = std::strchr(BASE58_ALPHABET, c);
    if (c == '\0' || p == nullptr) return -1;
    return static_cast<int>(p - BASE58_ALPHABET);
}
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        zeros++;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < data.size(); i++) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::vector<uint8_t> base58_decode(const std::string& str) {
    size_t zeros = 0;
    while (zeros < str.size() && str[zeros] == '1') {
        zeros++;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((str.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < str.size(); i++) {
        int carry = base58_index(str[i]);
        if (carry < 0) {
            throw std::invalid_argument("invalid base58 character");
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeros, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& str) {
    if (str.empty()) return {};
    if (str.size() % 4 != 0) {
        throw std::invalid_argument("invalid base64 length");
    }
    std::vector<uint8_t> out(3 * str.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(str.data()),
                                  static_cast<int>(str.size()));
    if (written < 0) {
        throw std::invalid_argument("invalid base64 input");
    }
    // EVP_DecodeBlock does not account for padding
    size_t padding = 0;
    if (str[str.size() - 1] == '=') padding++;
    if (str[str.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

bool is_valid_solana_address(const std::string& address) {
    if (address.size() < 32 || address.size() > 44) {
        return false;
    }
    try {
        return base58_decode(address).size() == 32;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme = dsn.find("://");
    auto at = dsn.find('@');
    if (scheme == std::string::npos || at == std::string::npos) {
        return dsn;
    }
    auto colon = dsn.find(':', scheme + 3);
    if (colon == std::string::npos || colon > at) {
        return dsn;
    }
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

std::string host_of(const std::string& url) {
    auto start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    auto end = url.find_first_of("/?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

uint64_t sol_to_lamports(double sol) {
    if (sol <= 0.0) return 0;
    return static_cast<uint64_t>(std::llround(sol * static_cast<double>(LAMPORTS_PER_SOL)));
}

double lamports_to_sol(uint64_t lamports) {
    return static_cast<double>(lamports) / static_cast<double>(LAMPORTS_PER_SOL);
}

} // namespace util
