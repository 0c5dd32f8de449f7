#pragma once

#include <string>

namespace jpi {

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase hex, 64 chars
};

HashResult compute_text_sha256(const std::string& text);
HashResult compute_file_sha256(const std::string& file_path);

} // namespace jpi
