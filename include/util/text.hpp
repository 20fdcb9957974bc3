#pragma once

#include <string>
#include <string_view>

namespace md::util {

// Decodes bytes as UTF-8, replacing every invalid sequence with U+FFFD.
std::string sanitizeUtf8(std::string_view bytes);

}
