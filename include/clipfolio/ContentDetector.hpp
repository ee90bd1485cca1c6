#pragma once
// Single Responsibility: classify clipboard text (url, color, code, text)

#include "Model.hpp"
#include <string>
#include <string_view>

namespace clipfolio {

ContentType detectContentType(std::string_view text);

// http(s) URL with a non-empty host and no whitespace
bool isSafeUrl(std::string_view url);

std::string trimCopy(std::string_view text);

} // namespace clipfolio
