#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace clipfolio {

std::string base64Encode(std::string_view bytes);

// Accepts plain base64 or a data URI ("data:image/png;base64,...").
// Whitespace is ignored; returns nullopt on malformed input.
std::optional<std::string> base64Decode(std::string_view text);

} // namespace clipfolio
