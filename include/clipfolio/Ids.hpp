#pragma once
// Identifier and timestamp helpers

#include <string>

namespace clipfolio {

// Millisecond timestamp as decimal string, strictly increasing per process
std::string nextId();

std::string generateUUID();

// Local wall-clock time as "HH:MM"
std::string currentTimeLabel();

// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string isoTimestampUtc();

// UTC "YYYY-MM-DD"
std::string isoDateUtc();

} // namespace clipfolio
