// taunt_request.h
// Wire format of the remote taunt fetch: request body, and the text we read
// back out of the response.

#pragma once
#include <stdint.h>
#include <string>
#include <vector>

namespace Clicker {

// Messages API body asking for `count` taunts.
std::string buildTauntRequest(uint8_t count);

// Splits content[0].text into raw lines (filtering is the provider's job).
// False if the body does not parse or carries no text.
bool parseTauntResponse(const std::string& body, std::vector<std::string>& lines);

} // namespace Clicker
