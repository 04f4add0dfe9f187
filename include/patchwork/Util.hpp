#ifndef PATCHWORK_UTIL_HPP
#define PATCHWORK_UTIL_HPP

#include <optional>
#include <string>

namespace patchwork {

std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Standard (RFC 4648) base64 with padding.
std::string base64_encode(const std::string& data);

// Returns nullopt if data is not valid padded base64.
std::optional<std::string> base64_decode(const std::string& data);

} // namespace patchwork

#endif // PATCHWORK_UTIL_HPP
