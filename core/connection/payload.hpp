#pragma once

#include <string>
#include <vector>

namespace comserver {
namespace connection {

constexpr const char *kDefaultEnding = "\r\n";
constexpr const char *kDefaultConcatenate = " ";

/**
 * @brief Build the exact byte string written to the serial line
 *
 * Fragments are joined by `concatenate` and `ending` is appended once.
 * A single fragment is never affected by `concatenate`.
 */
std::string compose_payload(const std::vector<std::string> &fragments, const std::string &concatenate,
                            const std::string &ending);

}  // namespace connection
}  // namespace comserver
