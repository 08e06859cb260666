#include "payload.hpp"

namespace comserver {
namespace connection {

std::string compose_payload(const std::vector<std::string> &fragments, const std::string &concatenate,
                            const std::string &ending) {
    std::string payload;
    for (size_t i = 0; i < fragments.size(); ++i) {
        if (i > 0) {
            payload += concatenate;
        }
        payload += fragments[i];
    }
    payload += ending;
    return payload;
}

}  // namespace connection
}  // namespace comserver
