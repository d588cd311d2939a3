#include "marker.hpp"
#include "utils.hpp"

namespace agentsync {

bool is_generated(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return false;
    return text.compare(start, std::char_traits<char>::length(GENERATED_HEADER), GENERATED_HEADER) == 0;
}

std::string generated_header_block(const std::string& timestamp) {
    return std::string(GENERATED_HEADER) + "\n" +
           REGENERATE_HINT + "\n" +
           "# Last synced: " + timestamp + "\n";
}

std::string generated_header_block() {
    return generated_header_block(utc_iso_str());
}

} // namespace agentsync
