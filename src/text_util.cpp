#include "text_util.hpp"
#include <regex>

namespace gridsync {

std::string strip_html_tags(const std::string& html) {
    static const std::regex paragraph("<p>", std::regex::icase);
    static const std::regex tag("<[^>]*>");
    std::string text = std::regex_replace(html, paragraph, "\n\n");
    return std::regex_replace(text, tag, "");
}

} // namespace gridsync
