#pragma once

#include <string>

namespace gridsync {

/**
 * Plain-text rendering of a news message for desktop notifications:
 * paragraph tags become blank lines, all other tags are dropped.
 */
std::string strip_html_tags(const std::string& html);

} // namespace gridsync
