#pragma once

#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace scenedl::manifest {

// Value of attribute `name` inside a start tag, single or double quoted.
std::optional<std::string> attribute(std::string_view tag,
									 std::string_view name);

// &amp; &lt; &gt; &quot; &apos; &#39; &nbsp; and numeric references.
std::string decode_entities(std::string_view text);

// Drops tags, decodes entities and collapses whitespace.
std::string inner_text(std::string_view html);

}  // namespace scenedl::manifest
