#include "markup.hpp"

#include <cstdint>
#include <map>

#include "utils.hpp"

namespace scenedl::manifest {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x110000) {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

std::optional<std::uint32_t> numeric_reference(std::string_view body) {
	if (body.empty()) return std::nullopt;
	std::uint32_t cp = 0;
	if (body[0] == 'x' || body[0] == 'X') {
		body.remove_prefix(1);
		auto res = boost::charconv::from_chars(
			body.data(), body.data() + body.size(), cp, 16);
		if (res.ec != std::errc{} || res.ptr != body.data() + body.size()) {
			return std::nullopt;
		}
		return cp;
	}
	auto value = utils::to_number<std::uint32_t>(body);
	if (!value) return std::nullopt;
	return value.value();
}

}  // namespace

std::optional<std::string> attribute(std::string_view tag,
									 std::string_view name) {
	// A page carries a few hundred tags but only a handful of names
	thread_local std::map<std::string, boost::regex, std::less<>> patterns;
	auto it = patterns.find(name);
	if (it == patterns.end()) {
		it = patterns
				 .emplace(std::string(name),
						  boost::regex("(?:^|\\s)" + std::string(name) +
									   "\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)')"))
				 .first;
	}
	const auto &pattern = it->second;
	boost::match_results<std::string_view::const_iterator> match;
	if (!boost::regex_search(tag.begin(), tag.end(), match, pattern)) {
		return std::nullopt;
	}
	return match[1].matched ? match[1].str() : match[2].str();
}

std::string decode_entities(std::string_view text) {
	std::string out;
	out.reserve(text.size());

	std::size_t pos = 0;
	while (pos < text.size()) {
		auto amp = text.find('&', pos);
		if (amp == std::string_view::npos) {
			out.append(text.substr(pos));
			break;
		}
		out.append(text.substr(pos, amp - pos));

		auto semi = text.find(';', amp);
		// Entity names are short; anything longer is a literal ampersand
		if (semi == std::string_view::npos || semi - amp > 10) {
			out += '&';
			pos = amp + 1;
			continue;
		}

		auto entity = text.substr(amp + 1, semi - amp - 1);
		if (entity == "amp") {
			out += '&';
		} else if (entity == "lt") {
			out += '<';
		} else if (entity == "gt") {
			out += '>';
		} else if (entity == "quot") {
			out += '"';
		} else if (entity == "apos") {
			out += '\'';
		} else if (entity == "nbsp") {
			out += ' ';
		} else if (!entity.empty() && entity[0] == '#') {
			auto cp = numeric_reference(entity.substr(1));
			if (!cp) {
				out.append(text.substr(amp, semi - amp + 1));
			} else {
				append_utf8(out, *cp);
			}
		} else {
			out.append(text.substr(amp, semi - amp + 1));
		}
		pos = semi + 1;
	}
	return out;
}

std::string inner_text(std::string_view html) {
	static const boost::regex tags("<[^>]*>");
	static const boost::regex spaces("\\s+");
	std::string text = boost::regex_replace(std::string(html), tags, " ");
	text = decode_entities(text);
	text = boost::regex_replace(text, spaces, " ");
	return std::string(utils::trim(text));
}

}  // namespace scenedl::manifest
