#pragma once

#include <boost/charconv.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <nlohmann/json.hpp>
#include <optional>
#include <scenedl/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace scenedl::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<int> to_int(std::string_view sv) { return to_number<int>(sv); }

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

template <typename T>
T to_number_default(std::string_view sv, T def_val = 0) {
	auto res = to_number<T>(sv);
	return res ? res.value() : def_val;
}

// =============================================================================
// String helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view kSpace = " \t\r\n\f\v";
	auto first = sv.find_first_not_of(kSpace);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(kSpace);
	return sv.substr(first, last - first + 1);
}

inline std::vector<std::string_view> split(std::string_view sv, char sep) {
	std::vector<std::string_view> parts;
	std::size_t pos = 0;
	while (true) {
		auto next = sv.find(sep, pos);
		parts.push_back(sv.substr(pos, next - pos));
		if (next == std::string_view::npos) break;
		pos = next + 1;
	}
	return parts;
}

/// "H:MM:SS", "MM:SS" or plain seconds to seconds.
inline Result<long long> duration_to_seconds(std::string_view text) {
	auto parts = split(trim(text), ':');
	if (parts.empty() || parts.size() > 3) {
		return make_error_code(errc::invalid_number_format);
	}
	long long total = 0;
	for (auto part : parts) {
		auto value = to_long(trim(part));
		if (!value || value.value() < 0) {
			return make_error_code(errc::invalid_number_format);
		}
		total = total * 60 + value.value();
	}
	return total;
}

/// IMF-fixdate ("Sun, 06 Nov 1994 08:49:37 GMT"), as sent in Last-Modified.
inline std::optional<std::chrono::system_clock::time_point> parse_http_date(
	std::string_view text) {
	std::tm tm{};
	std::istringstream in{std::string(trim(text))};
	in.imbue(std::locale::classic());
	in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
	if (in.fail()) return std::nullopt;
	const auto seconds = timegm(&tm);
	if (seconds == static_cast<std::time_t>(-1)) return std::nullopt;
	return std::chrono::system_clock::from_time_t(seconds);
}

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

// PathElement wrapper to handle both string keys and integer indices
// Supports implicit conversion from const char*, std::string, and int
class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(const std::string &key)
		: m_is_index(false), m_key(key), m_index(0) {}
	PathElement(int index) : m_is_index(true), m_index(index) {}

	[[nodiscard]] bool is_index() const { return m_is_index; }
	[[nodiscard]] const std::string &key() const { return m_key; }
	[[nodiscard]] int index() const { return m_index; }

   private:
	bool m_is_index;
	std::string m_key;
	int m_index;
};

namespace detail {

inline const nlohmann::json *step(const nlohmann::json *j,
								  const PathElement &elem) {
	if (!j) return nullptr;

	if (!elem.is_index()) {
		const auto &key = elem.key();
		if (j->is_object() && j->contains(key)) { return &(*j)[key]; }
	} else {
		int idx = elem.index();
		if (j->is_array()) {
			if (idx < 0) { idx = static_cast<int>(j->size()) + idx; }
			if (idx >= 0 && static_cast<size_t>(idx) < j->size()) {
				return &(*j)[static_cast<size_t>(idx)];
			}
		}
	}
	return nullptr;
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, const std::initializer_list<PathElement> &path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

}  // namespace detail

/// Traverse a JSON object using a path of keys/indices.
/// Returns std::nullopt if the path doesn't exist or the value has another
/// type.
///
/// Usage:
///   auto url = traverse_obj<std::string>(json, {"url"});
///   auto first = traverse_obj<std::string>(json, {"sources", 0, "src"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

}  // namespace scenedl::utils
