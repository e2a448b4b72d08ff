#include "acp/common.hpp"
#include <glib.h>
#include <algorithm>
#include <cctype>


namespace acp {

std::string to_lower(std::string s) {
	for (auto& c : s) c = (char)std::tolower((unsigned char)c);
	return s;
}


bool uuid_equals(const std::string& a, const std::string& b) {
	return to_lower(a) == to_lower(b);
}


bool is_canonical_uuid(const std::string& s) {
	if (s.size() != 36) return false;
	for (size_t i = 0; i < s.size(); ++i) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (s[i] != '-') return false;
		}
		else if (!std::isxdigit((unsigned char)s[i])) {
			return false;
		}
	}
	return true;
}


std::string base64_encode(const bytes& data) {
	gchar* enc = g_base64_encode(data.data(), data.size());
	std::string out = enc ? enc : "";
	g_free(enc);
	return out;
}


bool base64_decode(const std::string& text, bytes& out) {
	out.clear();
	if (text.empty()) return true;
	if (text.size() % 4 != 0) return false;
	size_t pad = 0;
	for (size_t i = 0; i < text.size(); ++i) {
		char c = text[i];
		if (c == '=') {
			// 패딩은 끝의 최대 2자만
			if (i < text.size() - 2) return false;
			++pad;
			continue;
		}
		if (pad) return false;
		if (!(std::isalnum((unsigned char)c) || c == '+' || c == '/')) return false;
	}

	gsize n = 0;
	guchar* dec = g_base64_decode(text.c_str(), &n);
	if (!dec) return false;
	out.assign(dec, dec + n);
	g_free(dec);
	return true;
}


int64_t epoch_ms() {
	return (int64_t)(g_get_real_time() / 1000);
}

} // namespace acp
