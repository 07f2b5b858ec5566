/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/


#include <string>
#include <string_view>
#include "md_styler/Rendering.h"

namespace {
	struct UriParts {
		std::string_view scheme;
		bool      hasAuthority = false;
		std::string_view authority;
		std::string_view path;
		bool          hasQuery = false;
		std::string_view query;
		bool       hasFragment = false;
		std::string_view fragment;
	};

	bool isSchemeChar(const char c, const bool first) noexcept {
		const bool alpha = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z');
		if (first) {
			return alpha;
		}
		return alpha or (c >= '0' and c <= '9') or c == '+' or c == '-' or c == '.';
	}

	UriParts splitUri(std::string_view ref) noexcept {
		UriParts parts{};

		if (auto hashPos = ref.find('#'); hashPos != std::string_view::npos) {
			parts.hasFragment = true;
			parts.fragment = ref.substr(hashPos + 1);
			ref = ref.substr(0, hashPos);
		}
		if (auto qPos = ref.find('?'); qPos != std::string_view::npos) {
			parts.hasQuery = true;
			parts.query = ref.substr(qPos + 1);
			ref = ref.substr(0, qPos);
		}

		const size_t colon = ref.find(':');
		if (colon != std::string_view::npos and colon > 0 and colon < ref.find('/')) {
			bool valid = true;
			for (size_t i = 0; i < colon and valid; ++i) {
				valid = isSchemeChar(ref[i], i == 0);
			}
			if (valid) {
				parts.scheme = ref.substr(0, colon);
				ref = ref.substr(colon + 1);
			}
		}

		if (ref.substr(0, 2) == "//") {
			ref.remove_prefix(2);
			const size_t slash = ref.find('/');
			parts.hasAuthority = true;
			parts.authority = ref.substr(0, slash);
			ref = slash == std::string_view::npos ? std::string_view{} : ref.substr(slash);
		}
		parts.path = ref;
		return parts;
	}

	std::string removeDotSegments(std::string_view input) {
		std::string output{};
		while (!input.empty()) {
			if (input.substr(0, 3) == "../") {
				input.remove_prefix(3);
			}
			else if (input.substr(0, 2) == "./") {
				input.remove_prefix(2);
			}
			else if (input.substr(0, 3) == "/./") {
				input.remove_prefix(2);
			}
			else if (input == "/.") {
				input = "/";
			}
			else if (input.substr(0, 4) == "/../" or input == "/..") {
				input = input.size() == 3 ? std::string_view{ "/" } : input.substr(3);
				const size_t lastSlash = output.rfind('/');
				output.erase(lastSlash == std::string::npos ? 0 : lastSlash);
			}
			else if (input == "." or input == "..") {
				input = {};
			}
			else {
				const size_t next = input.find('/', 1);
				const size_t segLen = next == std::string_view::npos ? input.size() : next;
				output.append(input.data(), segLen);
				input.remove_prefix(segLen);
			}
		}
		return output;
	}

	std::string mergePaths(const UriParts& base, std::string_view relative) {
		if (base.hasAuthority and base.path.empty()) {
			return "/" + std::string{ relative };
		}
		const size_t lastSlash = base.path.rfind('/');
		if (lastSlash == std::string_view::npos) {
			return std::string{ relative };
		}
		return std::string{ base.path.substr(0, lastSlash + 1) } + std::string{ relative };
	}

	std::string recompose(std::string_view scheme, const bool hasAuthority, std::string_view authority,
		std::string_view path, const bool hasQuery, std::string_view query, const bool hasFragment, std::string_view fragment)
	{
		std::string result{};
		if (!scheme.empty()) {
			result.append(scheme.data(), scheme.size()).push_back(':');
		}
		if (hasAuthority) {
			result.append("//").append(authority.data(), authority.size());
		}
		result.append(path.data(), path.size());
		if (hasQuery) {
			result.append("?").append(query.data(), query.size());
		}
		if (hasFragment) {
			result.append("#").append(fragment.data(), fragment.size());
		}
		return result;
	}
}

auto md_styler::resolveReference(std::string_view ref, const BaseContext& base) -> std::string {
	if (base.base.empty()) {
		return std::string{ ref };
	}
	const UriParts r = splitUri(ref);
	if (!r.scheme.empty()) {
		return std::string{ ref };
	}
	const UriParts b = splitUri(base.base);

	if (r.hasAuthority) {
		const std::string path = removeDotSegments(r.path);
		return recompose(b.scheme, true, r.authority, path, r.hasQuery, r.query, r.hasFragment, r.fragment);
	}
	if (r.path.empty()) {
		// fragment or query only
		const bool hasQuery = r.hasQuery or b.hasQuery;
		const std::string_view query = r.hasQuery ? r.query : b.query;
		return recompose(b.scheme, b.hasAuthority, b.authority, b.path, hasQuery, query, r.hasFragment, r.fragment);
	}

	std::string path{};
	if (r.path.front() == '/') {
		path = removeDotSegments(r.path);
	}
	else {
		path = removeDotSegments(mergePaths(b, r.path));
	}
	return recompose(b.scheme, b.hasAuthority, b.authority, path, r.hasQuery, r.query, r.hasFragment, r.fragment);
}
