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


#include <array>
#include <fstream>
#include <iterator>
#include <system_error>
#include "md_styler/HelpResource.h"
#include "Log.h"

namespace fs = std::filesystem;

namespace {
	constexpr std::array<const char*, 4> HELP_SUBDIRS = { "docs", "Doc", "Documentation", "Resources" };

	auto readWhole(const fs::path& file) -> std::optional<std::string> {
		std::error_code ec{};
		if (!fs::is_regular_file(file, ec)) {
			return std::nullopt;
		}
		std::ifstream in{ file, std::ios::binary };
		if (!in) {
			mdsm_impl::log()->debug("cannot open {}", file.string());
			return std::nullopt;
		}
		std::string text{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
		if (in.bad()) {
			mdsm_impl::log()->debug("read error on {}", file.string());
			return std::nullopt;
		}
		return text;
	}
}

auto md_styler::loadHelpMarkdown(const fs::path& bundleRoot, std::string_view name) -> std::optional<std::string> {
	const fs::path fileName{ std::string{ name } };
	if (auto text = readWhole(bundleRoot / fileName)) {
		return text;
	}
	for (const char* sub : HELP_SUBDIRS) {
		if (auto text = readWhole(bundleRoot / sub / fileName)) {
			return text;
		}
	}
	mdsm_impl::log()->debug("{} not found under {}", name, bundleRoot.string());
	return std::nullopt;
}

auto md_styler::helpMarkdownOrPlaceholder(const fs::path& bundleRoot, std::string_view title) -> std::string {
	if (auto text = loadHelpMarkdown(bundleRoot)) {
		return *text;
	}
	return "# " + std::string{ title } + " Help\n\nHELP.md not bundled.";
}
