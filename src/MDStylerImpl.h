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


#ifndef MD_STYLER_IMPL_H
#define MD_STYLER_IMPL_H
#include <optional>
#include <string>
#include <string_view>
#include <tao/pegtl/memory_input.hpp>
#include "md_styler/BlockInfoTags.h"
#include "md_styler/Rendering.h"

namespace mdsm_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	using line_input = peggi::memory_input<peggi::tracking_mode::eager>;

	struct HeadingMatch {
		md_styler::UTinyInt lvl;
		std::string_view   text;
	};

	struct ListItemMatch {
		md_styler::ListInfo::symbol_e symbol;
		std::string_view                text;
	};

	// Next line of input without its line break; nullopt once the input is exhausted.
	auto nextLine(line_input& input) noexcept -> std::optional<std::string_view>;

	auto tryCodeFence(std::string_view line) noexcept -> std::optional<std::string_view>;
	auto tryATXHeading(std::string_view line) noexcept -> std::optional<HeadingMatch>;
	auto tryListItem(std::string_view line) noexcept -> std::optional<ListItemMatch>;
	bool isBlankLine(std::string_view line) noexcept;

	auto trimBlanks(std::string_view str) noexcept -> std::string_view;
	auto stripClosingSequence(std::string_view text) noexcept -> std::string_view;

	/**
	Throws peggi::parse_error at the first byte that is not well-formed UTF-8 or is a control
	character other than tab, line feed and carriage return.
	*/
	void validateSource(std::string_view source);

	// Plain text and link/image runs take baseStyle; math spans take the config's math styles.
	void styleInline(std::string_view text,
		const md_styler::TextStyle& baseStyle,
		const md_styler::StyleConfig& config,
		const std::optional<md_styler::BaseContext>& base,
		md_styler::StyledText& out);
}
#endif
