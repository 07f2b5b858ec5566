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
#include <cstdint>
#include "MDStylerImpl.h"

#include "tao/pegtl.hpp"

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : one<' ', '\t'> {};
	struct whitespaces : star<whitespace0> {};
	struct rest_of_line : star<any> {};

	struct line_content : star<not_one<'\n'>> {};
	struct source_line : seq<line_content, opt<one<'\n'>>> {};

	template <typename Rule>
	struct line_action : nothing<Rule> {};

	template <>
	struct line_action<line_content> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, std::string_view& line) noexcept {
			line = in.string_view();
		}
	};
}

auto mdsm_impl::nextLine(line_input& input) noexcept -> std::optional<std::string_view> {
	if (input.empty()) {
		return std::nullopt;
	}
	std::string_view line{};
	if (not peggi::parse<mdlang::source_line, mdlang::line_action>(input, line)) {
		return std::nullopt;
	}
	return line;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct fence_marker : string<'`', '`', '`'> {};
	struct fence_info : rest_of_line {};
	struct code_fence : seq<fence_marker, fence_info> {};

	template <typename Rule>
	struct fenced_code_action : nothing<Rule> {};

	template <>
	struct fenced_code_action<fence_info> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, std::string_view& info) noexcept {
			info = mdsm_impl::trimBlanks(in.string_view());
		}
	};
}

auto mdsm_impl::tryCodeFence(std::string_view line) noexcept -> std::optional<std::string_view> {
	line_input input{ line.data(), line.size(), "line" };
	std::string_view info{};
	if (peggi::parse<mdlang::code_fence, mdlang::fenced_code_action>(input, info)) {
		return info;
	}
	return std::nullopt;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct atx_grammar_prefix : rep_min_max<1, 6, one<'#'>> {};
	struct atx_text : rest_of_line {};
	struct atx_line : seq< atx_grammar_prefix, sor<plus<whitespace0>, eof>, atx_text > {};

	template <typename Rule>
	struct atx_header_action : nothing<Rule> {};

	template <>
	struct atx_header_action<atx_grammar_prefix> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, md_styler::UTinyInt& lvl, std::string_view&) noexcept {
			lvl = static_cast<md_styler::UTinyInt>(in.size());
		}
	};
	template <>
	struct atx_header_action<atx_text> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, md_styler::UTinyInt&, std::string_view& text) noexcept {
			text = in.string_view();
		}
	};
}

auto mdsm_impl::tryATXHeading(std::string_view line) noexcept -> std::optional<HeadingMatch> {
	line_input input{ line.data(), line.size(), "line" };
	md_styler::UTinyInt level = 0;
	std::string_view text{};
	if (not peggi::parse<mdlang::atx_line, mdlang::atx_header_action>(input, level, text)) {
		return std::nullopt;
	}
	return HeadingMatch{ level, stripClosingSequence(trimBlanks(text)) };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct ul_marker : one<'-', '*', '+'> {};
	struct ol_marker : one<'.', ')'> {};
	struct natural_number : rep_min_max<1, 9, digit> {};
	struct item_text : rest_of_line {};
	struct list_marker : sor< seq<natural_number, ol_marker>, ul_marker > {};
	struct list_item_line : seq< whitespaces, list_marker, plus<whitespace0>, item_text > {};

	template <typename Rule>
	struct list_item_action : nothing<Rule> {};

	template <>
	struct list_item_action<ul_marker> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, md_styler::ListInfo::symbol_e& symbol, std::string_view&) noexcept {
			symbol = static_cast<md_styler::ListInfo::symbol_e>(in.begin()[0]);
		}
	};
	template <>
	struct list_item_action<ol_marker> : list_item_action<ul_marker> {};

	template <>
	struct list_item_action<item_text> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, md_styler::ListInfo::symbol_e&, std::string_view& text) noexcept {
			text = in.string_view();
		}
	};
}

auto mdsm_impl::tryListItem(std::string_view line) noexcept -> std::optional<ListItemMatch> {
	line_input input{ line.data(), line.size(), "line" };
	ListItemMatch item{ md_styler::ListInfo::symbol_e::dash, {} };
	if (not peggi::parse<mdlang::list_item_line, mdlang::list_item_action>(input, item.symbol, item.text)) {
		return std::nullopt;
	}
	item.text = trimBlanks(item.text);
	return item;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct blank_line : seq<whitespaces, eof> {};
}

bool mdsm_impl::isBlankLine(std::string_view line) noexcept {
	line_input input{ line.data(), line.size(), "line" };
	return peggi::parse<mdlang::blank_line>(input);
}

auto mdsm_impl::trimBlanks(std::string_view str) noexcept -> std::string_view {
	constexpr std::string_view blanks = " \t";
	const size_t first = str.find_first_not_of(blanks);
	if (first == std::string_view::npos) {
		return {};
	}
	const size_t last = str.find_last_not_of(blanks);
	return str.substr(first, last - first + 1);
}

auto mdsm_impl::stripClosingSequence(std::string_view text) noexcept -> std::string_view {
	const size_t last = text.find_last_not_of('#');
	if (last == std::string_view::npos) {
		return {};
	}
	if (last + 1 == text.size()) {
		return text;
	}
	// "# C#" keeps its hash; only a run set off by whitespace closes the heading
	if (text[last] == ' ' or text[last] == '\t') {
		return trimBlanks(text.substr(0, last));
	}
	return text;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct text_char : sor< one<'\t', '\n', '\r'>, utf8::range<0x20, 0x7E>, utf8::range<0xA0, 0x10FFFF> > {};
	struct source_text : seq< star<text_char>, must<eof> > {};
}

void mdsm_impl::validateSource(std::string_view source) {
	line_input input{ source.data(), source.size(), "markdown" };
	peggi::parse<mdlang::source_text>(input);
}
