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
#include "MDStylerImpl.h"
#include "md_styler/StyleConfig.h"

#include "tao/pegtl.hpp"

namespace {
	struct InlineState {
		md_styler::StyledText&                         out;
		const md_styler::TextStyle&              baseStyle;
		const md_styler::StyleConfig&               config;
		const std::optional<md_styler::BaseContext>&  base;

		std::string      pending;
		std::string_view   label;
		std::string_view    dest;
		std::string_view    math;

		void flushPlain() {
			if (!pending.empty()) {
				out.append(pending, baseStyle);
				pending.clear();
			}
		}
		std::string resolved() const {
			return base ? md_styler::resolveReference(dest, *base) : std::string{ dest };
		}
	};

	struct MathState {
		md_styler::StyledText&           out;
		const md_styler::StyleConfig& config;

		std::string    pending;
		std::string_view  base;
		std::string_view   sub;

		void flushPlain() {
			if (!pending.empty()) {
				out.append(pending, config.mathStyle());
				pending.clear();
			}
		}
		void emitSubscripted(std::string_view baseText) {
			flushPlain();
			out.append(baseText, config.mathStyle());
			out.append(sub, config.subscriptStyle());
		}
	};

	void styleMath(std::string_view body, md_styler::StyledText& out, const md_styler::StyleConfig& config);
}

namespace mdinline {
	using namespace TAO_PEGTL_NAMESPACE;

	struct link_label : star<not_one<']'>> {};
	struct link_dest : star<not_one<')'>> {};
	struct link_tail : seq< one<']'>, one<'('>, link_dest, one<')'> > {};
	struct image_ref : seq< one<'!'>, one<'['>, link_label, link_tail > {};
	struct link_ref : seq< one<'['>, link_label, link_tail > {};
	struct math_body : plus<not_one<'$'>> {};
	struct math_span : seq< one<'$'>, math_body, one<'$'> > {};
	struct plain_char : any {};
	struct inline_text : seq< star<sor<image_ref, link_ref, math_span, plain_char>>, eof > {};

	template <typename Rule>
	struct inline_action : nothing<Rule> {};

	template <>
	struct inline_action<link_label> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, InlineState& st) noexcept {
			st.label = in.string_view();
		}
	};
	template <>
	struct inline_action<link_dest> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, InlineState& st) noexcept {
			st.dest = mdsm_impl::trimBlanks(in.string_view());
		}
	};
	template <>
	struct inline_action<link_ref> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, InlineState& st) {
			st.flushPlain();
			md_styler::TextStyle style = st.baseStyle;
			style.role = md_styler::TextStyle::role_e::Link;
			style.target = st.resolved();
			st.out.append(st.label.empty() ? st.dest : st.label, style);
		}
	};
	template <>
	struct inline_action<image_ref> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, InlineState& st) {
			st.flushPlain();
			md_styler::TextStyle style = st.baseStyle;
			style.role = md_styler::TextStyle::role_e::Image;
			style.target = st.resolved();
			st.out.append(st.label.empty() ? st.dest : st.label, style);
		}
	};
	template <>
	struct inline_action<math_body> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, InlineState& st) noexcept {
			st.math = in.string_view();
		}
	};
	template <>
	struct inline_action<math_span> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, InlineState& st) {
			st.flushPlain();
			styleMath(st.math, st.out, st.config);
		}
	};
	template <>
	struct inline_action<plain_char> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, InlineState& st) {
			st.pending.append(in.begin(), in.size());
		}
	};
}

namespace mdinline {
	using namespace TAO_PEGTL_NAMESPACE;

	struct delta_sign : utf8::one<0x394> {};
	struct sub_word : plus<alnum> {};
	struct delta_sub : seq< delta_sign, sub_word > {};
	struct arg_max : string<'a', 'r', 'g', ' ', 'm', 'a', 'x'> {};
	struct arg_max_sub : seq< arg_max, one<'_'>, sub_word > {};
	struct base_word : plus<alpha> {};
	struct word_sub : seq< base_word, one<'_'>, sub_word > {};
	struct math_plain : sor< plus<alpha>, any > {};
	struct math_text : seq< star<sor<delta_sub, arg_max_sub, word_sub, math_plain>>, eof > {};

	template <typename Rule>
	struct math_action : nothing<Rule> {};

	template <>
	struct math_action<sub_word> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, MathState& st) noexcept {
			st.sub = in.string_view();
		}
	};
	template <>
	struct math_action<base_word> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, MathState& st) noexcept {
			st.base = in.string_view();
		}
	};
	template <>
	struct math_action<delta_sub> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, MathState& st) {
			st.emitSubscripted(in.string_view().substr(0, in.size() - st.sub.size()));
		}
	};
	template <>
	struct math_action<arg_max_sub> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, MathState& st) {
			st.emitSubscripted("arg max");
		}
	};
	template <>
	struct math_action<word_sub> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, MathState& st) {
			st.emitSubscripted(st.base);
		}
	};
	template <>
	struct math_action<math_plain> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, MathState& st) {
			st.pending.append(in.begin(), in.size());
		}
	};
}

namespace peggi = TAO_PEGTL_NAMESPACE;

namespace {
	void styleMath(std::string_view body, md_styler::StyledText& out, const md_styler::StyleConfig& config) {
		MathState st{ out, config, {}, {}, {} };
		mdsm_impl::line_input input{ body.data(), body.size(), "math" };
		if (peggi::parse<mdinline::math_text, mdinline::math_action>(input, st)) {
			st.flushPlain();
		}
	}
}

void mdsm_impl::styleInline(std::string_view text,
	const md_styler::TextStyle& baseStyle,
	const md_styler::StyleConfig& config,
	const std::optional<md_styler::BaseContext>& base,
	md_styler::StyledText& out)
{
	InlineState st{ out, baseStyle, config, base, {}, {}, {}, {} };
	line_input input{ text.data(), text.size(), "inline" };
	if (peggi::parse<mdinline::inline_text, mdinline::inline_action>(input, st)) {
		st.flushPlain();
	}
}
