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


#include "md_styler/MDStyler.h"
#include <istream>
#include <vector>
#include <string_view>
#include <optional>
#include "MDStylerImpl.h"
#include "Log.h"

namespace md_styler {
	namespace impl {
		struct Context {
			using mem_input = mdsm_impl::line_input;

			enum class open_e : uint8_t {
				None,
				Paragraph,
				UnorderedList,
				OrderedList,
				Fence
			};

			Document                 doc;
			open_e                  open;
			std::vector<std::string> lines;
			std::string         language;
			std::optional<mem_input> inp_;
			bool           parseInMemory;
		};
	}
}

namespace md = md_styler;
namespace mds_ctx = md_styler::impl;

namespace {
	std::string joinLines(const std::vector<std::string>& lines, const char separator) {
		std::string res{};
		for (size_t i = 0; i < lines.size(); ++i) {
			if (i != 0) {
				res.push_back(separator);
			}
			res.append(lines[i]);
		}
		return res;
	}

	void flushAccumulator(mds_ctx::Context& cotx) {
		using open_e = mds_ctx::Context::open_e;
		switch (cotx.open) {
		case open_e::None:
			break;
		case open_e::Paragraph:
		{
			std::string text{ mdsm_impl::trimBlanks(joinLines(cotx.lines, ' ')) };
			if (!text.empty()) {
				cotx.doc.emplace_back(md::Paragraph{ std::move(text) });
			}
		}
		break;
		case open_e::UnorderedList:
			if (!cotx.lines.empty()) {
				cotx.doc.emplace_back(md::UnorderedList{ std::move(cotx.lines) });
			}
			break;
		case open_e::OrderedList:
			if (!cotx.lines.empty()) {
				cotx.doc.emplace_back(md::OrderedList{ std::move(cotx.lines) });
			}
			break;
		case open_e::Fence:
			cotx.doc.emplace_back(md::CodeBlock{ std::move(cotx.language), joinLines(cotx.lines, '\n') });
			break;
		}
		cotx.lines.clear();
		cotx.language.clear();
		cotx.open = open_e::None;
	}

	std::string_view stripCarriageReturn(std::string_view line) noexcept {
		if (!line.empty() and line.back() == '\r') {
			line.remove_suffix(1);
		}
		return line;
	}
}

md::Parser::Parser(md::Parser&& o) noexcept : currLine_{ std::move(o.currLine_) },
ctx_{ o.ctx_ }
{
	o.ctx_ = nullptr;
}

md::Parser::Parser(const char* begin, const char* end) :
	ctx_{ new impl::Context{ {}, impl::Context::open_e::None, {}, {}, std::optional<impl::Context::mem_input>{std::in_place, begin, end, "markdown"}, true } }
{
}

md::Parser::Parser() : currLine_{},
ctx_{ new impl::Context{ {}, impl::Context::open_e::None, {}, {}, std::nullopt, false } }
{
}

md::Parser::~Parser() { delete ctx_; }

void md::Parser::classifyLine(std::string_view line) {
	using open_e = impl::Context::open_e;
	auto& cotx = *ctx_;
	line = stripCarriageReturn(line);

	if (auto info = mdsm_impl::tryCodeFence(line)) {
		if (cotx.open == open_e::Fence) {
			flushAccumulator(cotx);
		}
		else {
			flushAccumulator(cotx);
			cotx.open = open_e::Fence;
			cotx.language.assign(info->data(), info->size());
		}
		return;
	}
	// fence content is never reclassified
	if (cotx.open == open_e::Fence) {
		cotx.lines.emplace_back(line);
		return;
	}
	if (mdsm_impl::isBlankLine(line)) {
		flushAccumulator(cotx);
		return;
	}
	if (auto heading = mdsm_impl::tryATXHeading(line)) {
		flushAccumulator(cotx);
		cotx.doc.emplace_back(md::Heading{ heading->lvl, std::string{ heading->text } });
		return;
	}
	if (auto item = mdsm_impl::tryListItem(line)) {
		const open_e kind = ListInfo::isOrdered(item->symbol) ? open_e::OrderedList : open_e::UnorderedList;
		if (cotx.open != kind) {
			flushAccumulator(cotx);
			cotx.open = kind;
		}
		cotx.lines.emplace_back(item->text);
		return;
	}
	if (cotx.open != open_e::Paragraph) {
		flushAccumulator(cotx);
		cotx.open = open_e::Paragraph;
	}
	cotx.lines.emplace_back(mdsm_impl::trimBlanks(line));
}

bool md::Parser::processLine(std::istream& in) {
	if (ctx_ == nullptr) {
		return false;
	}
	bool res{};
	if (std::getline(in, currLine_)) {
		classifyLine(currLine_);
		res = true;
	}
	return res;
}

bool md::Parser::processLine(const char* data, const size_t len) {
	if (ctx_ == nullptr or data == nullptr) {
		return false;
	}
	mdsm_impl::line_input chunk{ data, len, "chunk" };
	bool res{};
	while (auto line = mdsm_impl::nextLine(chunk)) {
		classifyLine(*line);
		res = true;
	}
	return res;
}

bool md::Parser::processLine() {
	if (ctx_ == nullptr or not ctx_->parseInMemory or not ctx_->inp_) {
		return false;
	}
	if (auto line = mdsm_impl::nextLine(*ctx_->inp_)) {
		classifyLine(*line);
		return true;
	}
	return false;
}

void md::Parser::finalizeDocument() {
	if (ctx_ == nullptr) {
		return;
	}
	if (ctx_->open == impl::Context::open_e::Fence) {
		mdsm_impl::log()->debug("closing unterminated code fence after {} line(s)", ctx_->lines.size());
	}
	flushAccumulator(*ctx_);
}

auto md::Parser::document() const noexcept -> const Document& {
	static const Document empty{};
	return ctx_ ? ctx_->doc : empty;
}

auto md::Parser::releaseDocument() noexcept -> Document {
	if (ctx_ == nullptr) {
		return {};
	}
	return std::move(ctx_->doc);
}

auto md::parse(std::string_view source) -> Document {
	md::Parser parser{ source.data(), source.data() + source.size() };
	bool success = true;
	while (success) {
		success = parser.processLine();
	}
	parser.finalizeDocument();
	return parser.releaseDocument();
}

const char* md::flavorName(const type_e flavor) noexcept {
	switch (flavor) {
	case type_e::Heading: return "heading";
	case type_e::Paragraph: return "paragraph";
	case type_e::UnorderedList: return "unordered_list";
	case type_e::OrderedList: return "ordered_list";
	case type_e::CodeBlock: return "code_block";
	}
	return "unknown";
}
