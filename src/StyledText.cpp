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


#include "md_styler/StyledText.h"
#include <algorithm>

namespace md = md_styler;

bool md::operator==(const TextStyle& a, const TextStyle& b) noexcept {
	return a.role == b.role and
		a.family == b.family and
		a.pointSize == b.pointSize and
		a.bold == b.bold and
		a.monospace == b.monospace and
		a.baselineOffset == b.baselineOffset and
		a.headingLevel == b.headingLevel and
		a.target == b.target;
}

md::StyledText::StyledText(std::string plain) : text_{ std::move(plain) }, runs_{} {}

void md::StyledText::append(std::string_view text, const TextStyle& style) {
	if (text.empty()) {
		return;
	}
	const size_t pos = text_.size();
	text_.append(text.data(), text.size());
	// a run continuing the previous one with the same attributes is merged into it
	if (!runs_.empty() and runs_.back().begin + runs_.back().length == pos and runs_.back().style == style) {
		runs_.back().length += text.size();
		return;
	}
	runs_.push_back({ pos, text.size(), style });
}

void md::StyledText::appendPlain(std::string_view text) {
	text_.append(text.data(), text.size());
}

std::string_view md::StyledText::textOf(const StyleRun& run) const noexcept {
	if (run.begin >= text_.size()) {
		return {};
	}
	return std::string_view{ text_ }.substr(run.begin, run.length);
}

const md::StyleRun* md::StyledText::runAt(const size_t pos) const noexcept {
	auto it = std::upper_bound(runs_.begin(), runs_.end(), pos, [](const size_t p, const StyleRun& run) { return p < run.begin; });
	if (it == runs_.begin()) {
		return nullptr;
	}
	--it;
	return pos < it->begin + it->length ? &*it : nullptr;
}

bool md::StyledText::contains(std::string_view needle) const noexcept {
	return std::string_view{ text_ }.find(needle) != std::string_view::npos;
}
