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
#include <ostream>
#include <string>
#include <string_view>

namespace {
	struct SgrStyle {
		bool bold;
		bool  dim;
		bool under;
		int colour;
	};

	SgrStyle sgrFor(const md_styler::TextStyle& style) noexcept {
		using role_e = md_styler::TextStyle::role_e;
		SgrStyle sgr{ style.bold, false, false, 0 };
		switch (style.role) {
		case role_e::Body:
			break;
		case role_e::Heading:
			sgr.bold = true;
			sgr.colour = style.headingLevel <= 2 ? 36 : 0;
			break;
		case role_e::ListMarker:
			sgr.dim = true;
			break;
		case role_e::Code:
			sgr.colour = 33;
			break;
		case role_e::Link:
		case role_e::Image:
			sgr.under = true;
			sgr.colour = 34;
			break;
		case role_e::Math:
			sgr.colour = 35;
			break;
		case role_e::Subscript:
			sgr.dim = true;
			sgr.colour = 35;
			break;
		}
		return sgr;
	}

	bool putStyle(std::ostream& out, const SgrStyle& s) {
		std::string codes{};
		auto add = [&codes](const std::string& code) {
			if (!codes.empty()) {
				codes.push_back(';');
			}
			codes.append(code);
		};
		if (s.bold) add("1");
		if (s.dim) add("2");
		if (s.under) add("4");
		if (s.colour != 0) add(std::to_string(s.colour));
		if (codes.empty()) {
			return false;
		}
		out << "\033[" << codes << 'm';
		return true;
	}

	// Control characters are shown in caret notation (ESC as ^[, DEL as ^?, C1 as M-^x)
	// so run text can never inject terminal sequences. Tab, LF and CR pass through.
	void putText(std::ostream& out, std::string_view text) {
		size_t start = 0;
		auto flush = [&](size_t upto) {
			out.write(text.data() + start, static_cast<std::streamsize>(upto - start));
		};
		for (size_t i = 0; i < text.size(); ++i) {
			const auto c = static_cast<unsigned char>(text[i]);
			if (c < 0x20 and c != '\t' and c != '\n' and c != '\r') {
				flush(i);
				out << '^' << static_cast<char>(c + 0x40);
				start = i + 1;
			}
			else if (c == 0x7F) {
				flush(i);
				out << "^?";
				start = i + 1;
			}
			else if (c == 0xC2 and i + 1 < text.size()) {
				const auto next = static_cast<unsigned char>(text[i + 1]);
				if (next >= 0x80 and next <= 0x9F) {
					flush(i);
					out << "M-^" << static_cast<char>(next - 0x80 + 0x40);
					start = i + 2;
					++i;
				}
			}
		}
		flush(text.size());
	}

	void putOsc8Open(std::ostream& out, const std::string& url) {
		out << "\033]8;;";
		putText(out, url);
		out << "\033\\";
	}

	void putOsc8Close(std::ostream& out) {
		out << "\033]8;;\033\\";
	}
}

bool md_styler::ansiExport(const StyledText& text, std::ostream& out, const bool colorsEnabled) {
	const std::string& plain = text.plainText();
	if (not colorsEnabled or not text.isStyled()) {
		putText(out, plain);
		return not out.fail();
	}
	size_t cursor = 0;
	for (const auto& run : text.runs()) {
		if (run.begin > cursor) {
			putText(out, std::string_view{ plain }.substr(cursor, run.begin - cursor));
		}
		const bool linked = !run.style.target.empty();
		if (linked) {
			putOsc8Open(out, run.style.target);
		}
		const bool styled = putStyle(out, sgrFor(run.style));
		putText(out, text.textOf(run));
		if (styled) {
			out << "\033[0m";
		}
		if (linked) {
			putOsc8Close(out);
		}
		cursor = run.begin + run.length;
	}
	if (cursor < plain.size()) {
		putText(out, std::string_view{ plain }.substr(cursor));
	}
	return not out.fail();
}
