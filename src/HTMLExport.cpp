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
#include <string>
#include <string_view>
#include <ostream>
#include <sstream>
#if defined(__INTELLISENSE__) && defined(__clang__)
#include<ciso646>
#endif

auto md_styler::mdToHtml(std::string_view str) -> std::string {
	md_styler::Parser parser{ str.data(), str.data() + str.size() };
	bool success = true;
	while (success) {
		success = parser.processLine();
	}
	parser.finalizeDocument();
	std::ostringstream sout{};
	htmlExport(parser, sout);
	return sout.str();
}
auto md_styler::mdToHtml(std::istream& in) -> std::string {
	md_styler::Parser parser{};
	bool success = true;
	while (success) {
		success = parser.processLine(in);
	}
	parser.finalizeDocument();
	std::ostringstream sout{};
	htmlExport(parser, sout);
	return sout.str();
}

namespace {
	bool printBlock(const md_styler::MDSNode& block, std::ostream& out);

	void printTag(const char* name, bool prependNewline, bool useNewline, std::ostream& out);
	void printListTag(bool isBeginTag, bool ordered, std::ostream& out);
	void printCodeTag(bool isBeginTag, std::string_view language, std::ostream& out, bool postNl);
	void printItems(const std::vector<std::string>& items, bool ordered, std::ostream& out);
	void printEscaped(std::string_view text, std::ostream& out);
}

bool md_styler::htmlExport(const Document& doc, std::ostream& out) {
	bool success{ true };
	for (auto it = doc.begin(); it != doc.end() and success; ++it) {
		success = printBlock(*it, out);
	}
	return success;
}

bool md_styler::htmlExport(const md_styler::Parser& p, std::ostream& out) {
	return htmlExport(p.document(), out);
}

namespace {
	bool printBlock(const md_styler::MDSNode& block, std::ostream& out) {
		using md_styler::type_e;
		char headingTag[] = "h0";
		char headingEndTag[] = "/h0";
		switch (md_styler::flavorOf(block)) {
		case type_e::Heading:
		{
			const auto& heading = std::get<md_styler::Heading>(block);
			headingTag[(sizeof(headingTag) / sizeof(char)) - 2] += heading.lvl;
			headingEndTag[(sizeof(headingEndTag) / sizeof(char)) - 2] += heading.lvl;
			printTag(headingTag, false, false, out);
			printEscaped(heading.text, out);
			printTag(headingEndTag, false, true, out);
		}
		break;
		case type_e::Paragraph:
			printTag("p", false, false, out);
			printEscaped(std::get<md_styler::Paragraph>(block).text, out);
			printTag("/p", false, true, out);
			break;
		case type_e::UnorderedList:
			printItems(std::get<md_styler::UnorderedList>(block).items, false, out);
			break;
		case type_e::OrderedList:
			printItems(std::get<md_styler::OrderedList>(block).items, true, out);
			break;
		case type_e::CodeBlock:
		{
			const auto& code = std::get<md_styler::CodeBlock>(block);
			printCodeTag(true, code.language, out, false);
			printEscaped(code.code, out);
			if (!code.code.empty()) {
				out << '\n';
			}
			printCodeTag(false, code.language, out, true);
		}
		break;
		}
		return not out.fail();
	}

	void printItems(const std::vector<std::string>& items, const bool ordered, std::ostream& out) {
		printListTag(true, ordered, out);
		for (const auto& item : items) {
			printTag("li", false, false, out);
			printEscaped(item, out);
			printTag("/li", false, true, out);
		}
		printListTag(false, ordered, out);
	}

	void printTag(const char* name, const bool prependNewline, const bool useNewline, std::ostream& out) {
		const char* beginning = prependNewline ? "\n<" : "<";
		const char* ending = useNewline ? ">\n" : ">";
		out << beginning << name << ending;
	}

	void printListTag(const bool isBeginTag, const bool ordered, std::ostream& out) {
		const char* tagType = ordered ? "ol" : "ul";
		out << (isBeginTag ? "<" : "</") << tagType << ">\n";
	}

	void printCodeTag(bool isBeginTag, std::string_view language, std::ostream& out, const bool postNl) {
		using namespace std::string_literals;
		const std::string beginFragmentOpener = "<pre><code";
		const std::string fragmentCloser = "</code></pre>";

		const std::string appendant = postNl ? "\n"s : ""s;

		std::string optInfo{};
		if (!language.empty()) {
			std::ostringstream escaped{};
			printEscaped(language.substr(0, language.find_first_of(" \t")), escaped);
			optInfo = " class=\"language-"s + escaped.str() + "\""s;
		}

		out << (isBeginTag ? beginFragmentOpener + optInfo + ">"s : fragmentCloser) + appendant;
	}

	void printEscaped(std::string_view text, std::ostream& out) {
		size_t start = 0;
		for (size_t i = 0; i < text.size(); ++i) {
			const char* entity = nullptr;
			switch (text[i]) {
			case '&': entity = "&amp;"; break;
			case '<': entity = "&lt;"; break;
			case '>': entity = "&gt;"; break;
			case '"': entity = "&quot;"; break;
			default: break;
			}
			if (entity) {
				out << text.substr(start, i - start) << entity;
				start = i + 1;
			}
		}
		out << text.substr(start);
	}
}
