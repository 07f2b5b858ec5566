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


// MDStyler.h : block parser and document model
#ifndef MD_STYLER_H
#define MD_STYLER_H
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include "BlockInfoTags.h"
#include "mdstyler_export.h"

namespace md_styler {
	using MDSNode = std::variant<Heading, Paragraph, UnorderedList, OrderedList, CodeBlock>;
	using Document = std::vector<MDSNode>;

	enum class type_e : uint8_t {
		Heading,
		Paragraph,
		UnorderedList,
		OrderedList,
		CodeBlock
	};

	inline type_e flavorOf(const MDSNode& node) noexcept {
		return static_cast<type_e>(node.index());
	}
	MDSTYLER_EXPORT const char* flavorName(type_e flavor) noexcept;

	namespace impl {
		struct Context;
	}

	class Parser {
	public:
		Parser(const Parser&) = delete;
		// A moved-from parser is inert: processLine returns false and document() is empty.
		MDSTYLER_EXPORT Parser(Parser&& o) noexcept;

		MDSTYLER_EXPORT Parser();
		MDSTYLER_EXPORT Parser(const char* begin, const char* end);
		MDSTYLER_EXPORT virtual ~Parser();

		MDSTYLER_EXPORT bool processLine(std::istream& in);
		MDSTYLER_EXPORT bool processLine(const char* data, const size_t len);
		MDSTYLER_EXPORT bool processLine();

		MDSTYLER_EXPORT void finalizeDocument();

		MDSTYLER_EXPORT const Document& document() const noexcept;
		MDSTYLER_EXPORT Document releaseDocument() noexcept;

		Document::const_iterator begin() const noexcept { return document().begin(); }
		Document::const_iterator end() const noexcept { return document().end(); }
	private:
		void classifyLine(std::string_view line);

		std::string   currLine_;
		impl::Context*    ctx_;
	};

	/**
	Single pass over the whole of source. Total: every input yields a (possibly empty) document;
	an unterminated fence is closed at end of input.
	*/
	MDSTYLER_EXPORT auto parse(std::string_view source) -> Document;

	MDSTYLER_EXPORT auto mdToHtml(std::string_view str) -> std::string;
	MDSTYLER_EXPORT auto mdToHtml(std::istream& in) -> std::string;
	MDSTYLER_EXPORT bool htmlExport(const Document& doc, std::ostream& out);
	MDSTYLER_EXPORT bool htmlExport(const Parser& p, std::ostream& out);
}

#endif
