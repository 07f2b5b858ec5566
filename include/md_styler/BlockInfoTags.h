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


#ifndef MDS_BLOCK_INFO_TAGS_H
#define MDS_BLOCK_INFO_TAGS_H
#include <cstdint>
#include <string>
#include <vector>

namespace md_styler {
	using UTinyInt = uint8_t;
	using UInt = uint32_t;

	struct ListInfo {
		enum class symbol_e : uint8_t {
			dash = '-',
			plus = '+',
			star = '*',
			dot = '.',
			paranth = ')'
		};
		static constexpr bool isOrdered(symbol_e s) noexcept {
			return s == symbol_e::dot or s == symbol_e::paranth;
		}
	};

	struct Heading {
		UTinyInt     lvl;
		std::string text;
	};

	struct Paragraph {
		std::string text;
	};

	struct UnorderedList {
		std::vector<std::string> items;
	};

	// Ordinals are dropped; position decides the number shown.
	struct OrderedList {
		std::vector<std::string> items;
	};

	struct CodeBlock {
		std::string language;
		std::string     code;
	};

	inline bool operator==(const Heading& a, const Heading& b) { return a.lvl == b.lvl and a.text == b.text; }
	inline bool operator==(const Paragraph& a, const Paragraph& b) { return a.text == b.text; }
	inline bool operator==(const UnorderedList& a, const UnorderedList& b) { return a.items == b.items; }
	inline bool operator==(const OrderedList& a, const OrderedList& b) { return a.items == b.items; }
	inline bool operator==(const CodeBlock& a, const CodeBlock& b) { return a.language == b.language and a.code == b.code; }

	inline bool operator!=(const Heading& a, const Heading& b) { return !(a == b); }
	inline bool operator!=(const Paragraph& a, const Paragraph& b) { return !(a == b); }
	inline bool operator!=(const UnorderedList& a, const UnorderedList& b) { return !(a == b); }
	inline bool operator!=(const OrderedList& a, const OrderedList& b) { return !(a == b); }
	inline bool operator!=(const CodeBlock& a, const CodeBlock& b) { return !(a == b); }
}

#endif
