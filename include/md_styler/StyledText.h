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


#ifndef MDS_STYLED_TEXT_H
#define MDS_STYLED_TEXT_H
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include "BlockInfoTags.h"
#include "mdstyler_export.h"

namespace md_styler {
	struct TextStyle {
		enum class role_e : uint8_t {
			Body,
			Heading,
			ListMarker,
			Code,
			Link,
			Image,
			Math,
			Subscript
		};
		role_e           role = role_e::Body;
		std::string    family;
		float       pointSize = 0.0f;
		bool             bold = false;
		bool        monospace = false;
		float  baselineOffset = 0.0f;
		UTinyInt headingLevel = 0;
		std::string    target;
	};

	MDSTYLER_EXPORT bool operator==(const TextStyle& a, const TextStyle& b) noexcept;
	inline bool operator!=(const TextStyle& a, const TextStyle& b) noexcept { return !(a == b); }

	// Byte range into the plain text.
	struct StyleRun {
		size_t  begin;
		size_t length;
		TextStyle style;
	};

	class StyledText {
	public:
		StyledText() = default;
		MDSTYLER_EXPORT explicit StyledText(std::string plain);

		MDSTYLER_EXPORT void append(std::string_view text, const TextStyle& style);
		MDSTYLER_EXPORT void appendPlain(std::string_view text);

		const std::string& plainText() const noexcept { return text_; }
		size_t length() const noexcept { return text_.size(); }
		bool empty() const noexcept { return text_.empty(); }
		bool isStyled() const noexcept { return !runs_.empty(); }

		const std::vector<StyleRun>& runs() const noexcept { return runs_; }
		MDSTYLER_EXPORT std::string_view textOf(const StyleRun& run) const noexcept;
		MDSTYLER_EXPORT const StyleRun* runAt(size_t pos) const noexcept;

		MDSTYLER_EXPORT bool contains(std::string_view needle) const noexcept;
	private:
		std::string           text_;
		std::vector<StyleRun> runs_;
	};

	// Control characters in the text are written in caret notation (^[ for ESC) in both modes.
	MDSTYLER_EXPORT bool ansiExport(const StyledText& text, std::ostream& out, bool colorsEnabled = true);
}

#endif
