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


#ifndef MDS_STYLE_CONFIG_H
#define MDS_STYLE_CONFIG_H
#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include "StyledText.h"
#include "mdstyler_export.h"

namespace md_styler {
	struct FontSpec {
		std::string family;
		float         size;
		bool          bold;
	};

	struct StyleConfig {
		FontSpec                  body;
		std::array<FontSpec, 6> headings;
		FontSpec                  code;
		float           subscriptScale;
		float  subscriptBaselineOffset;
		std::string         bulletMarker;

		MDSTYLER_EXPORT static StyleConfig defaults();

		MDSTYLER_EXPORT TextStyle bodyStyle() const;
		MDSTYLER_EXPORT TextStyle headingStyle(UTinyInt level) const;
		MDSTYLER_EXPORT TextStyle markerStyle() const;
		MDSTYLER_EXPORT TextStyle codeStyle() const;
		MDSTYLER_EXPORT TextStyle mathStyle() const;
		MDSTYLER_EXPORT TextStyle subscriptStyle() const;
	};

	/**
	Reads a JSON object of overrides on top of StyleConfig::defaults(). Missing keys keep their
	default; malformed JSON or a mistyped key gives nullopt.
	*/
	MDSTYLER_EXPORT auto loadStyleConfig(std::istream& in) -> std::optional<StyleConfig>;
}

#endif
